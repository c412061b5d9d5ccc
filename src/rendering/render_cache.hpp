#pragma once

/// @file render_cache.hpp
/// @brief Per-body retained geometry: orbit path, facts overlay, name label.

#include "core/types.hpp"
#include "rendering/camera.hpp"
#include "rendering/renderer.hpp"
#include "rendering/surface.hpp"
#include "scene/celestial_body.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace orrery::rendering
{
    /// @brief Number of samples along a drawn orbit. First and last coincide.
    inline constexpr std::size_t kOrbitSampleCount = 30;

    using OrbitSamples = std::array<Vec2d, kOrbitSampleCount>;

    /// @brief Sample the orbit ellipse in world space.
    ///
    /// θ_i = 2π·i/(N−1), x = a·cos θ, y = b·sin θ with b = a·√(1−e²), then
    /// offset by @p parent_position. The ellipse is centered on the parent,
    /// matching how the orbit has always been drawn.
    [[nodiscard]] OrbitSamples sample_orbit(const scene::OrbitalElements& elements,
                                            Vec2d parent_position);

    /// @brief Camera state an orbit surface was rasterized for.
    struct OrbitCacheKey
    {
        f64 zoom = 0.0;
        Vec2i viewport{0, 0};
        Vec2d pan{0.0, 0.0};
    };

    /// @brief Cached orbit polyline of one star child, in screen space.
    ///
    /// The surface stays valid while the camera moves less than the
    /// tolerances below; the parent is the fixed root star, so only camera
    /// state can move the projected ring.
    class OrbitPathCache
    {
    public:
        /// @brief True if a surface exists and was built for (nearly) this camera.
        [[nodiscard]] bool is_valid(const Camera& camera) const;

        /// @brief Rebuild the surface if is_valid() is false.
        /// @return true if a rebuild happened.
        bool validate(const scene::OrbitalElements& elements, Vec2d parent_position,
                      const Camera& camera);

        /// @brief Drop the surface. The rebuild counter is kept.
        void clear();

        [[nodiscard]] const std::optional<Surface>& surface() const { return m_surface; }
        [[nodiscard]] Rect rect() const { return m_rect; }
        [[nodiscard]] const OrbitCacheKey& key() const { return m_key; }
        [[nodiscard]] u32 rebuild_count() const { return m_rebuild_count; }

        static constexpr f64 kZoomTolerance = 0.01;
        static constexpr f64 kPanTolerance  = 1.0;
        static constexpr f64 kThickOrbitMinAxis = 10.0;

    private:
        void rebuild(const scene::OrbitalElements& elements, Vec2d parent_position,
                     const Camera& camera);

        std::optional<Surface> m_surface;
        Rect m_rect;
        OrbitCacheKey m_key;
        u32 m_rebuild_count = 0;
    };

    /// @brief Lay out a facts panel: "key: value" per line on a translucent box.
    [[nodiscard]] Surface build_facts_surface(const scene::Facts& facts, Renderer& renderer);

    /// @brief Everything the scene renderer retains for one body.
    struct BodyRenderCache
    {
        OrbitPathCache orbit;
        std::optional<Surface> facts;
        std::optional<Surface> label;
        u32 facts_build_count = 0;

        /// @brief Build the facts overlay on first use and return it.
        /// @return nullptr if the body has no facts.
        const Surface* facts_overlay(const scene::CelestialBody& body, Renderer& renderer);

        /// @brief Build the name label on first use and return it.
        /// @return nullptr if the body has no name.
        const Surface* name_label(const scene::CelestialBody& body, Renderer& renderer);

        void clear();
    };

    /// @brief One BodyRenderCache per BodyId, parallel to the scene graph.
    class RenderCacheSet
    {
    public:
        /// @brief Drop every cache and size the set for @p body_count bodies.
        void reset(std::size_t body_count);

        /// @brief Grow or shrink to @p body_count entries, keeping existing caches.
        void resize(std::size_t body_count) { m_caches.resize(body_count); }

        /// @brief Drop every retained surface (viewport resize, scene reset).
        void clear_all();

        [[nodiscard]] BodyRenderCache& operator[](scene::BodyId id) { return m_caches[id]; }
        [[nodiscard]] const BodyRenderCache& operator[](scene::BodyId id) const { return m_caches[id]; }

        [[nodiscard]] std::size_t size() const { return m_caches.size(); }

        /// @brief Number of bodies currently holding any retained surface.
        [[nodiscard]] std::size_t populated_count() const;

        [[nodiscard]] u64 total_orbit_rebuilds() const;

    private:
        std::vector<BodyRenderCache> m_caches;
    };

} // namespace orrery::rendering
