#pragma once

/// @file camera.hpp
/// @brief 2D view camera: pan center, zoom and viewport size.

#include "core/types.hpp"

namespace orrery::rendering
{
    /// @brief Maps world coordinates to screen pixels and back.
    ///
    /// screen = (world − pan) × zoom + viewport/2, with the viewport halves
    /// taken as integer divisions. Pan is the world point shown at the
    /// viewport center.
    class Camera
    {
    public:
        /// @brief Construct a camera for a @p width × @p height viewport,
        ///        zoom 1, centered on the viewport middle.
        Camera(i32 width, i32 height);

        [[nodiscard]] Vec2d world_to_screen(Vec2d world) const;
        [[nodiscard]] Vec2d screen_to_world(Vec2d screen) const;

        /// @brief Scale a world length to pixels.
        [[nodiscard]] f64 scale_length(f64 length) const { return length * m_zoom; }

        /// @brief Pan by a pointer delta in pixels (content follows the pointer).
        void drag(f64 dx_px, f64 dy_px);

        /// @brief Multiply zoom by kZoomInStep, clamped.
        void zoom_in();

        /// @brief Multiply zoom by kZoomOutStep, clamped.
        void zoom_out();

        /// @brief Set zoom directly, clamped to [kMinZoom, kMaxZoom].
        void set_zoom(f64 zoom);

        void set_pan(Vec2d pan) { m_pan = pan; }

        /// @brief Store a new viewport size and recenter pan on its middle.
        void resize(i32 width, i32 height);

        /// @brief Zoom 1 and pan on the viewport middle.
        void reset(i32 width, i32 height);

        [[nodiscard]] f64 zoom() const { return m_zoom; }
        [[nodiscard]] Vec2d pan() const { return m_pan; }
        [[nodiscard]] i32 width() const { return m_width; }
        [[nodiscard]] i32 height() const { return m_height; }
        [[nodiscard]] Vec2i viewport() const { return Vec2i{m_width, m_height}; }

        // -----------------------------------------------------------------
        // Zoom limits
        // -----------------------------------------------------------------
        static constexpr f64 kMinZoom     = 0.05;
        static constexpr f64 kMaxZoom     = 5.0;
        static constexpr f64 kDefaultZoom = 1.0;
        static constexpr f64 kZoomInStep  = 1.1;
        static constexpr f64 kZoomOutStep = 0.909;

    private:
        [[nodiscard]] Vec2d half_viewport() const;

        void clamp_zoom();

        f64 m_zoom = kDefaultZoom;
        Vec2d m_pan{0.0, 0.0};     ///< World point at the viewport center
        i32 m_width = 0;           ///< Viewport width (pixels)
        i32 m_height = 0;          ///< Viewport height (pixels)
    };

} // namespace orrery::rendering
