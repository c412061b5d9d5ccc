/// @file render_cache.cpp
/// @brief Orbit path caching and lazily built text overlays.

#include "rendering/render_cache.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace orrery::rendering
{

namespace
{
    constexpr i32 kFactsPadding = 12;
    constexpr i32 kFactsLinePitch = 20;
}

// -----------------------------------------------------------------
// Orbit sampling
// -----------------------------------------------------------------

OrbitSamples sample_orbit(const scene::OrbitalElements& elements, Vec2d parent_position)
{
    const f64 a = elements.semi_major_axis;
    const f64 b = a * std::sqrt(elements.one_minus_e2);
    constexpr auto kSteps = static_cast<f64>(kOrbitSampleCount - 1);

    OrbitSamples samples;
    for (std::size_t i = 0; i < kOrbitSampleCount; ++i)
    {
        const f64 theta = math_constants::kTwoPi * static_cast<f64>(i) / kSteps;
        samples[i] = parent_position + Vec2d{a * std::cos(theta), b * std::sin(theta)};
    }
    return samples;
}

// -----------------------------------------------------------------
// OrbitPathCache
// -----------------------------------------------------------------

bool OrbitPathCache::is_valid(const Camera& camera) const
{
    if (!m_surface.has_value())
    {
        return false;
    }

    return std::abs(camera.zoom() - m_key.zoom) < kZoomTolerance
        && camera.viewport() == m_key.viewport
        && std::abs(camera.pan().x - m_key.pan.x) < kPanTolerance
        && std::abs(camera.pan().y - m_key.pan.y) < kPanTolerance;
}

bool OrbitPathCache::validate(const scene::OrbitalElements& elements, Vec2d parent_position,
                              const Camera& camera)
{
    if (is_valid(camera))
    {
        return false;
    }

    rebuild(elements, parent_position, camera);
    return true;
}

void OrbitPathCache::rebuild(const scene::OrbitalElements& elements, Vec2d parent_position,
                             const Camera& camera)
{
    m_key = OrbitCacheKey{
        .zoom = camera.zoom(),
        .viewport = camera.viewport(),
        .pan = camera.pan(),
    };

    OrbitSamples screen = sample_orbit(elements, parent_position);
    for (auto& point : screen)
    {
        point = camera.world_to_screen(point);
    }

    Vec2d lo = screen.front();
    Vec2d hi = screen.front();
    for (const auto& point : screen)
    {
        lo = glm::min(lo, point);
        hi = glm::max(hi, point);
    }

    const i32 box_width = std::clamp(static_cast<i32>(hi.x - lo.x) + 2, 1, std::max(camera.width(), 1));
    const i32 box_height = std::clamp(static_cast<i32>(hi.y - lo.y) + 2, 1, std::max(camera.height(), 1));

    m_rect = Rect{static_cast<i32>(lo.x), static_cast<i32>(lo.y), box_width, box_height};

    for (auto& point : screen)
    {
        point -= lo;
    }

    const f64 line_width = elements.semi_major_axis > kThickOrbitMinAxis ? 2.0 : 1.0;

    Surface surface(box_width, box_height);
    surface.draw_polyline(screen, true, colors::kOrbit, line_width);
    m_surface = std::move(surface);

    ++m_rebuild_count;
}

void OrbitPathCache::clear()
{
    m_surface.reset();
}

// -----------------------------------------------------------------
// Facts overlay / label
// -----------------------------------------------------------------

Surface build_facts_surface(const scene::Facts& facts, Renderer& renderer)
{
    std::vector<Surface> lines;
    lines.reserve(facts.size());

    i32 max_width = 0;
    for (const auto& [key, value] : facts)
    {
        lines.push_back(renderer.text_to_surface(key + ": " + value, colors::kWhite));
        max_width = std::max(max_width, lines.back().width());
    }

    const i32 box_width = max_width + 2 * kFactsPadding;
    const i32 box_height = static_cast<i32>(lines.size()) * kFactsLinePitch + 2 * kFactsPadding;

    Surface panel(box_width, box_height);
    panel.fill_rect(Rect{0, 0, box_width, box_height}, colors::kPanel);

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const auto y = kFactsPadding + static_cast<i32>(i) * kFactsLinePitch;
        panel.draw_surface(lines[i], Vec2d{static_cast<f64>(kFactsPadding), static_cast<f64>(y)});
    }

    return panel;
}

const Surface* BodyRenderCache::facts_overlay(const scene::CelestialBody& body, Renderer& renderer)
{
    if (!body.has_facts())
    {
        return nullptr;
    }

    if (!facts.has_value())
    {
        facts = build_facts_surface(body.facts, renderer);
        ++facts_build_count;
        ORR_CORE_TRACE("RenderCache: Built facts overlay for '{}' ({}x{})",
                       body.name, facts->width(), facts->height());
    }

    return &*facts;
}

const Surface* BodyRenderCache::name_label(const scene::CelestialBody& body, Renderer& renderer)
{
    if (body.name.empty())
    {
        return nullptr;
    }

    if (!label.has_value())
    {
        label = renderer.text_to_surface(body.name, colors::kWhite);
    }

    return &*label;
}

void BodyRenderCache::clear()
{
    orbit.clear();
    facts.reset();
    label.reset();
}

// -----------------------------------------------------------------
// RenderCacheSet
// -----------------------------------------------------------------

void RenderCacheSet::reset(std::size_t body_count)
{
    m_caches.clear();
    m_caches.resize(body_count);
}

void RenderCacheSet::clear_all()
{
    for (auto& cache : m_caches)
    {
        cache.clear();
    }
    ORR_CORE_TRACE("RenderCache: Cleared {} body caches", m_caches.size());
}

std::size_t RenderCacheSet::populated_count() const
{
    return static_cast<std::size_t>(std::count_if(m_caches.begin(), m_caches.end(),
        [](const BodyRenderCache& cache) {
            return cache.orbit.surface().has_value()
                || cache.facts.has_value()
                || cache.label.has_value();
        }));
}

u64 RenderCacheSet::total_orbit_rebuilds() const
{
    u64 total = 0;
    for (const auto& cache : m_caches)
    {
        total += cache.orbit.rebuild_count();
    }
    return total;
}

} // namespace orrery::rendering
