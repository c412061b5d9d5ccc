/// @file camera.cpp
/// @brief Implementation of the 2D view camera.

#include "rendering/camera.hpp"

#include <algorithm>

namespace orrery::rendering
{

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

Camera::Camera(i32 width, i32 height)
{
    reset(width, height);
}

// -----------------------------------------------------------------
// Projection
// -----------------------------------------------------------------

Vec2d Camera::half_viewport() const
{
    return Vec2d{static_cast<f64>(m_width / 2), static_cast<f64>(m_height / 2)};
}

Vec2d Camera::world_to_screen(Vec2d world) const
{
    return (world - m_pan) * m_zoom + half_viewport();
}

Vec2d Camera::screen_to_world(Vec2d screen) const
{
    return (screen - half_viewport()) / m_zoom + m_pan;
}

// -----------------------------------------------------------------
// drag: pointer delta in pixels, converted to world units
// -----------------------------------------------------------------

void Camera::drag(f64 dx_px, f64 dy_px)
{
    m_pan.x -= dx_px / m_zoom;
    m_pan.y -= dy_px / m_zoom;
}

// -----------------------------------------------------------------
// Zoom
// -----------------------------------------------------------------

void Camera::zoom_in()
{
    m_zoom *= kZoomInStep;
    clamp_zoom();
}

void Camera::zoom_out()
{
    m_zoom *= kZoomOutStep;
    clamp_zoom();
}

void Camera::set_zoom(f64 zoom)
{
    m_zoom = zoom;
    clamp_zoom();
}

void Camera::clamp_zoom()
{
    m_zoom = std::clamp(m_zoom, kMinZoom, kMaxZoom);
}

// -----------------------------------------------------------------
// Viewport
// -----------------------------------------------------------------

void Camera::resize(i32 width, i32 height)
{
    m_width = width;
    m_height = height;
    m_pan = Vec2d{static_cast<f64>(width / 2), static_cast<f64>(height / 2)};
}

void Camera::reset(i32 width, i32 height)
{
    resize(width, height);
    m_zoom = kDefaultZoom;
}

} // namespace orrery::rendering
