#pragma once

/// @file window.hpp
/// @brief SDL2 window with Vulkan surface support.

#include "core/logger.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_vulkan.h>
#include <vulkan/vulkan.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace orrery::core
{
    struct WindowConfig
    {
        std::string title = "Solar System Simulation";
        uint32_t width = 1200;
        uint32_t height = 800;
        uint32_t min_width = 320;    ///< Smallest size the HUD still fits in
        uint32_t min_height = 320;
        bool fullscreen = false;
        bool resizable = true;
    };

    /// @brief Receives every SDL event seen by poll_events().
    using EventCallback = std::function<void(const SDL_Event&)>;

    /// @brief Owns the SDL_Window and the SDL video subsystem.
    ///
    /// Tracks the drawable size (0x0 while minimized) so the frame loop
    /// knows when to skip drawing and when to rebuild the swapchain.
    class Window
    {
    public:
        explicit Window(const WindowConfig& config);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;
        Window(Window&&) = delete;
        Window& operator=(Window&&) = delete;

        /// @brief Drain the SDL queue, updating size state and forwarding each event.
        void poll_events();

        void set_event_callback(EventCallback callback);

        [[nodiscard]] SDL_Window* get_native_handle() const { return m_window; }

        /// @brief Instance extensions SDL needs to create a surface for this window.
        [[nodiscard]] std::vector<const char*> get_required_vulkan_extensions() const;

        /// @brief Create a surface for this window. The caller owns the result.
        [[nodiscard]] VkSurfaceKHR create_vulkan_surface(VkInstance instance) const;

        [[nodiscard]] uint32_t get_width() const { return m_width; }
        [[nodiscard]] uint32_t get_height() const { return m_height; }
        [[nodiscard]] bool is_minimized() const { return m_width == 0 || m_height == 0; }

        /// @brief True once after any size change. Reading clears the flag.
        [[nodiscard]] bool was_resized();

    private:
        void refresh_size();

        SDL_Window* m_window = nullptr;
        uint32_t m_width = 0;
        uint32_t m_height = 0;
        bool m_was_resized = false;
        EventCallback m_event_callback;
    };

} // namespace orrery::core
