/// @file window.cpp
/// @brief SDL2 window implementation with Vulkan surface support.

#include "core/window.hpp"

#include <cstdlib>
#include <utility>

namespace orrery::core
{

Window::Window(const WindowConfig& config)
    : m_width{config.width}
    , m_height{config.height}
{
    SDL_SetMainReady();

    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        ORR_CORE_CRITICAL("SDL_Init failed: {}", SDL_GetError());
        std::abort();
    }

    uint32_t flags = SDL_WINDOW_VULKAN | SDL_WINDOW_SHOWN;
    if (config.resizable)
    {
        flags |= SDL_WINDOW_RESIZABLE;
    }
    if (config.fullscreen)
    {
        flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;
    }

    m_window = SDL_CreateWindow(config.title.c_str(),
                                SDL_WINDOWPOS_CENTERED,
                                SDL_WINDOWPOS_CENTERED,
                                static_cast<int>(config.width),
                                static_cast<int>(config.height),
                                flags);
    if (m_window == nullptr)
    {
        ORR_CORE_CRITICAL("SDL_CreateWindow failed: {}", SDL_GetError());
        std::abort();
    }

    SDL_SetWindowMinimumSize(m_window, static_cast<int>(config.min_width),
                             static_cast<int>(config.min_height));
    refresh_size();

    ORR_CORE_INFO("Window created: \"{}\" ({}x{}{})",
                  config.title, m_width, m_height, config.resizable ? ", resizable" : "");
}

Window::~Window()
{
    if (m_window != nullptr)
    {
        SDL_DestroyWindow(m_window);
    }
    SDL_Quit();
}

void Window::poll_events()
{
    SDL_Event event{};
    while (SDL_PollEvent(&event) != 0)
    {
        if (event.type == SDL_WINDOWEVENT)
        {
            switch (event.window.event)
            {
                case SDL_WINDOWEVENT_SIZE_CHANGED:
                case SDL_WINDOWEVENT_RESTORED:
                    refresh_size();
                    m_was_resized = true;
                    break;

                case SDL_WINDOWEVENT_MINIMIZED:
                    m_width = 0;
                    m_height = 0;
                    m_was_resized = true;
                    break;

                default:
                    break;
            }
        }

        if (m_event_callback)
        {
            m_event_callback(event);
        }
    }
}

void Window::set_event_callback(EventCallback callback)
{
    m_event_callback = std::move(callback);
}

std::vector<const char*> Window::get_required_vulkan_extensions() const
{
    unsigned int count = 0;
    if (SDL_Vulkan_GetInstanceExtensions(m_window, &count, nullptr) == SDL_FALSE)
    {
        ORR_CORE_ERROR("SDL_Vulkan_GetInstanceExtensions failed: {}", SDL_GetError());
        return {};
    }

    std::vector<const char*> extensions(count);
    if (SDL_Vulkan_GetInstanceExtensions(m_window, &count, extensions.data()) == SDL_FALSE)
    {
        ORR_CORE_ERROR("SDL_Vulkan_GetInstanceExtensions failed: {}", SDL_GetError());
        return {};
    }
    return extensions;
}

VkSurfaceKHR Window::create_vulkan_surface(VkInstance instance) const
{
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    if (SDL_Vulkan_CreateSurface(m_window, instance, &surface) == SDL_FALSE)
    {
        ORR_CORE_CRITICAL("SDL_Vulkan_CreateSurface failed: {}", SDL_GetError());
        return VK_NULL_HANDLE;
    }
    return surface;
}

bool Window::was_resized()
{
    const bool resized = m_was_resized;
    m_was_resized = false;
    return resized;
}

// Drawable size, which is what the swapchain and the camera care about.
void Window::refresh_size()
{
    int w = 0;
    int h = 0;
    SDL_Vulkan_GetDrawableSize(m_window, &w, &h);
    m_width = static_cast<uint32_t>(w);
    m_height = static_cast<uint32_t>(h);
}

} // namespace orrery::core
