#pragma once

/// @file application.hpp
/// @brief Top-level application: owns the window, GPU objects and controller; drives the frame loop.

#include "core/input.hpp"
#include "core/types.hpp"
#include "core/window.hpp"
#include "sim/controller.hpp"
#include "vulkan/canvas.hpp"
#include "vulkan/context.hpp"
#include "vulkan/swapchain.hpp"

#include <vulkan/vulkan.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace orrery::core
{
    /// @brief Owns every subsystem and runs the paced, single-threaded frame loop.
    ///
    /// Each iteration: poll SDL, feed translated events to the controller,
    /// advance the simulation one tick, draw through the canvas, present,
    /// then sleep until the next 1/60 s slot. Rendering uses two frames in
    /// flight; render-finished semaphores live with the swapchain images.
    class Application
    {
    public:
        Application();
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Run until the controller asks to quit.
        void run();

    private:
        void init();
        void shutdown();

        void draw_frame();
        void record_command_buffer(VkCommandBuffer cmd, uint32_t image_index);
        void recreate_swapchain();
        void update_fps(std::chrono::steady_clock::time_point now);

        void create_command_pool();
        void create_sync_objects();
        void destroy_sync_objects();

        static constexpr uint32_t kMaxFramesInFlight = 2;
        static constexpr f64 kTargetFps = 60.0;
        static constexpr f64 kFpsWindowSec = 0.5;

        // Created in this order, destroyed in reverse
        std::unique_ptr<Window> m_window;
        std::unique_ptr<Input> m_input;
        std::unique_ptr<vulkan::Context> m_context;
        std::unique_ptr<vulkan::Swapchain> m_swapchain;
        std::unique_ptr<vulkan::Canvas> m_canvas;
        std::unique_ptr<sim::Controller> m_controller;

        VkCommandPool m_command_pool = VK_NULL_HANDLE;
        std::array<VkCommandBuffer, kMaxFramesInFlight> m_command_buffers{};
        std::array<VkSemaphore, kMaxFramesInFlight> m_image_available{};
        std::array<VkFence, kMaxFramesInFlight> m_in_flight{};
        uint32_t m_current_frame = 0;
        bool m_framebuffer_resized = false;

        // Frame rate measured over a short sliding window
        sim::FrameStats m_stats;
        std::chrono::steady_clock::time_point m_fps_window_start;
        u32 m_fps_frames = 0;
    };

} // namespace orrery::core
