/// @file application.cpp
/// @brief Application lifecycle, paced frame loop and frame submission.

#include "core/application.hpp"

#include "catalog/solar_system_catalog.hpp"
#include "vulkan/vk_check.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <thread>

namespace orrery::core
{

using vulkan::check_vk;

Application::Application()
{
    init();
}

Application::~Application()
{
    shutdown();
}

// =================================================================
// Initialization
// =================================================================

void Application::init()
{
    const WindowConfig window_config{};
    m_window = std::make_unique<Window>(window_config);

    m_input = std::make_unique<Input>();
    m_window->set_event_callback([this](const SDL_Event& event) {
        m_input->process_event(event);
    });

#ifdef NDEBUG
    constexpr bool kValidation = false;
#else
    constexpr bool kValidation = true;
#endif
    m_context = std::make_unique<vulkan::Context>(
        vulkan::ContextConfig{.app_name = window_config.title, .enable_validation = kValidation},
        *m_window);

    m_swapchain = std::make_unique<vulkan::Swapchain>(
        *m_context, m_window->get_width(), m_window->get_height());

    const std::filesystem::path shader_dir{ORR_SHADER_DIR};
    ORR_CORE_INFO("Shader directory: {}", shader_dir.string());
    m_canvas = std::make_unique<vulkan::Canvas>(
        *m_context, m_swapchain->get_render_pass(), shader_dir, kMaxFramesInFlight);

    const VkExtent2D extent = m_swapchain->get_extent();
    m_controller = std::make_unique<sim::Controller>(
        catalog::solar_system(),
        sim::ControllerConfig{
            .viewport_width = static_cast<i32>(extent.width),
            .viewport_height = static_cast<i32>(extent.height),
        });

    create_command_pool();
    create_sync_objects();

    m_fps_window_start = std::chrono::steady_clock::now();

    ORR_CORE_INFO("Application initialized: {} planets, {} moons",
                  m_controller->scene().planet_count(), m_controller->scene().moon_count());
}

void Application::shutdown()
{
    if (!m_context)
    {
        return;
    }

    m_context->wait_idle();

    destroy_sync_objects();
    if (m_command_pool != VK_NULL_HANDLE)
    {
        vkDestroyCommandPool(m_context->get_device(), m_command_pool, nullptr);
        m_command_pool = VK_NULL_HANDLE;
    }

    m_controller.reset();
    m_canvas.reset();
    m_swapchain.reset();
    m_context.reset();

    // The callback captures this and reaches into m_input.
    if (m_window)
    {
        m_window->set_event_callback(nullptr);
    }
    m_input.reset();
    m_window.reset();
}

// =================================================================
// Main loop
// =================================================================

void Application::run()
{
    using clock = std::chrono::steady_clock;
    const auto frame_budget = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<f64>(1.0 / kTargetFps));

    ORR_CORE_INFO("Entering main loop");

    auto next_frame = clock::now();
    while (true)
    {
        m_window->poll_events();
        for (const sim::InputEvent& event : m_input->drain())
        {
            m_controller->handle(event);
        }
        if (m_controller->should_quit())
        {
            break;
        }

        if (m_window->was_resized())
        {
            m_framebuffer_resized = true;
        }

        m_controller->tick();

        if (!m_window->is_minimized())
        {
            draw_frame();
        }

        const auto now = clock::now();
        update_fps(now);

        next_frame += frame_budget;
        if (next_frame < now)
        {
            // Fell behind; pace from here instead of bursting to catch up.
            next_frame = now;
        }
        std::this_thread::sleep_until(next_frame);
    }

    m_context->wait_idle();
    ORR_CORE_INFO("Main loop exited");
}

void Application::update_fps(std::chrono::steady_clock::time_point now)
{
    ++m_fps_frames;
    const f64 elapsed = std::chrono::duration<f64>(now - m_fps_window_start).count();
    if (elapsed >= kFpsWindowSec)
    {
        m_stats.fps = static_cast<f64>(m_fps_frames) / elapsed;
        m_fps_frames = 0;
        m_fps_window_start = now;
    }
}

// =================================================================
// Frame submission
// =================================================================

void Application::draw_frame()
{
    VkDevice device = m_context->get_device();

    check_vk(vkWaitForFences(device, 1, &m_in_flight[m_current_frame], VK_TRUE,
                             std::numeric_limits<uint64_t>::max()),
             "vkWaitForFences");

    uint32_t image_index = 0;
    const VkResult acquired = vkAcquireNextImageKHR(device,
                                                    m_swapchain->get_handle(),
                                                    std::numeric_limits<uint64_t>::max(),
                                                    m_image_available[m_current_frame],
                                                    VK_NULL_HANDLE,
                                                    &image_index);
    if (acquired == VK_ERROR_OUT_OF_DATE_KHR)
    {
        recreate_swapchain();
        return;
    }
    if (acquired != VK_SUCCESS && acquired != VK_SUBOPTIMAL_KHR)
    {
        check_vk(acquired, "vkAcquireNextImageKHR");
    }

    check_vk(vkResetFences(device, 1, &m_in_flight[m_current_frame]), "vkResetFences");

    // The fence wait above guarantees this slot's vertex buffer is free.
    m_canvas->begin_frame(m_current_frame, m_swapchain->get_extent());
    m_controller->render(*m_canvas, m_stats);

    VkCommandBuffer cmd = m_command_buffers[m_current_frame];
    check_vk(vkResetCommandBuffer(cmd, 0), "vkResetCommandBuffer");
    record_command_buffer(cmd, image_index);

    const VkSemaphore render_finished = m_swapchain->get_render_finished(image_index);
    const VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo submit_info{};
    submit_info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit_info.waitSemaphoreCount = 1;
    submit_info.pWaitSemaphores = &m_image_available[m_current_frame];
    submit_info.pWaitDstStageMask = &wait_stage;
    submit_info.commandBufferCount = 1;
    submit_info.pCommandBuffers = &cmd;
    submit_info.signalSemaphoreCount = 1;
    submit_info.pSignalSemaphores = &render_finished;

    check_vk(vkQueueSubmit(m_context->get_graphics_queue(), 1, &submit_info, m_in_flight[m_current_frame]),
             "vkQueueSubmit");

    const VkSwapchainKHR swapchain = m_swapchain->get_handle();

    VkPresentInfoKHR present_info{};
    present_info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present_info.waitSemaphoreCount = 1;
    present_info.pWaitSemaphores = &render_finished;
    present_info.swapchainCount = 1;
    present_info.pSwapchains = &swapchain;
    present_info.pImageIndices = &image_index;

    const VkResult presented = vkQueuePresentKHR(m_context->get_present_queue(), &present_info);
    if (presented == VK_ERROR_OUT_OF_DATE_KHR || presented == VK_SUBOPTIMAL_KHR || m_framebuffer_resized)
    {
        m_framebuffer_resized = false;
        recreate_swapchain();
    }
    else
    {
        check_vk(presented, "vkQueuePresentKHR");
    }

    m_current_frame = (m_current_frame + 1) % kMaxFramesInFlight;
}

void Application::record_command_buffer(VkCommandBuffer cmd, uint32_t image_index)
{
    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin_info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

    check_vk(vkBeginCommandBuffer(cmd, &begin_info), "vkBeginCommandBuffer");

    const Vec4f background = colors::kBlack.to_vec4();
    VkClearValue clear{};
    clear.color = {{background.r, background.g, background.b, background.a}};

    VkRenderPassBeginInfo pass_info{};
    pass_info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    pass_info.renderPass = m_swapchain->get_render_pass();
    pass_info.framebuffer = m_swapchain->get_framebuffer(image_index);
    pass_info.renderArea.extent = m_swapchain->get_extent();
    pass_info.clearValueCount = 1;
    pass_info.pClearValues = &clear;

    vkCmdBeginRenderPass(cmd, &pass_info, VK_SUBPASS_CONTENTS_INLINE);
    m_canvas->record(cmd);
    vkCmdEndRenderPass(cmd);

    check_vk(vkEndCommandBuffer(cmd), "vkEndCommandBuffer");
}

void Application::recreate_swapchain()
{
    if (m_window->is_minimized())
    {
        return;
    }

    m_swapchain->recreate(m_window->get_width(), m_window->get_height());
}

// =================================================================
// Command pool, buffers and per-frame synchronization
// =================================================================

void Application::create_command_pool()
{
    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pool_info.queueFamilyIndex = m_context->get_graphics_queue_family();

    check_vk(vkCreateCommandPool(m_context->get_device(), &pool_info, nullptr, &m_command_pool),
             "vkCreateCommandPool");

    VkCommandBufferAllocateInfo alloc_info{};
    alloc_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    alloc_info.commandPool = m_command_pool;
    alloc_info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    alloc_info.commandBufferCount = kMaxFramesInFlight;

    check_vk(vkAllocateCommandBuffers(m_context->get_device(), &alloc_info, m_command_buffers.data()),
             "vkAllocateCommandBuffers");
}

void Application::create_sync_objects()
{
    VkDevice device = m_context->get_device();

    VkSemaphoreCreateInfo semaphore_info{};
    semaphore_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (uint32_t i = 0; i < kMaxFramesInFlight; ++i)
    {
        check_vk(vkCreateSemaphore(device, &semaphore_info, nullptr, &m_image_available[i]),
                 "vkCreateSemaphore (image available)");
        check_vk(vkCreateFence(device, &fence_info, nullptr, &m_in_flight[i]),
                 "vkCreateFence (in flight)");
    }
}

void Application::destroy_sync_objects()
{
    VkDevice device = m_context->get_device();

    for (uint32_t i = 0; i < kMaxFramesInFlight; ++i)
    {
        if (m_image_available[i] != VK_NULL_HANDLE)
        {
            vkDestroySemaphore(device, m_image_available[i], nullptr);
            m_image_available[i] = VK_NULL_HANDLE;
        }
        if (m_in_flight[i] != VK_NULL_HANDLE)
        {
            vkDestroyFence(device, m_in_flight[i], nullptr);
            m_in_flight[i] = VK_NULL_HANDLE;
        }
    }
}

} // namespace orrery::core
