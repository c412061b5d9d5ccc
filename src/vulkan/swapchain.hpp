#pragma once

/// @file swapchain.hpp
/// @brief Swapchain images with the render pass and framebuffers that draw into them.

#include "vulkan/context.hpp"

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace orrery::vulkan
{
    /// @brief Presentable images plus everything sized by them.
    ///
    /// The render pass clears to black and is created once, since the
    /// surface format does not change on resize. Framebuffers and the
    /// per-image render-finished semaphores are rebuilt by recreate().
    class Swapchain
    {
    public:
        Swapchain(const Context& context, uint32_t width, uint32_t height);
        ~Swapchain();

        Swapchain(const Swapchain&) = delete;
        Swapchain& operator=(const Swapchain&) = delete;
        Swapchain(Swapchain&&) = delete;
        Swapchain& operator=(Swapchain&&) = delete;

        /// @brief Rebuild for a new framebuffer size. Waits for the device first.
        void recreate(uint32_t width, uint32_t height);

        [[nodiscard]] VkSwapchainKHR get_handle() const { return m_swapchain; }
        [[nodiscard]] VkFormat get_image_format() const { return m_image_format; }
        [[nodiscard]] VkExtent2D get_extent() const { return m_extent; }
        [[nodiscard]] VkRenderPass get_render_pass() const { return m_render_pass; }
        [[nodiscard]] VkFramebuffer get_framebuffer(uint32_t image_index) const;
        [[nodiscard]] VkSemaphore get_render_finished(uint32_t image_index) const;
        [[nodiscard]] uint32_t get_image_count() const { return static_cast<uint32_t>(m_images.size()); }

    private:
        void create(uint32_t width, uint32_t height);
        void destroy_image_resources();
        void create_render_pass();
        void create_image_resources();

        const Context& m_context;

        VkSwapchainKHR m_swapchain = VK_NULL_HANDLE;
        VkFormat m_image_format = VK_FORMAT_UNDEFINED;
        VkColorSpaceKHR m_color_space = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        VkExtent2D m_extent = {0, 0};
        VkRenderPass m_render_pass = VK_NULL_HANDLE;

        std::vector<VkImage> m_images;
        std::vector<VkImageView> m_image_views;
        std::vector<VkFramebuffer> m_framebuffers;
        std::vector<VkSemaphore> m_render_finished;
    };

} // namespace orrery::vulkan
