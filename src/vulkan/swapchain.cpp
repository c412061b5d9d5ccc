/// @file swapchain.cpp
/// @brief Swapchain creation and resize handling.

#include "vulkan/swapchain.hpp"

#include "vulkan/vk_check.hpp"

#include <algorithm>
#include <limits>

namespace
{

// Colors arrive as 8-bit sRGB values and are written unconverted, so a
// UNORM target keeps them exactly as the catalog specifies.
VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& available)
{
    for (const auto& candidate : available)
    {
        if ((candidate.format == VK_FORMAT_B8G8R8A8_UNORM || candidate.format == VK_FORMAT_R8G8B8A8_UNORM)
            && candidate.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
        {
            return candidate;
        }
    }

    ORR_CORE_WARN("No UNORM surface format available, using format {}",
                  static_cast<int>(available.front().format));
    return available.front();
}

// The frame loop paces itself, FIFO only adds vsync on top and is always present.
VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR>& available)
{
    const bool has_mailbox = std::find(available.begin(), available.end(),
                                       VK_PRESENT_MODE_MAILBOX_KHR) != available.end();
    return has_mailbox ? VK_PRESENT_MODE_MAILBOX_KHR : VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& caps, uint32_t width, uint32_t height)
{
    if (caps.currentExtent.width != std::numeric_limits<uint32_t>::max())
    {
        return caps.currentExtent;
    }

    VkExtent2D extent{};
    extent.width = std::clamp(width, caps.minImageExtent.width, caps.maxImageExtent.width);
    extent.height = std::clamp(height, caps.minImageExtent.height, caps.maxImageExtent.height);
    return extent;
}

} // anonymous namespace

namespace orrery::vulkan
{

Swapchain::Swapchain(const Context& context, uint32_t width, uint32_t height)
    : m_context{context}
{
    create(width, height);
}

Swapchain::~Swapchain()
{
    VkDevice device = m_context.get_device();

    destroy_image_resources();

    if (m_swapchain != VK_NULL_HANDLE)
    {
        vkDestroySwapchainKHR(device, m_swapchain, nullptr);
    }
    if (m_render_pass != VK_NULL_HANDLE)
    {
        vkDestroyRenderPass(device, m_render_pass, nullptr);
    }

    ORR_CORE_TRACE("Swapchain destroyed");
}

void Swapchain::recreate(uint32_t width, uint32_t height)
{
    m_context.wait_idle();
    destroy_image_resources();
    create(width, height);
}

VkFramebuffer Swapchain::get_framebuffer(uint32_t image_index) const
{
    return m_framebuffers.at(image_index);
}

VkSemaphore Swapchain::get_render_finished(uint32_t image_index) const
{
    return m_render_finished.at(image_index);
}

// -----------------------------------------------------------------
// Swapchain handle (the previous one, if any, is retired here)
// -----------------------------------------------------------------
void Swapchain::create(uint32_t width, uint32_t height)
{
    VkPhysicalDevice gpu = m_context.get_physical_device();
    VkSurfaceKHR surface = m_context.get_surface();

    VkSurfaceCapabilitiesKHR caps{};
    check_vk(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu, surface, &caps),
             "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");

    uint32_t format_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface, &format_count, nullptr);
    std::vector<VkSurfaceFormatKHR> formats(format_count);
    vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface, &format_count, formats.data());

    uint32_t mode_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface, &mode_count, nullptr);
    std::vector<VkPresentModeKHR> modes(mode_count);
    vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface, &mode_count, modes.data());

    if (m_render_pass == VK_NULL_HANDLE)
    {
        const VkSurfaceFormatKHR format = choose_surface_format(formats);
        m_image_format = format.format;
        m_color_space = format.colorSpace;
        create_render_pass();
    }

    const VkPresentModeKHR present_mode = choose_present_mode(modes);
    m_extent = choose_extent(caps, width, height);

    uint32_t image_count = caps.minImageCount + 1;
    if (caps.maxImageCount > 0)
    {
        image_count = std::min(image_count, caps.maxImageCount);
    }

    const uint32_t families[] = {m_context.get_graphics_queue_family(),
                                 m_context.get_present_queue_family()};
    const bool shared = families[0] != families[1];

    VkSwapchainKHR old_swapchain = m_swapchain;

    VkSwapchainCreateInfoKHR create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    create_info.surface = surface;
    create_info.minImageCount = image_count;
    create_info.imageFormat = m_image_format;
    create_info.imageColorSpace = m_color_space;
    create_info.imageExtent = m_extent;
    create_info.imageArrayLayers = 1;
    create_info.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    create_info.imageSharingMode = shared ? VK_SHARING_MODE_CONCURRENT : VK_SHARING_MODE_EXCLUSIVE;
    create_info.queueFamilyIndexCount = shared ? 2u : 0u;
    create_info.pQueueFamilyIndices = shared ? families : nullptr;
    create_info.preTransform = caps.currentTransform;
    create_info.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    create_info.presentMode = present_mode;
    create_info.clipped = VK_TRUE;
    create_info.oldSwapchain = old_swapchain;

    check_vk(vkCreateSwapchainKHR(m_context.get_device(), &create_info, nullptr, &m_swapchain),
             "vkCreateSwapchainKHR");

    if (old_swapchain != VK_NULL_HANDLE)
    {
        vkDestroySwapchainKHR(m_context.get_device(), old_swapchain, nullptr);
    }

    uint32_t actual_count = 0;
    vkGetSwapchainImagesKHR(m_context.get_device(), m_swapchain, &actual_count, nullptr);
    m_images.resize(actual_count);
    vkGetSwapchainImagesKHR(m_context.get_device(), m_swapchain, &actual_count, m_images.data());

    create_image_resources();

    ORR_CORE_INFO("Swapchain ready: {}x{}, {} images, {}",
                  m_extent.width, m_extent.height, m_images.size(),
                  present_mode == VK_PRESENT_MODE_MAILBOX_KHR ? "MAILBOX" : "FIFO");
}

// -----------------------------------------------------------------
// Render pass: one color attachment, cleared each frame
// -----------------------------------------------------------------
void Swapchain::create_render_pass()
{
    VkAttachmentDescription color{};
    color.format = m_image_format;
    color.samples = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference color_ref{};
    color_ref.attachment = 0;
    color_ref.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments = &color_ref;

    VkSubpassDependency acquire{};
    acquire.srcSubpass = VK_SUBPASS_EXTERNAL;
    acquire.dstSubpass = 0;
    acquire.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    acquire.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    acquire.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    create_info.attachmentCount = 1;
    create_info.pAttachments = &color;
    create_info.subpassCount = 1;
    create_info.pSubpasses = &subpass;
    create_info.dependencyCount = 1;
    create_info.pDependencies = &acquire;

    check_vk(vkCreateRenderPass(m_context.get_device(), &create_info, nullptr, &m_render_pass),
             "vkCreateRenderPass");
}

// -----------------------------------------------------------------
// Per-image views, framebuffers and render-finished semaphores
// -----------------------------------------------------------------
void Swapchain::create_image_resources()
{
    VkDevice device = m_context.get_device();
    const std::size_t count = m_images.size();

    m_image_views.resize(count, VK_NULL_HANDLE);
    m_framebuffers.resize(count, VK_NULL_HANDLE);
    m_render_finished.resize(count, VK_NULL_HANDLE);

    VkSemaphoreCreateInfo semaphore_info{};
    semaphore_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    for (std::size_t i = 0; i < count; ++i)
    {
        VkImageViewCreateInfo view_info{};
        view_info.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        view_info.image = m_images[i];
        view_info.viewType = VK_IMAGE_VIEW_TYPE_2D;
        view_info.format = m_image_format;
        view_info.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        view_info.subresourceRange.levelCount = 1;
        view_info.subresourceRange.layerCount = 1;

        check_vk(vkCreateImageView(device, &view_info, nullptr, &m_image_views[i]),
                 "vkCreateImageView (swapchain)");

        VkFramebufferCreateInfo fb_info{};
        fb_info.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        fb_info.renderPass = m_render_pass;
        fb_info.attachmentCount = 1;
        fb_info.pAttachments = &m_image_views[i];
        fb_info.width = m_extent.width;
        fb_info.height = m_extent.height;
        fb_info.layers = 1;

        check_vk(vkCreateFramebuffer(device, &fb_info, nullptr, &m_framebuffers[i]),
                 "vkCreateFramebuffer");

        check_vk(vkCreateSemaphore(device, &semaphore_info, nullptr, &m_render_finished[i]),
                 "vkCreateSemaphore (render finished)");
    }
}

void Swapchain::destroy_image_resources()
{
    VkDevice device = m_context.get_device();

    for (VkSemaphore semaphore : m_render_finished)
    {
        vkDestroySemaphore(device, semaphore, nullptr);
    }
    for (VkFramebuffer framebuffer : m_framebuffers)
    {
        vkDestroyFramebuffer(device, framebuffer, nullptr);
    }
    for (VkImageView view : m_image_views)
    {
        vkDestroyImageView(device, view, nullptr);
    }

    m_render_finished.clear();
    m_framebuffers.clear();
    m_image_views.clear();
    m_images.clear();
}

} // namespace orrery::vulkan
