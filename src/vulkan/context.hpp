#pragma once

/// @file context.hpp
/// @brief Vulkan instance, surface, device and queues for the orrery window.

#include "core/logger.hpp"
#include "core/window.hpp"

#include <vulkan/vulkan.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace orrery::vulkan
{
    struct ContextConfig
    {
        std::string app_name = "Orrery";
        uint32_t app_version = VK_MAKE_API_VERSION(0, 1, 0, 0);
        bool enable_validation = false;
    };

    /// @brief Owns the device-level Vulkan objects shared by every renderer.
    ///
    /// Construction order is instance, debug messenger, surface (from the
    /// window), physical device, logical device. Destruction runs in reverse.
    /// Any failure is fatal.
    class Context
    {
    public:
        Context(const ContextConfig& config, core::Window& window);
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

        [[nodiscard]] VkInstance get_instance() const { return m_instance; }
        [[nodiscard]] VkPhysicalDevice get_physical_device() const { return m_physical_device; }
        [[nodiscard]] VkDevice get_device() const { return m_device; }
        [[nodiscard]] VkQueue get_graphics_queue() const { return m_graphics_queue; }
        [[nodiscard]] VkQueue get_present_queue() const { return m_present_queue; }
        [[nodiscard]] uint32_t get_graphics_queue_family() const { return m_graphics_family; }
        [[nodiscard]] uint32_t get_present_queue_family() const { return m_present_family; }
        [[nodiscard]] VkSurfaceKHR get_surface() const { return m_surface; }

        /// @brief Index of a memory type allowed by @p type_filter with all of @p properties.
        [[nodiscard]] uint32_t find_memory_type(uint32_t type_filter,
                                                VkMemoryPropertyFlags properties) const;

        /// @brief Load a SPIR-V binary and wrap it in a shader module.
        /// The caller destroys the module once the pipeline is built.
        [[nodiscard]] VkShaderModule create_shader_module(const std::filesystem::path& path) const;

        /// @brief Block until the device has finished all submitted work.
        void wait_idle() const;

    private:
        void create_instance(const ContextConfig& config,
                             const std::vector<const char*>& window_extensions);
        void setup_debug_messenger();
        void pick_physical_device();
        void create_logical_device();

        VkInstance m_instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_debug_messenger = VK_NULL_HANDLE;
        VkSurfaceKHR m_surface = VK_NULL_HANDLE;
        VkPhysicalDevice m_physical_device = VK_NULL_HANDLE;
        VkDevice m_device = VK_NULL_HANDLE;
        VkQueue m_graphics_queue = VK_NULL_HANDLE;
        VkQueue m_present_queue = VK_NULL_HANDLE;
        uint32_t m_graphics_family = 0;
        uint32_t m_present_family = 0;
        bool m_validation_enabled = false;
    };

} // namespace orrery::vulkan
