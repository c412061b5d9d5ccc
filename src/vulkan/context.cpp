/// @file context.cpp
/// @brief Vulkan context: instance, surface, device selection and queues.

#include "vulkan/context.hpp"

#include "vulkan/vk_check.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <set>
#include <string_view>

namespace
{

constexpr const char* kValidationLayerName = "VK_LAYER_KHRONOS_validation";

constexpr const char* kDeviceExtensions[] = {
    VK_KHR_SWAPCHAIN_EXTENSION_NAME,
};

// -----------------------------------------------------------------
// Validation output goes through the core logger
// -----------------------------------------------------------------
VKAPI_ATTR VkBool32 VKAPI_CALL on_validation_message(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    [[maybe_unused]] VkDebugUtilsMessageTypeFlagsEXT type,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    [[maybe_unused]] void* user_data)
{
    if ((severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) != 0)
    {
        ORR_CORE_ERROR("[Vulkan] {}", data->pMessage);
    }
    else if ((severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) != 0)
    {
        ORR_CORE_WARN("[Vulkan] {}", data->pMessage);
    }
    else
    {
        ORR_CORE_TRACE("[Vulkan] {}", data->pMessage);
    }
    return VK_FALSE;
}

VkDebugUtilsMessengerCreateInfoEXT make_messenger_info()
{
    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT
                         | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT
                     | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT
                     | VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = on_validation_message;
    return info;
}

bool has_validation_layer()
{
    uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    vkEnumerateInstanceLayerProperties(&count, layers.data());

    return std::any_of(layers.begin(), layers.end(), [](const VkLayerProperties& layer) {
        return std::string_view{layer.layerName} == kValidationLayerName;
    });
}

struct QueueFamilies
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;
};

QueueFamilies find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

    QueueFamilies result;
    for (uint32_t i = 0; i < count; ++i)
    {
        VkBool32 can_present = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &can_present);
        const bool can_draw = (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;

        // One family doing both is the common case and the cheapest.
        if (can_draw && can_present == VK_TRUE)
        {
            return QueueFamilies{i, i};
        }
        if (can_draw && !result.graphics)
        {
            result.graphics = i;
        }
        if (can_present == VK_TRUE && !result.present)
        {
            result.present = i;
        }
    }
    return result;
}

bool supports_swapchain(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(device, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> available(count);
    vkEnumerateDeviceExtensionProperties(device, nullptr, &count, available.data());

    for (const auto* required : kDeviceExtensions)
    {
        const bool found = std::any_of(available.begin(), available.end(),
                                       [required](const VkExtensionProperties& ext) {
                                           return std::string_view{ext.extensionName} == required;
                                       });
        if (!found)
        {
            return false;
        }
    }

    uint32_t format_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &format_count, nullptr);
    uint32_t mode_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &mode_count, nullptr);
    return format_count > 0 && mode_count > 0;
}

} // anonymous namespace

namespace orrery::vulkan
{

Context::Context(const ContextConfig& config, core::Window& window)
{
    create_instance(config, window.get_required_vulkan_extensions());

    if (m_validation_enabled)
    {
        setup_debug_messenger();
    }

    m_surface = window.create_vulkan_surface(m_instance);
    if (m_surface == VK_NULL_HANDLE)
    {
        ORR_CORE_CRITICAL("Failed to create Vulkan surface");
        std::abort();
    }

    pick_physical_device();
    create_logical_device();
}

Context::~Context()
{
    if (m_device != VK_NULL_HANDLE)
    {
        vkDestroyDevice(m_device, nullptr);
    }

    if (m_debug_messenger != VK_NULL_HANDLE)
    {
        auto destroy = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(m_instance, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroy != nullptr)
        {
            destroy(m_instance, m_debug_messenger, nullptr);
        }
    }

    if (m_surface != VK_NULL_HANDLE)
    {
        vkDestroySurfaceKHR(m_instance, m_surface, nullptr);
    }

    if (m_instance != VK_NULL_HANDLE)
    {
        vkDestroyInstance(m_instance, nullptr);
    }

    ORR_CORE_TRACE("Vulkan context destroyed");
}

// -----------------------------------------------------------------
// Instance
// -----------------------------------------------------------------
void Context::create_instance(const ContextConfig& config,
                              const std::vector<const char*>& window_extensions)
{
    m_validation_enabled = config.enable_validation;
    if (m_validation_enabled && !has_validation_layer())
    {
        ORR_CORE_WARN("Validation layer {} not installed, continuing without it", kValidationLayerName);
        m_validation_enabled = false;
    }

    VkApplicationInfo app_info{};
    app_info.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName = config.app_name.c_str();
    app_info.applicationVersion = config.app_version;
    app_info.pEngineName = "Orrery";
    app_info.engineVersion = config.app_version;
    app_info.apiVersion = VK_API_VERSION_1_3;

    std::vector<const char*> extensions = window_extensions;
    std::vector<const char*> layers;
    if (m_validation_enabled)
    {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        layers.push_back(kValidationLayerName);
    }

    VkInstanceCreateInfo create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo = &app_info;
    create_info.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    create_info.ppEnabledExtensionNames = extensions.data();
    create_info.enabledLayerCount = static_cast<uint32_t>(layers.size());
    create_info.ppEnabledLayerNames = layers.data();

    VkDebugUtilsMessengerCreateInfoEXT messenger_info = make_messenger_info();
    if (m_validation_enabled)
    {
        create_info.pNext = &messenger_info;
    }

    check_vk(vkCreateInstance(&create_info, nullptr, &m_instance), "vkCreateInstance");

    ORR_CORE_INFO("Vulkan instance created ({} extension(s), validation {})",
                  extensions.size(), m_validation_enabled ? "on" : "off");
}

void Context::setup_debug_messenger()
{
    auto create = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(m_instance, "vkCreateDebugUtilsMessengerEXT"));
    if (create == nullptr)
    {
        ORR_CORE_WARN("vkCreateDebugUtilsMessengerEXT unavailable, validation output disabled");
        return;
    }

    VkDebugUtilsMessengerCreateInfoEXT info = make_messenger_info();
    check_vk(create(m_instance, &info, nullptr, &m_debug_messenger),
             "vkCreateDebugUtilsMessengerEXT");
}

// -----------------------------------------------------------------
// Physical device: first discrete GPU that can present, else any
// -----------------------------------------------------------------
void Context::pick_physical_device()
{
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(m_instance, &count, nullptr);
    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(m_instance, &count, devices.data());

    VkPhysicalDevice fallback = VK_NULL_HANDLE;
    for (VkPhysicalDevice device : devices)
    {
        const QueueFamilies families = find_queue_families(device, m_surface);
        if (!families.graphics || !families.present || !supports_swapchain(device, m_surface))
        {
            continue;
        }

        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(device, &props);
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
        {
            m_physical_device = device;
            break;
        }
        if (fallback == VK_NULL_HANDLE)
        {
            fallback = device;
        }
    }

    if (m_physical_device == VK_NULL_HANDLE)
    {
        m_physical_device = fallback;
    }
    if (m_physical_device == VK_NULL_HANDLE)
    {
        ORR_CORE_CRITICAL("No GPU with graphics, present and swapchain support ({} found)", count);
        std::abort();
    }

    const QueueFamilies families = find_queue_families(m_physical_device, m_surface);
    m_graphics_family = families.graphics.value();
    m_present_family = families.present.value();

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(m_physical_device, &props);
    ORR_CORE_INFO("Selected GPU: {} (graphics family {}, present family {})",
                  props.deviceName, m_graphics_family, m_present_family);
}

// -----------------------------------------------------------------
// Logical device
// -----------------------------------------------------------------
void Context::create_logical_device()
{
    const std::set<uint32_t> unique_families = {m_graphics_family, m_present_family};

    constexpr float kQueuePriority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queue_infos;
    for (uint32_t family : unique_families)
    {
        VkDeviceQueueCreateInfo queue_info{};
        queue_info.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queue_info.queueFamilyIndex = family;
        queue_info.queueCount = 1;
        queue_info.pQueuePriorities = &kQueuePriority;
        queue_infos.push_back(queue_info);
    }

    VkPhysicalDeviceFeatures features{};

    VkDeviceCreateInfo create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    create_info.queueCreateInfoCount = static_cast<uint32_t>(queue_infos.size());
    create_info.pQueueCreateInfos = queue_infos.data();
    create_info.pEnabledFeatures = &features;
    create_info.enabledExtensionCount = static_cast<uint32_t>(std::size(kDeviceExtensions));
    create_info.ppEnabledExtensionNames = kDeviceExtensions;

    check_vk(vkCreateDevice(m_physical_device, &create_info, nullptr, &m_device), "vkCreateDevice");

    vkGetDeviceQueue(m_device, m_graphics_family, 0, &m_graphics_queue);
    vkGetDeviceQueue(m_device, m_present_family, 0, &m_present_queue);

    ORR_CORE_INFO("Vulkan logical device created");
}

// -----------------------------------------------------------------
// Helpers for buffer and pipeline owners
// -----------------------------------------------------------------
uint32_t Context::find_memory_type(uint32_t type_filter, VkMemoryPropertyFlags properties) const
{
    VkPhysicalDeviceMemoryProperties mem_props{};
    vkGetPhysicalDeviceMemoryProperties(m_physical_device, &mem_props);

    for (uint32_t i = 0; i < mem_props.memoryTypeCount; ++i)
    {
        if ((type_filter & (1u << i)) != 0
            && (mem_props.memoryTypes[i].propertyFlags & properties) == properties)
        {
            return i;
        }
    }

    ORR_CORE_CRITICAL("No memory type matches filter {:#x} with flags {:#x}", type_filter, properties);
    std::abort();
}

VkShaderModule Context::create_shader_module(const std::filesystem::path& path) const
{
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file.is_open())
    {
        ORR_CORE_CRITICAL("Failed to open shader file: {}", path.string());
        std::abort();
    }

    const auto size = static_cast<std::size_t>(file.tellg());
    if (size == 0 || size % sizeof(uint32_t) != 0)
    {
        ORR_CORE_CRITICAL("Invalid SPIR-V file ({} bytes): {}", size, path.string());
        std::abort();
    }

    std::vector<uint32_t> code(size / sizeof(uint32_t));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(code.data()), static_cast<std::streamsize>(size));

    VkShaderModuleCreateInfo create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    create_info.codeSize = size;
    create_info.pCode = code.data();

    VkShaderModule module = VK_NULL_HANDLE;
    check_vk(vkCreateShaderModule(m_device, &create_info, nullptr, &module), "vkCreateShaderModule");

    ORR_CORE_TRACE("Shader module loaded: {}", path.filename().string());
    return module;
}

void Context::wait_idle() const
{
    if (m_device != VK_NULL_HANDLE)
    {
        check_vk(vkDeviceWaitIdle(m_device), "vkDeviceWaitIdle");
    }
}

} // namespace orrery::vulkan
