#pragma once

/// @file vk_check.hpp
/// @brief VkResult checking shared by the Vulkan backend.

#include "core/logger.hpp"

#include <vulkan/vulkan.h>

#include <cstdlib>

namespace orrery::vulkan
{
    /// @brief Log and abort when a Vulkan call fails.
    /// The backend has no recovery path for device errors.
    inline void check_vk(VkResult result, const char* operation)
    {
        if (result != VK_SUCCESS)
        {
            ORR_CORE_CRITICAL("Vulkan error in {}: VkResult = {}", operation, static_cast<int>(result));
            std::abort();
        }
    }

} // namespace orrery::vulkan
