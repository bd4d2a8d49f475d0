#pragma once

#include <cstdint>
#include <string>

namespace vkframe {

// Carries what we tried, what the graphics API said, and a human message.
// VkResult is stored as int32_t to avoid pulling <vulkan/vulkan.h> into every header.
struct Error {
    std::string operation; // e.g. "allocate image page"
    std::int32_t vkResult; // 0 (VK_SUCCESS) when not a Vulkan error
    std::string message;   // human-readable explanation

    // Format as a single readable string.
    [[nodiscard]] std::string format() const;

    // VK_ERROR_OUT_OF_HOST_MEMORY or VK_ERROR_OUT_OF_DEVICE_MEMORY.
    [[nodiscard]] bool outOfMemory() const;
    [[nodiscard]] bool deviceLost() const;
    // The device or process cannot continue rendering. Anything else on the
    // frame path can be logged and the frame dropped.
    [[nodiscard]] bool fatal() const { return outOfMemory() || deviceLost(); }
};

// Escalation hook used by Result<T>::orThrow() and by caller-contract checks.
// When VKFRAME_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When VKFRAME_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace vkframe
