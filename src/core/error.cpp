#include <vkframe/error.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace vkframe {

#ifndef VKFRAME_ENABLE_EXCEPTIONS
#define VKFRAME_ENABLE_EXCEPTIONS 1
#endif

// Codes a frame loop is likely to see. Values are fixed by the Vulkan ABI.
static const char* resultName(std::int32_t vr) {
    switch (vr) {
    case 1000001003:  return "suboptimal swapchain";
    case -1:          return "out of host memory";
    case -2:          return "out of device memory";
    case -4:          return "device lost";
    case -5:          return "memory map failed";
    case -8:          return "feature not present";
    case -9:          return "incompatible driver";
    case -1000000000: return "surface lost";
    case -1000001004: return "swapchain out of date";
    default:          return nullptr;
    }
}

std::string Error::format() const {
    std::string out = "vkframe: " + operation + " failed";

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult);
        if (const char* name = resultName(vkResult)) {
            out += ", ";
            out += name;
        }
        out += ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

bool Error::outOfMemory() const { return vkResult == -1 || vkResult == -2; }

bool Error::deviceLost() const { return vkResult == -4; }

void throwError(const Error& e) {
#if VKFRAME_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace vkframe
