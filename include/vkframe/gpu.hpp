#pragma once

#include <vkframe/error.hpp>
#include <vkframe/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>

// Forward-declare VMA handle to avoid pulling vk_mem_alloc.h into user code.
struct VmaAllocation_T;
using VmaAllocation = VmaAllocation_T*;

namespace vkframe {

// How strongly the driver wants a resource to own its memory.
enum class DedicatedAllocation : std::uint8_t {
    Discouraged,
    Preferred,
    Required,
};

struct MemoryRequirements {
    VkDeviceSize        size      = 0;
    VkDeviceSize        alignment = 1;
    DedicatedAllocation dedicated = DedicatedAllocation::Discouraged;
};

// Which memory type family a page is allocated from. Color and depth images
// may live in different memory types on some devices.
enum class MemoryKind : std::uint8_t {
    ColorImage,
    DepthStencilImage,
};

// Everything needed to create a 2D/3D image and its default view.
struct ImageDesc {
    VkFormat              format    = VK_FORMAT_R8G8B8A8_UNORM;
    VkExtent3D            extent    = {1, 1, 1};
    VkImageUsageFlags     usage     = VK_IMAGE_USAGE_SAMPLED_BIT;
    VkImageAspectFlags    aspect    = VK_IMAGE_ASPECT_COLOR_BIT;
    std::uint32_t         mipLevels = 1;
    VkSampleCountFlagBits samples   = VK_SAMPLE_COUNT_1_BIT;
};

// An image bound into memory owned by somebody else (a page).
struct PlacedImage {
    VkImage     handle = VK_NULL_HANDLE;
    VkImageView view   = VK_NULL_HANDLE;
};

// An image that owns its memory.
struct DedicatedImage {
    VkImage       handle = VK_NULL_HANDLE;
    VkImageView   view   = VK_NULL_HANDLE;
    VmaAllocation memory = nullptr;
};

struct BufferDesc {
    VkDeviceSize       size        = 0;
    VkBufferUsageFlags usage       = 0;
    bool               hostVisible = false; // persistently mapped when true
};

struct BufferAllocation {
    VkBuffer      handle = VK_NULL_HANDLE;
    VmaAllocation memory = nullptr;
    void*         mapped = nullptr; // null unless hostVisible
    VkDeviceSize  size   = 0;
};

// Offset alignments the device imposes on buffer sub-ranges.
struct DeviceLimits {
    VkDeviceSize bufferCopyOffsetAlignment  = 4;
    VkDeviceSize texelBufferOffsetAlignment = 16;
    VkDeviceSize uniformBufferOffsetAlignment = 256;
    VkDeviceSize storageBufferOffsetAlignment = 256;
};

// Swapchain outcomes that are routine rather than failures.
enum class SwapchainStatus : std::uint8_t {
    Optimal,
    Suboptimal,
    OutOfDate,
};

struct AcquireResult {
    SwapchainStatus status = SwapchainStatus::Optimal;
    std::uint32_t   index  = 0; // valid unless status == OutOfDate
};

struct SwapchainImage {
    std::uint32_t index  = 0;
    VkImage       image  = VK_NULL_HANDLE;
    VkImageView   view   = VK_NULL_HANDLE;
    VkExtent2D    extent = {0, 0};
};

// One queue submission. Zero command buffers is legal: the batch still
// signals its semaphore/fence once earlier work drains.
struct SubmitDesc {
    const VkCommandBuffer* cmds      = nullptr;
    std::uint32_t          cmdCount  = 0;
    VkSemaphore            wait      = VK_NULL_HANDLE;
    VkPipelineStageFlags2  waitStage = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSemaphore            signal    = VK_NULL_HANDLE;
    VkFence                fence     = VK_NULL_HANDLE;
};

// The graphics-API call layer the frame core drives. Object creation and
// destruction, command recording and presentation live behind this seam so
// the core can run against a real device (VulkanGpu) or a scripted double.
//
// Every call is made from the submission thread. Destroy calls accept
// VK_NULL_HANDLE / nullptr and ignore it.
class Gpu {
public:
    virtual ~Gpu() = default;

    [[nodiscard]] virtual const DeviceLimits& limits() const = 0;

    // True when API validation is on. Allocators use it to recreate memory on
    // reset so validation reports resources still bound to it.
    [[nodiscard]] virtual bool validationEnabled() const = 0;

    // Memory
    // name labels the allocation in debuggers and memory dumps.
    [[nodiscard]] virtual Result<VmaAllocation> allocateMemory(MemoryKind kind,
                                                               VkDeviceSize size,
                                                               const std::string& name) = 0;
    virtual void freeMemory(VmaAllocation memory) = 0;

    // Images
    [[nodiscard]] virtual Result<MemoryRequirements>
    imageMemoryRequirements(const ImageDesc& desc) = 0;
    [[nodiscard]] virtual Result<PlacedImage>
    createPlacedImage(const ImageDesc& desc, VmaAllocation memory, VkDeviceSize offset) = 0;
    [[nodiscard]] virtual Result<DedicatedImage> createDedicatedImage(const ImageDesc& desc,
                                                                      MemoryKind kind) = 0;
    virtual void destroyImage(VkImage image) = 0;
    virtual void destroyImageView(VkImageView view) = 0;
    virtual void destroySampler(VkSampler sampler) = 0;

    // Buffers. The buffer's memory is released separately with freeMemory().
    [[nodiscard]] virtual Result<BufferAllocation> createBuffer(const BufferDesc& desc) = 0;
    virtual void destroyBuffer(VkBuffer buffer) = 0;

    // Synchronization
    [[nodiscard]] virtual Result<VkFence> createFence(bool signaled) = 0;
    virtual void destroyFence(VkFence fence) = 0;
    // Blocks without timeout.
    [[nodiscard]] virtual Result<void> waitForFence(VkFence fence) = 0;
    [[nodiscard]] virtual Result<void> resetFence(VkFence fence) = 0;
    [[nodiscard]] virtual Result<VkSemaphore> createSemaphore() = 0;
    virtual void destroySemaphore(VkSemaphore semaphore) = 0;

    // Commands
    [[nodiscard]] virtual Result<VkCommandPool> createCommandPool() = 0;
    virtual void destroyCommandPool(VkCommandPool pool) = 0;
    [[nodiscard]] virtual Result<void> resetCommandPool(VkCommandPool pool) = 0;
    [[nodiscard]] virtual Result<VkCommandBuffer> allocateCommandBuffer(VkCommandPool pool) = 0;

    // Record a complete command buffer (begin/barrier/end) moving a swapchain
    // image from UNDEFINED to COLOR_ATTACHMENT_OPTIMAL.
    [[nodiscard]] virtual Result<void> recordAcquireTransition(VkCommandBuffer cmd,
                                                               VkImage image) = 0;
    // ... and from COLOR_ATTACHMENT_OPTIMAL to PRESENT_SRC_KHR.
    [[nodiscard]] virtual Result<void> recordPresentTransition(VkCommandBuffer cmd,
                                                               VkImage image) = 0;

    [[nodiscard]] virtual Result<void> submit(const SubmitDesc& desc) = 0;

    // Swapchain
    [[nodiscard]] virtual std::uint32_t swapchainImageCount() const = 0;
    [[nodiscard]] virtual SwapchainImage swapchainImage(std::uint32_t index) const = 0;
    // Blocks until an image is available. Signals imageReady when it is.
    [[nodiscard]] virtual Result<AcquireResult> acquireNextImage(VkSemaphore imageReady) = 0;
    [[nodiscard]] virtual Result<SwapchainStatus> present(std::uint32_t imageIndex,
                                                          VkSemaphore waitFor) = 0;
    // Waits for the device to go idle, then rebuilds the swapchain for extent.
    [[nodiscard]] virtual Result<void> recreateSwapchain(VkExtent2D extent) = 0;

    [[nodiscard]] virtual Result<void> waitIdle() = 0;
};

} // namespace vkframe
