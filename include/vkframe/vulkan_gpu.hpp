#pragma once

#include <vkframe/gpu.hpp>
#include <vkframe/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct SDL_Window;

struct VmaAllocator_T;
using VmaAllocator = VmaAllocator_T*;

namespace vkframe {

enum class PresentMode : std::uint8_t {
    Fifo,          // vsync, always available
    Mailbox,       // triple-buffered vsync
    Immediate,     // no vsync
    MailboxOrFifo, // try mailbox, fall back to fifo
};

struct VulkanGpuOptions {
    std::string   appName     = "vkframe";
    // Falls back to off with a warning when the layer is not installed.
    bool          validation  = false;
    // Report the largest of the device's offset alignments for every usage
    // class. Catches partition bugs that only show up on stricter hardware.
    bool          forceMaxAlignment = false;
    PresentMode   presentMode = PresentMode::MailboxOrFifo;
    std::uint32_t imageCount  = 0; // 0 = minImageCount + 1
};

// Vulkan 1.3 implementation of Gpu: one graphics+present queue,
// synchronization2 and dynamic rendering, VMA for memory, and a swapchain on
// an SDL3 window.
//
// Not movable: frame objects keep a Gpu& to it, so it lives in a unique_ptr.
//
// Thread safety: thread-confined (submission thread).
class VulkanGpu final : public Gpu {
public:
    // window must have been created with SDL_WINDOW_VULKAN and must outlive
    // the returned object.
    [[nodiscard]] static Result<std::unique_ptr<VulkanGpu>> create(
        SDL_Window* window, const VulkanGpuOptions& options = {});

    ~VulkanGpu() override;
    VulkanGpu(const VulkanGpu&) = delete;
    VulkanGpu& operator=(const VulkanGpu&) = delete;

    [[nodiscard]] const DeviceLimits& limits() const override { return limits_; }
    [[nodiscard]] bool validationEnabled() const override { return validation_; }

    [[nodiscard]] Result<VmaAllocation> allocateMemory(MemoryKind kind,
                                                       VkDeviceSize size,
                                                       const std::string& name) override;
    void freeMemory(VmaAllocation memory) override;

    [[nodiscard]] Result<MemoryRequirements> imageMemoryRequirements(const ImageDesc& desc) override;
    [[nodiscard]] Result<PlacedImage> createPlacedImage(const ImageDesc& desc,
                                                        VmaAllocation memory,
                                                        VkDeviceSize offset) override;
    [[nodiscard]] Result<DedicatedImage> createDedicatedImage(const ImageDesc& desc,
                                                              MemoryKind kind) override;
    void destroyImage(VkImage image) override;
    void destroyImageView(VkImageView view) override;
    void destroySampler(VkSampler sampler) override;

    [[nodiscard]] Result<BufferAllocation> createBuffer(const BufferDesc& desc) override;
    void destroyBuffer(VkBuffer buffer) override;

    [[nodiscard]] Result<VkFence> createFence(bool signaled) override;
    void destroyFence(VkFence fence) override;
    [[nodiscard]] Result<void> waitForFence(VkFence fence) override;
    [[nodiscard]] Result<void> resetFence(VkFence fence) override;
    [[nodiscard]] Result<VkSemaphore> createSemaphore() override;
    void destroySemaphore(VkSemaphore semaphore) override;

    [[nodiscard]] Result<VkCommandPool> createCommandPool() override;
    void destroyCommandPool(VkCommandPool pool) override;
    [[nodiscard]] Result<void> resetCommandPool(VkCommandPool pool) override;
    [[nodiscard]] Result<VkCommandBuffer> allocateCommandBuffer(VkCommandPool pool) override;
    [[nodiscard]] Result<void> recordAcquireTransition(VkCommandBuffer cmd, VkImage image) override;
    [[nodiscard]] Result<void> recordPresentTransition(VkCommandBuffer cmd, VkImage image) override;

    [[nodiscard]] Result<void> submit(const SubmitDesc& desc) override;

    [[nodiscard]] std::uint32_t swapchainImageCount() const override {
        return static_cast<std::uint32_t>(images_.size());
    }
    [[nodiscard]] SwapchainImage swapchainImage(std::uint32_t index) const override;
    [[nodiscard]] Result<AcquireResult> acquireNextImage(VkSemaphore imageReady) override;
    [[nodiscard]] Result<SwapchainStatus> present(std::uint32_t imageIndex,
                                                  VkSemaphore waitFor) override;
    [[nodiscard]] Result<void> recreateSwapchain(VkExtent2D extent) override;

    [[nodiscard]] Result<void> waitIdle() override;

    [[nodiscard]] VkInstance       vkInstance()       const { return instance_; }
    [[nodiscard]] VkPhysicalDevice vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] VkDevice         vkDevice()         const { return device_; }
    [[nodiscard]] VkQueue          queue()            const { return queue_; }
    [[nodiscard]] std::uint32_t    queueFamily()      const { return queueFamily_; }
    [[nodiscard]] VmaAllocator     vmaAllocator()     const { return allocator_; }
    [[nodiscard]] VkFormat         swapchainFormat()  const { return format_; }
    [[nodiscard]] VkExtent2D       swapchainExtent()  const { return extent_; }
    [[nodiscard]] const std::string& gpuName()        const { return gpuName_; }

private:
    VulkanGpu() = default;

    [[nodiscard]] Result<void> createInstance(const VulkanGpuOptions& options);
    [[nodiscard]] Result<void> createSurface(SDL_Window* window);
    [[nodiscard]] Result<void> pickPhysicalDevice();
    [[nodiscard]] Result<void> createDevice(const VulkanGpuOptions& options);
    [[nodiscard]] Result<void> createAllocator();
    [[nodiscard]] Result<void> queryPageMemoryTypes();
    [[nodiscard]] Result<void> createSwapchain(VkExtent2D extent);
    [[nodiscard]] Result<VkImageView> createView(VkImage image, const ImageDesc& desc);
    void destroySwapchainViews();

    VkInstance               instance_       = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_      = VK_NULL_HANDLE;
    VkSurfaceKHR             surface_        = VK_NULL_HANDLE;
    VkPhysicalDevice         physicalDevice_ = VK_NULL_HANDLE;
    VkDevice                 device_         = VK_NULL_HANDLE;
    VkQueue                  queue_          = VK_NULL_HANDLE;
    std::uint32_t            queueFamily_    = UINT32_MAX;
    VmaAllocator             allocator_      = nullptr;
    std::string              gpuName_;
    DeviceLimits             limits_;
    bool                     validation_     = false;

    // Memory types a page of each MemoryKind may come from.
    std::uint32_t colorTypeBits_ = 0;
    std::uint32_t depthTypeBits_ = 0;

    VkSwapchainKHR           swapchain_   = VK_NULL_HANDLE;
    VkFormat                 format_      = VK_FORMAT_UNDEFINED;
    VkColorSpaceKHR          colorSpace_  = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    VkPresentModeKHR         presentMode_ = VK_PRESENT_MODE_FIFO_KHR;
    std::uint32_t            imageCountRequested_ = 0;
    VkExtent2D               extent_      = {0, 0};
    std::vector<VkImage>     images_;
    std::vector<VkImageView> views_;
};

} // namespace vkframe
