#pragma once

#include <vkframe/gpu.hpp>
#include <vkframe/page_allocator.hpp>
#include <vkframe/result.hpp>

#include <vulkan/vulkan.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace vkframe {

// Persistent handle to a window-relative image. Survives recreate(); the
// image it resolves to does not.
enum class RenderTarget : std::uint32_t {};

// What a render target resolves to right now. Invalidated by recreate().
struct RenderTargetState {
    ImageAllocation image;
    VkExtent2D      extent = {0, 0};
};

// A render target declaration. desc.extent is in virtual coordinates.
struct RenderTargetDesc {
    std::string name;
    ImageDesc   image;
};

struct RenderTargetRegistryOptions {
    VkExtent2D           virtualExtent  = {1920, 1080};
    VkExtent2D           physicalExtent = {1920, 1080};
    std::uint32_t        capacity       = 16;
    // Best left with zero initial pages: devices that want dedicated
    // allocations for render targets then never pre-allocate unused pages.
    PageAllocatorOptions allocator;

    // suboptimal() thresholds.
    std::uint32_t             recreateScale = 8;
    std::chrono::milliseconds quiescence{100};
};

// Called after a target is (re)materialized, e.g. to rewrite the bindless
// descriptor slot indexed by the handle.
using RenderTargetListener = std::function<void(RenderTarget, const RenderTargetState&)>;

// Render targets sized against a virtual extent. With a 1920x1080 virtual
// extent a 960x540 target is half the output; when the physical extent
// becomes 3840x2160 it is recreated at 1920x1080.
//
// Thread safety: thread-confined. Call recreate() only once the GPU is done
// with every target (waitIdle).
class RenderTargetRegistry {
public:
    [[nodiscard]] static Result<RenderTargetRegistry> create(
        Gpu& gpu, const RenderTargetRegistryOptions& options);

    ~RenderTargetRegistry();
    RenderTargetRegistry(RenderTargetRegistry&&) noexcept;
    RenderTargetRegistry& operator=(RenderTargetRegistry&&) noexcept;
    RenderTargetRegistry(const RenderTargetRegistry&) = delete;
    RenderTargetRegistry& operator=(const RenderTargetRegistry&) = delete;

    [[nodiscard]] Result<RenderTarget> alloc(const RenderTargetDesc& desc);

    // Marks the target as used.
    [[nodiscard]] RenderTargetState get(RenderTarget target);
    [[nodiscard]] VkExtent2D extent(RenderTarget target) const;

    // Destroys every image, resets the allocator and rebuilds all targets in
    // allocation order at the new physical extent.
    [[nodiscard]] Result<void> recreate(VkExtent2D physicalExtent);

    // True when recreating now gives the best resize experience: the extent
    // changed, is not degenerate, and either grew by more than recreateScale
    // or has been stable for longer than quiescence. sinceLastResize is the
    // time since the surface last changed size.
    [[nodiscard]] bool suboptimal(std::chrono::nanoseconds sinceLastResize,
                                  VkExtent2D candidate) const;

    void setListener(RenderTargetListener listener) { listener_ = std::move(listener); }

    [[nodiscard]] VkExtent2D    physicalExtent() const { return physical_; }
    [[nodiscard]] VkExtent2D    virtualExtent()  const { return virtual_; }
    [[nodiscard]] std::uint32_t size()     const { return static_cast<std::uint32_t>(descs_.size()); }
    [[nodiscard]] std::uint32_t capacity() const { return capacity_; }
    [[nodiscard]] const PageAllocator& allocator() const { return allocator_; }

private:
    explicit RenderTargetRegistry(PageAllocator allocator) : allocator_(std::move(allocator)) {}
    void destroy();
    void destroyImages();
    [[nodiscard]] Result<void> materialize(std::uint32_t index);
    [[nodiscard]] VkExtent2D scaledExtent(std::uint32_t index) const;

    Gpu*                           gpu_ = nullptr;
    std::string                    name_;
    VkExtent2D                     virtual_  = {0, 0};
    VkExtent2D                     physical_ = {0, 0};
    std::uint32_t                  capacity_ = 0;
    std::uint32_t                  recreateScale_ = 8;
    std::chrono::nanoseconds       quiescence_{0};
    std::vector<RenderTargetDesc>  descs_;
    std::vector<ImageAllocation>   images_;
    std::vector<bool>              used_;
    PageAllocator                  allocator_;
    RenderTargetListener           listener_;
};

} // namespace vkframe
