#pragma once

#include <vkframe/gpu.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace vkframe {

// The closed set of handle kinds a DeferredDeleter knows how to destroy.
enum class HandleKind : std::uint8_t {
    Image,
    ImageView,
    Buffer,
    Memory,
    Sampler,
    Semaphore,
    Fence,
    CommandPool,
};

// One queued destruction: the kind tag plus the handle's raw 64-bit value.
struct PendingDestroy {
    HandleKind    kind;
    std::uint64_t value;
};

namespace detail {

template <typename T, typename = void>
struct HasHandle : std::false_type {};
template <typename T>
struct HasHandle<T, std::void_t<decltype(std::declval<const T&>().handle)>> : std::true_type {};

template <typename T, typename = void>
struct HasView : std::false_type {};
template <typename T>
struct HasView<T, std::void_t<decltype(std::declval<const T&>().view)>> : std::true_type {};

template <typename T, typename = void>
struct HasMemory : std::false_type {};
template <typename T>
struct HasMemory<T, std::void_t<decltype(std::declval<const T&>().memory)>> : std::true_type {};

} // namespace detail

// One append() overload per handle kind needs every non-dispatchable handle
// to be its own pointer type, which Vulkan only guarantees on 64-bit targets.
static_assert(!std::is_same_v<VkImage, VkBuffer> && !std::is_same_v<VkFence, VkSemaphore>,
              "vkframe supports 64-bit targets only");

// Delays destruction of GPU handles until the GPU can no longer be using
// them. Keep one per frame in flight and reset it when that slot is begun
// again; anything appended during a frame is then destroyed exactly
// framesInFlight frames later.
//
// Storage is reserved once at construction. Appending past capacity is a
// caller error, never a reallocation, so the per-frame path stays
// allocation-free.
//
// Thread safety: thread-confined (render loop thread).
class DeferredDeleter {
public:
    // warnRatio: reset() warns when more than capacity / warnRatio entries
    // were queued. Zero disables the warning.
    DeferredDeleter(Gpu& gpu, std::size_t capacity, std::uint8_t warnRatio = 4);
    ~DeferredDeleter();
    DeferredDeleter(DeferredDeleter&&) noexcept;
    DeferredDeleter& operator=(DeferredDeleter&&) noexcept;
    DeferredDeleter(const DeferredDeleter&) = delete;
    DeferredDeleter& operator=(const DeferredDeleter&) = delete;

    void append(VkImage image);
    void append(VkImageView view);
    void append(VkBuffer buffer);
    void append(VmaAllocation memory);
    void append(VkSampler sampler);
    void append(VkSemaphore semaphore);
    void append(VkFence fence);
    void append(VkCommandPool pool);

    // Composite resources (PlacedImage, DedicatedImage, BufferAllocation, ...)
    // are split into their handle, then view, then memory fields.
    template <typename Composite,
              typename = std::enable_if_t<detail::HasHandle<Composite>::value>>
    void append(const Composite& resource) {
        append(resource.handle);
        if constexpr (detail::HasView<Composite>::value) {
            append(resource.view);
        }
        if constexpr (detail::HasMemory<Composite>::value) {
            append(resource.memory);
        }
    }

    // Destroys everything queued, in insertion order, and empties the queue.
    void reset();

    [[nodiscard]] std::size_t size()     const { return pending_.size(); }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] bool        empty()    const { return pending_.empty(); }
    [[nodiscard]] const std::vector<PendingDestroy>& pending() const { return pending_; }

private:
    void push(HandleKind kind, std::uint64_t value);
    void destroy(const PendingDestroy& entry);

    Gpu*                        gpu_       = nullptr;
    std::size_t                 capacity_  = 0;
    std::uint8_t                warnRatio_ = 4;
    std::vector<PendingDestroy> pending_;
};

} // namespace vkframe
