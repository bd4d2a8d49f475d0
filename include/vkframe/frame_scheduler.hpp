#pragma once

#include <vkframe/deferred_deleter.hpp>
#include <vkframe/gpu.hpp>
#include <vkframe/result.hpp>

#include <vulkan/vulkan.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace vkframe {

enum class FrameState : std::uint8_t {
    Idle,      // between endFrame() and beginFrame()
    Acquiring, // slot resources are ours, no swapchain image yet
    Recording, // swapchain image acquired and transitioned
    Submitted, // final batch queued, presenting
};

struct FrameSchedulerOptions {
    std::uint32_t framesInFlight      = 2;
    std::size_t   deleterCapacity     = 256; // per slot
    std::uint8_t  deleterWarnRatio    = 4;
    // Consecutive OutOfDate results tolerated by one acquireImage() call.
    std::uint32_t maxRecreateAttempts = 8;
};

// Returned by beginFrame(). Plain data; the scheduler owns everything.
struct Frame {
    VkCommandBuffer          cmd     = VK_NULL_HANDLE; // reset, not begun
    std::uint32_t            slot    = 0;
    std::uint64_t            number  = 0;
    std::chrono::nanoseconds blocked{0};               // time spent on the slot fence
};

// Frame-in-flight ring. Each slot owns a fence, a command pool with its
// command buffers, an image-available semaphore and a DeferredDeleter.
// Present-ready semaphores are per swapchain image and are rebuilt with the
// swapchain.
//
// Per frame:
//   beginFrame()           wait for the slot's fence, recycle its commands,
//                          flush its deleter
//   acquireImage(extent)   optional; get and transition a swapchain image
//   submit(cmd)            any number of times
//   endFrame(present)      signal the slot fence, present, advance the slot
//
// The CPU records frame N+1 while the GPU drains up to framesInFlight - 1
// earlier frames. Swapchain OutOfDate/Suboptimal never reach the caller;
// they are handled by recreating the swapchain.
//
// Thread safety: thread-confined (submission thread).
class FrameScheduler {
public:
    [[nodiscard]] static Result<FrameScheduler> create(Gpu& gpu,
                                                       const FrameSchedulerOptions& options = {});

    ~FrameScheduler();
    FrameScheduler(FrameScheduler&&) noexcept;
    FrameScheduler& operator=(FrameScheduler&&) noexcept;
    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    // Blocks until the current slot's previous frame has finished on the GPU.
    [[nodiscard]] Result<Frame> beginFrame();

    // extent is the drawable size of the window in pixels and must be
    // non-zero. Recreates the swapchain first if it is out of date.
    [[nodiscard]] Result<SwapchainImage> acquireImage(VkExtent2D extent);

    // Queue a recorded command buffer for this frame.
    [[nodiscard]] Result<void> submit(VkCommandBuffer cmd);

    // Signals the slot fence and, when present is true, presents the
    // acquired image. The slot advances whether or not this succeeds.
    [[nodiscard]] Result<void> endFrame(bool present);

    // Queue for handles the current frame no longer needs. They are
    // destroyed when this slot comes around again.
    [[nodiscard]] DeferredDeleter& deleter();

    // Teardown and diagnostics only.
    [[nodiscard]] Result<void> waitIdle();

    // Force a swapchain rebuild at the next acquireImage() (window resized).
    void markOutOfDate() { outOfDate_ = true; }

    [[nodiscard]] bool          outOfDate()      const { return outOfDate_; }
    [[nodiscard]] std::uint32_t slot()           const { return slot_; }
    [[nodiscard]] std::uint64_t frameNumber()    const { return frameNumber_; }
    [[nodiscard]] FrameState    state()          const { return state_; }
    [[nodiscard]] std::uint32_t framesInFlight() const {
        return static_cast<std::uint32_t>(slots_.size());
    }
    // Time the last ended frame spent blocked on the fence, acquire and
    // present. Feed it to FramePacer::sleep().
    [[nodiscard]] std::chrono::nanoseconds lastFrameBlocked() const { return lastBlocked_; }

private:
    FrameScheduler() = default;
    void destroy();

    struct Slot {
        VkFence         ready          = VK_NULL_HANDLE;
        VkCommandPool   pool           = VK_NULL_HANDLE;
        VkCommandBuffer cmd            = VK_NULL_HANDLE;
        VkCommandBuffer prepare        = VK_NULL_HANDLE;
        VkCommandBuffer finalize       = VK_NULL_HANDLE;
        VkSemaphore     imageAvailable = VK_NULL_HANDLE;
        std::optional<DeferredDeleter> deleter;
    };

    [[nodiscard]] Result<void> createSlotPool(Slot& s);
    [[nodiscard]] Result<void> recycleSlotPool(Slot& s);
    [[nodiscard]] Result<void> rebuildPresentSemaphores();
    [[nodiscard]] Result<void> recreateSwapchain(VkExtent2D extent);
    [[nodiscard]] Result<void> finishAndPresent(Slot& s, bool& fenceQueued);
    void drainImageAvailable(Slot& s);
    void requireState(FrameState expected, const char* operation) const;

    Gpu*                     gpu_ = nullptr;
    FrameSchedulerOptions    options_;
    std::vector<Slot>        slots_;
    std::vector<VkSemaphore> presentReady_; // one per swapchain image
    std::uint32_t            slot_        = 0;
    std::uint64_t            frameNumber_ = 0;
    FrameState               state_       = FrameState::Idle;
    bool                     outOfDate_   = false;
    std::optional<std::uint32_t> imageIndex_;
    std::chrono::nanoseconds blocked_{0};
    std::chrono::nanoseconds lastBlocked_{0};
};

} // namespace vkframe
