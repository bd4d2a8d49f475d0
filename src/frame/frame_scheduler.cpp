#include <vkframe/frame_scheduler.hpp>
#include <vkframe/log.hpp>

#include <string>
#include <utility>

namespace vkframe {

using Clock = std::chrono::steady_clock;

static const char* stateName(FrameState state) {
    switch (state) {
    case FrameState::Idle:      return "Idle";
    case FrameState::Acquiring: return "Acquiring";
    case FrameState::Recording: return "Recording";
    case FrameState::Submitted: return "Submitted";
    }
    return "?";
}

static std::chrono::nanoseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);
}

Result<FrameScheduler> FrameScheduler::create(Gpu& gpu, const FrameSchedulerOptions& options) {
    if (options.framesInFlight == 0) {
        return Error{"create frame scheduler", 0, "framesInFlight must be at least 1"};
    }

    FrameScheduler fs;
    fs.gpu_     = &gpu;
    fs.options_ = options;
    fs.slots_.resize(options.framesInFlight);

    for (std::uint32_t i = 0; i < options.framesInFlight; ++i) {
        Slot& s = fs.slots_[i];

        // Signaled so the first beginFrame() on every slot goes straight through.
        auto fence = gpu.createFence(true);
        if (!fence.ok()) return fence.error();
        s.ready = fence.value();

        auto sem = gpu.createSemaphore();
        if (!sem.ok()) return sem.error();
        s.imageAvailable = sem.value();

        auto pool = fs.createSlotPool(s);
        if (!pool.ok()) return pool.error();

        s.deleter.emplace(gpu, options.deleterCapacity, options.deleterWarnRatio);
    }

    auto present = fs.rebuildPresentSemaphores();
    if (!present.ok()) return present.error();

    log(LogLevel::Debug, "frame scheduler: %u frames in flight, %zu present semaphores",
        options.framesInFlight, fs.presentReady_.size());
    return fs;
}

FrameScheduler::~FrameScheduler() { destroy(); }

void FrameScheduler::destroy() {
    if (gpu_ == nullptr) return;

    auto idle = gpu_->waitIdle();
    if (!idle.ok()) {
        log(LogLevel::Error, "frame scheduler teardown: %s", idle.error().format().c_str());
    }

    for (auto& s : slots_) {
        s.deleter.reset();
        gpu_->destroySemaphore(s.imageAvailable);
        gpu_->destroyCommandPool(s.pool);
        gpu_->destroyFence(s.ready);
    }
    for (auto sem : presentReady_) gpu_->destroySemaphore(sem);

    slots_.clear();
    presentReady_.clear();
    gpu_ = nullptr;
}

FrameScheduler::FrameScheduler(FrameScheduler&& o) noexcept
    : gpu_(o.gpu_), options_(o.options_), slots_(std::move(o.slots_)),
      presentReady_(std::move(o.presentReady_)), slot_(o.slot_),
      frameNumber_(o.frameNumber_), state_(o.state_), outOfDate_(o.outOfDate_),
      imageIndex_(o.imageIndex_), blocked_(o.blocked_), lastBlocked_(o.lastBlocked_) {
    o.gpu_ = nullptr;
}

FrameScheduler& FrameScheduler::operator=(FrameScheduler&& o) noexcept {
    if (this != &o) {
        destroy();
        gpu_          = o.gpu_;
        options_      = o.options_;
        slots_        = std::move(o.slots_);
        presentReady_ = std::move(o.presentReady_);
        slot_         = o.slot_;
        frameNumber_  = o.frameNumber_;
        state_        = o.state_;
        outOfDate_    = o.outOfDate_;
        imageIndex_   = o.imageIndex_;
        blocked_      = o.blocked_;
        lastBlocked_  = o.lastBlocked_;
        o.gpu_ = nullptr;
    }
    return *this;
}

void FrameScheduler::requireState(FrameState expected, const char* operation) const {
    if (state_ != expected) {
        throwError(Error{operation, 0,
                         std::string("frame is ") + stateName(state_) + ", expected " +
                         stateName(expected)});
    }
}

Result<void> FrameScheduler::createSlotPool(Slot& s) {
    auto pool = gpu_->createCommandPool();
    if (!pool.ok()) return pool.error();
    s.pool = pool.value();

    VkCommandBuffer* cmds[] = {&s.cmd, &s.prepare, &s.finalize};
    for (VkCommandBuffer* cmd : cmds) {
        auto cb = gpu_->allocateCommandBuffer(s.pool);
        if (!cb.ok()) return cb.error();
        *cmd = cb.value();
    }
    return {};
}

Result<void> FrameScheduler::recycleSlotPool(Slot& s) {
    if (!gpu_->validationEnabled()) {
        return gpu_->resetCommandPool(s.pool);
    }

    // Validation does not flag command buffers recorded before a pool reset
    // and submitted after it. Recreating the pool turns that into a
    // use-after-destroy it does report.
    gpu_->destroyCommandPool(s.pool);
    s.pool     = VK_NULL_HANDLE;
    s.cmd      = VK_NULL_HANDLE;
    s.prepare  = VK_NULL_HANDLE;
    s.finalize = VK_NULL_HANDLE;
    return createSlotPool(s);
}

Result<void> FrameScheduler::rebuildPresentSemaphores() {
    for (auto sem : presentReady_) gpu_->destroySemaphore(sem);
    presentReady_.clear();

    std::uint32_t count = gpu_->swapchainImageCount();
    presentReady_.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        auto sem = gpu_->createSemaphore();
        if (!sem.ok()) return sem.error();
        presentReady_.push_back(sem.value());
    }
    return {};
}

Result<void> FrameScheduler::recreateSwapchain(VkExtent2D extent) {
    log(LogLevel::Debug, "recreating swapchain at %ux%u", extent.width, extent.height);

    // The collaborator waits for the device to go idle, so nothing can still
    // be waiting on the old present semaphores.
    auto r = gpu_->recreateSwapchain(extent);
    if (!r.ok()) return r;

    r = rebuildPresentSemaphores();
    if (!r.ok()) return r;

    outOfDate_ = false;
    return {};
}

Result<Frame> FrameScheduler::beginFrame() {
    requireState(FrameState::Idle, "begin frame");
    Slot& s = slots_[slot_];

    auto start = Clock::now();
    auto r = gpu_->waitForFence(s.ready);
    blocked_ = since(start);
    if (!r.ok()) return r.error();

    r = recycleSlotPool(s);
    if (!r.ok()) return r.error();

    s.deleter->reset();

    // Last, so a failure above leaves the fence signaled and a retried
    // beginFrame() does not wait on it forever.
    r = gpu_->resetFence(s.ready);
    if (!r.ok()) return r.error();

    imageIndex_.reset();
    state_ = FrameState::Acquiring;

    Frame frame;
    frame.cmd     = s.cmd;
    frame.slot    = slot_;
    frame.number  = frameNumber_;
    frame.blocked = blocked_;
    return frame;
}

Result<SwapchainImage> FrameScheduler::acquireImage(VkExtent2D extent) {
    requireState(FrameState::Acquiring, "acquire swapchain image");
    if (extent.width == 0 || extent.height == 0) {
        return Error{"acquire swapchain image", 0,
                     "extent " + std::to_string(extent.width) + "x" +
                     std::to_string(extent.height) + " has no area"};
    }
    Slot& s = slots_[slot_];

    auto start = Clock::now();
    if (outOfDate_) {
        auto r = recreateSwapchain(extent);
        if (!r.ok()) {
            blocked_ += since(start);
            return r.error();
        }
    }

    if (imageIndex_) {
        return Error{"acquire swapchain image", 0,
                     "image " + std::to_string(*imageIndex_) +
                     " is already held by this frame, end it first"};
    }

    std::uint32_t attempts = 0;
    std::uint32_t index    = 0;
    for (;;) {
        auto acquired = gpu_->acquireNextImage(s.imageAvailable);
        if (!acquired.ok()) {
            blocked_ += since(start);
            return acquired.error();
        }
        if (acquired.value().status != SwapchainStatus::OutOfDate) {
            // Suboptimal still hands out a usable image; present() reports it again.
            index = acquired.value().index;
            break;
        }
        if (++attempts > options_.maxRecreateAttempts) {
            throwError(Error{"acquire swapchain image",
                             static_cast<std::int32_t>(VK_ERROR_OUT_OF_DATE_KHR),
                             "swapchain still out of date after " +
                             std::to_string(options_.maxRecreateAttempts) + " recreations"});
        }
        auto r = recreateSwapchain(extent);
        if (!r.ok()) {
            blocked_ += since(start);
            return r.error();
        }
    }
    blocked_ += since(start);

    // The image is ours from here on; endFrame() reports it if it never
    // reaches present().
    imageIndex_ = index;
    SwapchainImage image = gpu_->swapchainImage(index);

    auto rec = gpu_->recordAcquireTransition(s.prepare, image.image);
    if (!rec.ok()) {
        drainImageAvailable(s);
        return rec.error();
    }

    SubmitDesc desc;
    desc.cmds     = &s.prepare;
    desc.cmdCount = 1;
    desc.wait     = s.imageAvailable;
    auto sub = gpu_->submit(desc);
    if (!sub.ok()) {
        drainImageAvailable(s);
        return sub.error();
    }

    state_ = FrameState::Recording;
    return image;
}

void FrameScheduler::drainImageAvailable(Slot& s) {
    // Acquire signaled the semaphore; it must be waited on before the slot
    // acquires with it again.
    SubmitDesc desc;
    desc.wait = s.imageAvailable;
    auto r = gpu_->submit(desc);
    if (!r.ok()) {
        log(LogLevel::Error, "slot %u: image-available semaphore left signaled: %s", slot_,
            r.error().format().c_str());
    }
}

Result<void> FrameScheduler::submit(VkCommandBuffer cmd) {
    if (state_ != FrameState::Acquiring && state_ != FrameState::Recording) {
        throwError(Error{"submit", 0,
                         std::string("frame is ") + stateName(state_) +
                         ", call beginFrame() first"});
    }
    SubmitDesc desc;
    desc.cmds     = &cmd;
    desc.cmdCount = 1;
    return gpu_->submit(desc);
}

Result<void> FrameScheduler::finishAndPresent(Slot& s, bool& fenceQueued) {
    const std::uint32_t index = *imageIndex_;
    SwapchainImage image = gpu_->swapchainImage(index);

    auto r = gpu_->recordPresentTransition(s.finalize, image.image);
    if (!r.ok()) return r;

    SubmitDesc desc;
    desc.cmds     = &s.finalize;
    desc.cmdCount = 1;
    desc.signal   = presentReady_[index];
    desc.fence    = s.ready;
    r = gpu_->submit(desc);
    if (!r.ok()) return r;
    fenceQueued = true;
    state_ = FrameState::Submitted;

    // Some drivers block here rather than in acquire.
    auto start = Clock::now();
    auto status = gpu_->present(index, presentReady_[index]);
    blocked_ += since(start);
    if (!status.ok()) return status.error();

    if (status.value() != SwapchainStatus::Optimal) {
        outOfDate_ = true;
    }
    return {};
}

Result<void> FrameScheduler::endFrame(bool present) {
    if (state_ != FrameState::Acquiring && state_ != FrameState::Recording) {
        throwError(Error{"end frame", 0,
                         std::string("frame is ") + stateName(state_) +
                         ", call beginFrame() first"});
    }
    if (present && state_ != FrameState::Recording) {
        throwError(Error{"end frame", 0, "present requested but no image is ready to present"});
    }

    Slot& s = slots_[slot_];
    const bool abandonedImage = !present && imageIndex_.has_value();

    Result<void> result;
    bool fenceQueued = false;
    if (present) {
        result = finishAndPresent(s, fenceQueued);
    }
    if (!fenceQueued) {
        // Nothing else will signal the slot fence; an empty batch does once
        // the queue drains.
        SubmitDesc desc;
        desc.fence = s.ready;
        auto r = gpu_->submit(desc);
        if (!r.ok() && result.ok()) result = std::move(r);
    }

    lastBlocked_ = blocked_;
    blocked_     = std::chrono::nanoseconds{0};
    slot_        = (slot_ + 1) % framesInFlight();
    ++frameNumber_;
    imageIndex_.reset();
    state_ = FrameState::Idle;

    if (abandonedImage && result.ok()) {
        return Error{"end frame", 0, "acquired swapchain image was not presented"};
    }
    return result;
}

DeferredDeleter& FrameScheduler::deleter() {
    return *slots_[slot_].deleter;
}

Result<void> FrameScheduler::waitIdle() {
    return gpu_->waitIdle();
}

} // namespace vkframe
