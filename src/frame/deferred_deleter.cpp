#include <vkframe/deferred_deleter.hpp>
#include <vkframe/log.hpp>

#include <cstring>
#include <string>
#include <utility>

namespace vkframe {

// Handles are pointers on the 64-bit targets vkframe supports, so they
// round-trip through the raw value.
static_assert(sizeof(VkImage) == sizeof(std::uint64_t), "VkImage must be 64 bits");

template <typename Handle>
static std::uint64_t toRaw(Handle handle) {
    std::uint64_t value{};
    std::memcpy(&value, &handle, sizeof(handle));
    return value;
}

template <typename Handle>
static Handle fromRaw(std::uint64_t value) {
    Handle handle{};
    std::memcpy(&handle, &value, sizeof(handle));
    return handle;
}

DeferredDeleter::DeferredDeleter(Gpu& gpu, std::size_t capacity, std::uint8_t warnRatio)
    : gpu_(&gpu), capacity_(capacity), warnRatio_(warnRatio) {
    pending_.reserve(capacity);
}

DeferredDeleter::~DeferredDeleter() {
    if (gpu_ != nullptr) reset();
}

DeferredDeleter::DeferredDeleter(DeferredDeleter&& o) noexcept
    : gpu_(o.gpu_), capacity_(o.capacity_), warnRatio_(o.warnRatio_),
      pending_(std::move(o.pending_)) {
    o.gpu_ = nullptr;
    o.pending_.clear();
}

DeferredDeleter& DeferredDeleter::operator=(DeferredDeleter&& o) noexcept {
    if (this != &o) {
        if (gpu_ != nullptr) reset();
        gpu_       = o.gpu_;
        capacity_  = o.capacity_;
        warnRatio_ = o.warnRatio_;
        pending_   = std::move(o.pending_);
        o.gpu_ = nullptr;
        o.pending_.clear();
    }
    return *this;
}

void DeferredDeleter::push(HandleKind kind, std::uint64_t value) {
    if (value == 0) return;
    if (pending_.size() == capacity_) {
        throwError(Error{"append to deferred deleter", 0,
                         "capacity of " + std::to_string(capacity_) +
                         " handles exceeded; raise deleterCapacity"});
    }
    pending_.push_back(PendingDestroy{kind, value});
}

void DeferredDeleter::append(VkImage image)         { push(HandleKind::Image, toRaw(image)); }
void DeferredDeleter::append(VkImageView view)      { push(HandleKind::ImageView, toRaw(view)); }
void DeferredDeleter::append(VkBuffer buffer)       { push(HandleKind::Buffer, toRaw(buffer)); }
void DeferredDeleter::append(VmaAllocation memory)  { push(HandleKind::Memory, toRaw(memory)); }
void DeferredDeleter::append(VkSampler sampler)     { push(HandleKind::Sampler, toRaw(sampler)); }
void DeferredDeleter::append(VkSemaphore semaphore) { push(HandleKind::Semaphore, toRaw(semaphore)); }
void DeferredDeleter::append(VkFence fence)         { push(HandleKind::Fence, toRaw(fence)); }
void DeferredDeleter::append(VkCommandPool pool)    { push(HandleKind::CommandPool, toRaw(pool)); }

void DeferredDeleter::destroy(const PendingDestroy& entry) {
    switch (entry.kind) {
    case HandleKind::Image:
        gpu_->destroyImage(fromRaw<VkImage>(entry.value));
        break;
    case HandleKind::ImageView:
        gpu_->destroyImageView(fromRaw<VkImageView>(entry.value));
        break;
    case HandleKind::Buffer:
        gpu_->destroyBuffer(fromRaw<VkBuffer>(entry.value));
        break;
    case HandleKind::Memory:
        gpu_->freeMemory(fromRaw<VmaAllocation>(entry.value));
        break;
    case HandleKind::Sampler:
        gpu_->destroySampler(fromRaw<VkSampler>(entry.value));
        break;
    case HandleKind::Semaphore:
        gpu_->destroySemaphore(fromRaw<VkSemaphore>(entry.value));
        break;
    case HandleKind::Fence:
        gpu_->destroyFence(fromRaw<VkFence>(entry.value));
        break;
    case HandleKind::CommandPool:
        gpu_->destroyCommandPool(fromRaw<VkCommandPool>(entry.value));
        break;
    }
}

void DeferredDeleter::reset() {
    if (warnRatio_ != 0 && pending_.size() > capacity_ / warnRatio_) {
        log(LogLevel::Warn, "deferred deleter %p past 1/%u capacity (%zu of %zu)",
            static_cast<const void*>(this), static_cast<unsigned>(warnRatio_),
            pending_.size(), capacity_);
    }
    for (const auto& entry : pending_) {
        destroy(entry);
    }
    pending_.clear();
}

} // namespace vkframe
