#include <vkframe/render_target_registry.hpp>
#include <vkframe/log.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace vkframe {

static std::uint32_t indexOf(RenderTarget target) {
    return static_cast<std::uint32_t>(target);
}

Result<RenderTargetRegistry> RenderTargetRegistry::create(
    Gpu& gpu, const RenderTargetRegistryOptions& options) {
    if (options.virtualExtent.width == 0 || options.virtualExtent.height == 0) {
        return Error{"create render target registry", 0, "virtual extent must be non-zero"};
    }

    auto allocator = PageAllocator::create(gpu, options.allocator);
    if (!allocator.ok()) return allocator.error();

    log(LogLevel::Debug, "render target registry \"%s\": physical extent %ux%u",
        options.allocator.name.c_str(), options.physicalExtent.width,
        options.physicalExtent.height);

    RenderTargetRegistry registry(std::move(allocator).value());
    registry.gpu_           = &gpu;
    registry.name_          = options.allocator.name;
    registry.virtual_       = options.virtualExtent;
    registry.physical_      = options.physicalExtent;
    registry.capacity_      = options.capacity;
    registry.recreateScale_ = options.recreateScale;
    registry.quiescence_    = options.quiescence;
    registry.descs_.reserve(options.capacity);
    registry.images_.reserve(options.capacity);
    registry.used_.reserve(options.capacity);
    return registry;
}

RenderTargetRegistry::~RenderTargetRegistry() { destroy(); }

void RenderTargetRegistry::destroy() {
    if (gpu_ == nullptr) return;
    for (std::size_t i = 0; i < descs_.size(); ++i) {
        if (!used_[i]) {
            log(LogLevel::Warn, "render target \"%s\" not used", descs_[i].name.c_str());
        }
    }
    destroyImages();
    descs_.clear();
    images_.clear();
    used_.clear();
    gpu_ = nullptr;
}

RenderTargetRegistry::RenderTargetRegistry(RenderTargetRegistry&& o) noexcept
    : gpu_(o.gpu_), name_(std::move(o.name_)), virtual_(o.virtual_), physical_(o.physical_),
      capacity_(o.capacity_), recreateScale_(o.recreateScale_), quiescence_(o.quiescence_),
      descs_(std::move(o.descs_)), images_(std::move(o.images_)), used_(std::move(o.used_)),
      allocator_(std::move(o.allocator_)), listener_(std::move(o.listener_)) {
    o.gpu_ = nullptr;
}

RenderTargetRegistry& RenderTargetRegistry::operator=(RenderTargetRegistry&& o) noexcept {
    if (this != &o) {
        destroy();
        gpu_           = o.gpu_;
        name_          = std::move(o.name_);
        virtual_       = o.virtual_;
        physical_      = o.physical_;
        capacity_      = o.capacity_;
        recreateScale_ = o.recreateScale_;
        quiescence_    = o.quiescence_;
        descs_         = std::move(o.descs_);
        images_        = std::move(o.images_);
        used_          = std::move(o.used_);
        allocator_     = std::move(o.allocator_);
        listener_      = std::move(o.listener_);
        o.gpu_ = nullptr;
    }
    return *this;
}

void RenderTargetRegistry::destroyImages() {
    for (auto& image : images_) {
        gpu_->destroyImageView(image.view);
        gpu_->destroyImage(image.handle);
        image = ImageAllocation{};
    }
}

VkExtent2D RenderTargetRegistry::scaledExtent(std::uint32_t index) const {
    const VkExtent3D& v = descs_[index].image.extent;
    float xScale = static_cast<float>(physical_.width) / static_cast<float>(virtual_.width);
    float yScale = static_cast<float>(physical_.height) / static_cast<float>(virtual_.height);
    return VkExtent2D{
        static_cast<std::uint32_t>(xScale * static_cast<float>(v.width)),
        static_cast<std::uint32_t>(yScale * static_cast<float>(v.height)),
    };
}

Result<void> RenderTargetRegistry::materialize(std::uint32_t index) {
    VkExtent2D scaled = scaledExtent(index);

    ImageDesc desc = descs_[index].image;
    desc.extent.width  = std::max(scaled.width, 1u);
    desc.extent.height = std::max(scaled.height, 1u);

    auto image = allocator_.alloc(descs_[index].name, desc);
    if (!image.ok()) return image.error();
    images_[index] = image.value();

    if (listener_) {
        listener_(static_cast<RenderTarget>(index), RenderTargetState{images_[index], scaled});
    }
    return {};
}

Result<RenderTarget> RenderTargetRegistry::alloc(const RenderTargetDesc& desc) {
    if (descs_.size() == capacity_) {
        throwError(Error{"allocate render target \"" + desc.name + "\"", 0,
                         "registry \"" + name_ + "\" is at capacity (" +
                         std::to_string(capacity_) + ")"});
    }

    auto index = static_cast<std::uint32_t>(descs_.size());
    descs_.push_back(desc);
    images_.emplace_back();
    used_.push_back(false);

    auto r = materialize(index);
    if (!r.ok()) {
        descs_.pop_back();
        images_.pop_back();
        used_.pop_back();
        return r.error();
    }
    return static_cast<RenderTarget>(index);
}

RenderTargetState RenderTargetRegistry::get(RenderTarget target) {
    std::uint32_t index = indexOf(target);
    used_[index] = true;
    return RenderTargetState{images_[index], scaledExtent(index)};
}

VkExtent2D RenderTargetRegistry::extent(RenderTarget target) const {
    return scaledExtent(indexOf(target));
}

Result<void> RenderTargetRegistry::recreate(VkExtent2D physicalExtent) {
    log(LogLevel::Info, "recreating render targets \"%s\" at %ux%u", name_.c_str(),
        physicalExtent.width, physicalExtent.height);

    physical_ = physicalExtent;

    destroyImages();
    auto r = allocator_.reset();
    if (!r.ok()) return r;

    for (std::uint32_t i = 0; i < size(); ++i) {
        r = materialize(i);
        if (!r.ok()) return r;
    }
    return {};
}

bool RenderTargetRegistry::suboptimal(std::chrono::nanoseconds sinceLastResize,
                                      VkExtent2D candidate) const {
    if (candidate.width == physical_.width && candidate.height == physical_.height) return false;
    if (candidate.width == 0 || candidate.height == 0) return false;

    // Coming back from a minimized (zero-sized) surface is always worth it.
    if (physical_.width == 0 || physical_.height == 0) return true;

    // While a drag-resize is in progress only a drastic jump is worth the
    // stall. The timer is supplied by the caller because some platforms stop
    // the game loop during a resize.
    std::uint32_t scale = std::max(candidate.width / physical_.width,
                                   candidate.height / physical_.height);
    return scale > recreateScale_ || sinceLastResize > quiescence_;
}

} // namespace vkframe
