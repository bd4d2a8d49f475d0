#include <vkframe/page_allocator.hpp>
#include <vkframe/log.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace vkframe {

static VkDeviceSize alignUp(VkDeviceSize value, VkDeviceSize alignment) {
    if (alignment <= 1) return value;
    return (value + alignment - 1) / alignment * alignment;
}

static const char* dedicationName(DedicatedAllocation d) {
    switch (d) {
    case DedicatedAllocation::Preferred: return "prefers";
    case DedicatedAllocation::Required:  return "requires";
    default:                             return "discourages";
    }
}

Result<PageAllocator> PageAllocator::create(Gpu& gpu, const PageAllocatorOptions& options) {
    if (options.pageSize == 0) {
        return Error{"create page allocator", 0, "pageSize must be non-zero"};
    }
    if (options.initialPages > options.maxPages) {
        return Error{"create page allocator", 0,
                     "initialPages (" + std::to_string(options.initialPages) +
                     ") exceeds maxPages (" + std::to_string(options.maxPages) + ")"};
    }

    PageAllocator pa;
    pa.gpu_     = &gpu;
    pa.options_ = options;
    pa.pages_.reserve(options.maxPages);
    pa.available_.reserve(options.maxPages);
    pa.full_.reserve(options.maxPages);

    for (std::uint32_t i = 0; i < options.initialPages; ++i) {
        auto id = pa.addPage();
        if (!id.ok()) {
            pa.used_ = true; // no point warning about an allocator that never came up
            return id.error();
        }
        pa.available_.push_back(id.value());
    }

    return pa;
}

PageAllocator::~PageAllocator() { destroy(); }

void PageAllocator::destroy() {
    if (gpu_ == nullptr) return;
    if (!used_) {
        log(LogLevel::Warn, "page allocator \"%s\" not used", options_.name.c_str());
    }
    for (auto id : available_) releasePage(id);
    for (auto id : full_) releasePage(id);
    available_.clear();
    full_.clear();
    pages_.clear();
    freeSlots_.clear();
    gpu_ = nullptr;
}

PageAllocator::PageAllocator(PageAllocator&& o) noexcept
    : gpu_(o.gpu_), options_(std::move(o.options_)), pages_(std::move(o.pages_)),
      freeSlots_(std::move(o.freeSlots_)), available_(std::move(o.available_)),
      full_(std::move(o.full_)), offset_(o.offset_), used_(o.used_) {
    o.gpu_ = nullptr;
}

PageAllocator& PageAllocator::operator=(PageAllocator&& o) noexcept {
    if (this != &o) {
        destroy();
        gpu_       = o.gpu_;
        options_   = std::move(o.options_);
        pages_     = std::move(o.pages_);
        freeSlots_ = std::move(o.freeSlots_);
        available_ = std::move(o.available_);
        full_      = std::move(o.full_);
        offset_    = o.offset_;
        used_      = o.used_;
        o.gpu_ = nullptr;
    }
    return *this;
}

std::uint32_t PageAllocator::pageCount() const {
    return static_cast<std::uint32_t>(available_.size() + full_.size());
}

std::uint32_t PageAllocator::storePage(Page page) {
    if (!freeSlots_.empty()) {
        std::uint32_t id = freeSlots_.back();
        freeSlots_.pop_back();
        pages_[id] = std::move(page);
        return id;
    }
    pages_.push_back(std::move(page));
    return static_cast<std::uint32_t>(pages_.size() - 1);
}

void PageAllocator::releasePage(std::uint32_t id) {
    Page& page = pages_[id];
    gpu_->freeMemory(page.memory);
    page = Page{};
    freeSlots_.push_back(id);
}

Result<std::uint32_t> PageAllocator::addPage() {
    if (pageCount() >= options_.maxPages) {
        throwError(Error{"add page to \"" + options_.name + "\"", 0,
                         "maxPages (" + std::to_string(options_.maxPages) + ") exceeded"});
    }
    Page page;
    page.dedicated = false;
    page.name      = options_.name + "[" + std::to_string(pageCount()) + "]";

    auto memory = gpu_->allocateMemory(options_.kind, options_.pageSize, page.name);
    if (!memory.ok()) return memory.error();
    page.memory = memory.value();
    return storePage(std::move(page));
}

Result<std::uint32_t> PageAllocator::peekPage() {
    if (available_.empty()) {
        // Running dry after pages were handed out means initialPages was too
        // small. An allocator created empty is expected to grow on demand.
        if (!full_.empty()) {
            log(LogLevel::Warn, "%s: out of page memory, making dynamic allocation",
                options_.name.c_str());
        }
        auto id = addPage();
        if (!id.ok()) return id.error();
        available_.push_back(id.value());
    }
    return available_.back();
}

Result<void> PageAllocator::renewPage(std::uint32_t id) {
    if (!gpu_->validationEnabled()) return {};

    // With validation on, swap in fresh memory so anything still bound to
    // the old allocation is reported when it is next used.
    Page& page = pages_[id];
    auto memory = gpu_->allocateMemory(options_.kind, options_.pageSize, page.name);
    if (!memory.ok()) return memory.error();
    gpu_->freeMemory(page.memory);
    page.memory = memory.value();
    return {};
}

Result<ImageAllocation> PageAllocator::alloc(const std::string& name, const ImageDesc& desc) {
    used_ = true;

    auto reqsResult = gpu_->imageMemoryRequirements(desc);
    if (!reqsResult.ok()) return reqsResult.error();
    const MemoryRequirements& reqs = reqsResult.value();

    bool dedicated = false;
    if (reqs.dedicated != DedicatedAllocation::Discouraged) {
        log(LogLevel::Debug, "%s: %s dedicated allocation", name.c_str(),
            dedicationName(reqs.dedicated));
        dedicated = true;
    } else if (reqs.size > options_.pageSize) {
        log(LogLevel::Warn,
            "%s: driver discourages dedicated allocation, but the image is larger "
            "than the page size (0x%llx vs 0x%llx bytes)",
            name.c_str(), static_cast<unsigned long long>(reqs.size),
            static_cast<unsigned long long>(options_.pageSize));
        dedicated = true;
    }

    if (dedicated) {
        if (pageCount() >= options_.maxPages) {
            throwError(Error{"allocate dedicated image \"" + name + "\"", 0,
                             "maxPages (" + std::to_string(options_.maxPages) +
                             ") exceeded in \"" + options_.name + "\""});
        }
        auto image = gpu_->createDedicatedImage(desc, options_.kind);
        if (!image.ok()) return image.error();

        Page page;
        page.memory    = image.value().memory;
        page.dedicated = true;
        page.name      = name;
        std::uint32_t id = storePage(std::move(page));
        full_.push_back(id);

        ImageAllocation out;
        out.handle    = image.value().handle;
        out.view      = image.value().view;
        out.page      = id;
        out.offset    = 0;
        out.size      = reqs.size;
        out.dedicated = true;
        return out;
    }

    auto pageId = peekPage();
    if (!pageId.ok()) return pageId.error();

    offset_ = alignUp(offset_, reqs.alignment);
    if (offset_ + reqs.size > options_.pageSize) {
        full_.push_back(available_.back());
        available_.pop_back();
        offset_ = 0;
        pageId = peekPage();
        if (!pageId.ok()) return pageId.error();
    }

    auto image = gpu_->createPlacedImage(desc, pages_[pageId.value()].memory, offset_);
    if (!image.ok()) return image.error();

    ImageAllocation out;
    out.handle    = image.value().handle;
    out.view      = image.value().view;
    out.page      = pageId.value();
    out.offset    = offset_;
    out.size      = reqs.size;
    out.dedicated = false;

    offset_ += reqs.size;
    return out;
}

Result<void> PageAllocator::reset() {
    for (auto id : available_) {
        auto r = renewPage(id);
        if (!r.ok()) return r;
    }

    for (std::size_t i = 0; i < full_.size(); ++i) {
        std::uint32_t id = full_[i];
        if (pages_[id].dedicated) {
            // Dedicated memory is never handed to a different image.
            releasePage(id);
            continue;
        }
        auto r = renewPage(id);
        if (!r.ok()) {
            full_.erase(full_.begin(), full_.begin() + static_cast<std::ptrdiff_t>(i));
            return r;
        }
        available_.push_back(id);
    }
    full_.clear();
    offset_ = 0;
    return {};
}

} // namespace vkframe
