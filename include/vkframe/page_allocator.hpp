#pragma once

#include <vkframe/gpu.hpp>
#include <vkframe/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace vkframe {

struct PageAllocatorOptions {
    std::string   name         = "pages";
    MemoryKind    kind         = MemoryKind::ColorImage;
    VkDeviceSize  pageSize     = VkDeviceSize{256} * 1024 * 1024;
    std::uint32_t maxPages     = 128;
    std::uint32_t initialPages = 0;
};

// An image placed into a page, or a dedicated image when dedicated == true.
// Destroy handle and view yourself (directly or through a DeferredDeleter);
// the memory belongs to the allocator and comes back on reset().
struct ImageAllocation {
    VkImage       handle    = VK_NULL_HANDLE;
    VkImageView   view      = VK_NULL_HANDLE;
    std::uint32_t page      = 0;
    VkDeviceSize  offset    = 0;
    VkDeviceSize  size      = 0;
    bool          dedicated = false;
};

// Bump allocator over large opaque memory pages, for images whose lifetime
// ends all at once (render targets, per-level scratch images).
//
// Images go into the most recently added available page. A page that cannot
// fit the next image is retired to the full list. Images the driver wants
// dedicated, or that are bigger than a page, get their own memory and are
// tracked as full pages so reset() frees them.
//
// Thread safety: thread-confined. Mutate between frames only.
class PageAllocator {
public:
    [[nodiscard]] static Result<PageAllocator> create(Gpu& gpu,
                                                      const PageAllocatorOptions& options = {});

    ~PageAllocator();
    PageAllocator(PageAllocator&&) noexcept;
    PageAllocator& operator=(PageAllocator&&) noexcept;
    PageAllocator(const PageAllocator&) = delete;
    PageAllocator& operator=(const PageAllocator&) = delete;

    [[nodiscard]] Result<ImageAllocation> alloc(const std::string& name, const ImageDesc& desc);

    // Reclaim every page. All images placed since the last reset must already
    // be destroyed.
    [[nodiscard]] Result<void> reset();

    [[nodiscard]] const std::string& name()     const { return options_.name; }
    [[nodiscard]] VkDeviceSize      pageSize()  const { return options_.pageSize; }
    [[nodiscard]] VkDeviceSize      offset()    const { return offset_; }
    [[nodiscard]] std::uint32_t     pageCount() const;
    [[nodiscard]] std::uint32_t     availablePageCount() const {
        return static_cast<std::uint32_t>(available_.size());
    }
    [[nodiscard]] std::uint32_t     fullPageCount() const {
        return static_cast<std::uint32_t>(full_.size());
    }

private:
    PageAllocator() = default;
    void destroy();

    struct Page {
        VmaAllocation memory    = nullptr;
        bool          dedicated = false;
        std::string   name;
    };

    [[nodiscard]] Result<std::uint32_t> addPage();
    [[nodiscard]] Result<std::uint32_t> peekPage();
    [[nodiscard]] Result<void> renewPage(std::uint32_t id);
    std::uint32_t storePage(Page page);
    void releasePage(std::uint32_t id);

    Gpu*                       gpu_ = nullptr;
    PageAllocatorOptions       options_;
    std::vector<Page>          pages_;     // arena indexed by page id
    std::vector<std::uint32_t> freeSlots_; // vacated arena ids
    std::vector<std::uint32_t> available_; // LIFO, back is current
    std::vector<std::uint32_t> full_;
    VkDeviceSize               offset_ = 0;
    bool                       used_   = false;
};

} // namespace vkframe
