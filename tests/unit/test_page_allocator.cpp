#include "fake_gpu.hpp"

#include <vkframe/log.hpp>
#include <vkframe/page_allocator.hpp>

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using vkframe::test::FakeGpu;
using vkframe::test::raw;

static vkframe::ImageDesc square(std::uint32_t side) {
    vkframe::ImageDesc d;
    d.extent = {side, side, 1};
    d.usage  = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
    return d;
}

static vkframe::PageAllocatorOptions smallPages(std::uint32_t initial) {
    vkframe::PageAllocatorOptions o;
    o.name         = "test";
    o.pageSize     = 64 * 1024;
    o.maxPages     = 8;
    o.initialPages = initial;
    return o;
}

static void destroyAll(FakeGpu& gpu, const std::vector<vkframe::ImageAllocation>& images) {
    for (const auto& i : images) {
        gpu.destroyImageView(i.view);
        gpu.destroyImage(i.handle);
    }
}

int main() {
    std::vector<std::string> warnings;
    vkframe::setLogSink([&](vkframe::LogLevel level, std::string_view msg) {
        if (level == vkframe::LogLevel::Warn) warnings.emplace_back(msg);
    });

    // Initial pages are allocated up front
    {
        FakeGpu gpu;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(2));
        assert(pa.ok());
        assert(pa.value().pageCount() == 2);
        assert(pa.value().availablePageCount() == 2);
        assert(gpu.liveMemoryCount() == 2);
        (void)pa.value().alloc("keep-quiet", square(4));
    }

    // Placements in one page go at increasing, aligned offsets
    {
        FakeGpu gpu;
        gpu.requirements = [](const vkframe::ImageDesc& d) {
            vkframe::MemoryRequirements r;
            r.size      = VkDeviceSize{d.extent.width} * d.extent.height * 4 + 100;
            r.alignment = 1024;
            return r;
        };
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(1)).orThrow();

        std::vector<vkframe::ImageAllocation> images;
        VkDeviceSize last = 0;
        for (int i = 0; i < 4; ++i) {
            auto a = pa.alloc("img" + std::to_string(i), square(16));
            assert(a.ok());
            const auto& img = a.value();
            assert(!img.dedicated);
            assert(img.offset % 1024 == 0);
            if (!images.empty()) {
                assert(img.page == images[0].page);
                assert(img.offset > last);
            }
            last = img.offset;
            images.push_back(img);
        }
        assert(images[0].offset == 0);
        assert(images[1].offset == 2048); // 1124 bytes aligned up to 1024
        assert(pa.offset() == images[3].offset + images[3].size);
        assert(pa.fullPageCount() == 0);
        destroyAll(gpu, images);
    }

    // A page that cannot fit the next image is retired
    {
        FakeGpu gpu;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(2)).orThrow();
        warnings.clear();

        // 64x64x4 = 16 KiB: exactly four fit in a 64 KiB page
        std::vector<vkframe::ImageAllocation> images;
        for (int i = 0; i < 5; ++i) {
            images.push_back(pa.alloc("rt", square(64)).value());
        }
        assert(images[3].offset == 3 * 16384);
        assert(images[3].page == images[0].page);
        assert(images[4].page != images[0].page);
        assert(images[4].offset == 0);
        assert(pa.fullPageCount() == 1);
        assert(pa.availablePageCount() == 1);
        assert(warnings.empty()); // second page was pre-allocated
        destroyAll(gpu, images);
    }

    // Running out of pre-allocated pages grows with a warning
    {
        FakeGpu gpu;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(1)).orThrow();
        warnings.clear();
        std::vector<vkframe::ImageAllocation> images;
        for (int i = 0; i < 5; ++i) {
            images.push_back(pa.alloc("grow", square(64)).value());
        }
        assert(pa.pageCount() == 2);
        assert(warnings.size() == 1);
        assert(warnings[0].find("dynamic allocation") != std::string::npos);
        destroyAll(gpu, images);
    }

    // An allocator created empty grows silently the first time
    {
        FakeGpu gpu;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(0)).orThrow();
        warnings.clear();
        auto img = pa.alloc("first", square(8)).value();
        assert(pa.pageCount() == 1);
        assert(warnings.empty());
        destroyAll(gpu, {img});
    }

    // Dedicated when the driver asks, or when bigger than a page
    {
        FakeGpu gpu;
        gpu.requirements = [](const vkframe::ImageDesc& d) {
            vkframe::MemoryRequirements r;
            r.size      = VkDeviceSize{d.extent.width} * d.extent.height * 4;
            r.alignment = 256;
            if (d.usage & VK_IMAGE_USAGE_STORAGE_BIT) {
                r.dedicated = vkframe::DedicatedAllocation::Required;
            }
            return r;
        };
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(1)).orThrow();
        warnings.clear();

        auto placed = pa.alloc("placed", square(16)).value();

        auto storage  = square(16);
        storage.usage = VK_IMAGE_USAGE_STORAGE_BIT;
        auto required = pa.alloc("required", storage).value();
        assert(required.dedicated);
        assert(required.offset == 0);
        assert(warnings.empty());

        auto huge = pa.alloc("huge", square(256)).value(); // 256 KiB > 64 KiB page
        assert(huge.dedicated);
        assert(warnings.size() == 1);
        assert(warnings[0].find("larger than the page size") != std::string::npos);

        // Dedicated images never share a page with placed ones
        assert(required.page != placed.page);
        assert(huge.page != placed.page);
        assert(pa.fullPageCount() == 2);
        assert(pa.availablePageCount() == 1);

        // The bump cursor is untouched by dedicated allocations
        auto next = pa.alloc("placed2", square(16)).value();
        assert(next.page == placed.page);
        assert(next.offset == 1024);

        std::size_t memBefore = gpu.liveMemoryCount();
        destroyAll(gpu, {placed, required, huge, next});
        assert(pa.reset().ok());
        assert(pa.fullPageCount() == 0);
        assert(pa.availablePageCount() == 1);
        assert(gpu.liveMemoryCount() == memBefore - 2); // dedicated memory freed
        assert(pa.offset() == 0);
    }

    // reset() then the same request sequence gives the same offsets
    {
        FakeGpu gpu;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(1)).orThrow();
        const std::uint32_t sides[] = {32, 64, 16, 64, 64, 8};

        std::vector<vkframe::ImageAllocation> first;
        for (auto s : sides) first.push_back(pa.alloc("a", square(s)).value());
        destroyAll(gpu, first);
        assert(pa.reset().ok());

        std::vector<vkframe::ImageAllocation> second;
        for (auto s : sides) second.push_back(pa.alloc("a", square(s)).value());
        for (std::size_t i = 0; i < first.size(); ++i) {
            assert(first[i].offset == second[i].offset);
        }
        destroyAll(gpu, second);
    }

    // Validation mode swaps page memory on reset
    {
        FakeGpu gpu;
        gpu.validation = true;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(1)).orThrow();
        auto img = pa.alloc("v", square(8)).value();
        VmaAllocation before = gpu.placements.back().memory;
        destroyAll(gpu, {img});
        assert(pa.reset().ok());
        assert(!gpu.isLive(before));
        assert(gpu.liveMemoryCount() == 1);

        auto again = pa.alloc("v", square(8)).value();
        assert(gpu.placements.back().memory != before);
        destroyAll(gpu, {again});
    }

    // Page memory is labelled with the allocator name and page index, and
    // keeps its label when validation mode swaps it
    {
        FakeGpu gpu;
        gpu.validation = true;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(2)).orThrow();
        assert(gpu.memoryNames.size() == 2);
        std::vector<std::string> names;
        for (const auto& [memory, name] : gpu.memoryNames) names.push_back(name);
        std::sort(names.begin(), names.end());
        assert((names == std::vector<std::string>{"test[0]", "test[1]"}));

        auto img = pa.alloc("labelled", square(8)).value();
        VmaAllocation before = gpu.placements.back().memory;
        destroyAll(gpu, {img});
        assert(pa.reset().ok());
        assert(gpu.memoryNames.count(raw(before)) == 0);

        names.clear();
        for (const auto& [memory, name] : gpu.memoryNames) names.push_back(name);
        std::sort(names.begin(), names.end());
        assert((names == std::vector<std::string>{"test[0]", "test[1]"}));
    }

    // Exceeding maxPages is a contract violation
    {
        FakeGpu gpu;
        auto opts = smallPages(0);
        opts.maxPages = 1;
        auto pa = vkframe::PageAllocator::create(gpu, opts).orThrow();
        std::vector<vkframe::ImageAllocation> images;
        for (int i = 0; i < 4; ++i) images.push_back(pa.alloc("x", square(64)).value());
        bool caught = false;
        try {
            (void)pa.alloc("x", square(64));
        } catch (const std::runtime_error& e) {
            caught = true;
            assert(std::string(e.what()).find("maxPages") != std::string::npos);
        }
        assert(caught);
        destroyAll(gpu, images);
    }

    // Native allocation failure comes back as an Error
    {
        FakeGpu gpu;
        auto pa = vkframe::PageAllocator::create(gpu, smallPages(0)).orThrow();
        gpu.failNextAllocation = true;
        auto r = pa.alloc("oom", square(8));
        assert(!r.ok());
        assert(r.error().vkResult == -2);
    }

    // Destruction frees everything and flags an unused allocator
    {
        FakeGpu gpu;
        warnings.clear();
        {
            auto pa = vkframe::PageAllocator::create(gpu, smallPages(3)).orThrow();
        }
        assert(gpu.liveMemoryCount() == 0);
        assert(warnings.size() == 1);
        assert(warnings[0].find("not used") != std::string::npos);
    }

    vkframe::setLogSink({});
    std::printf("test_page_allocator: ok\n");
    return 0;
}
