#include "fake_gpu.hpp"

#include <vkframe/log.hpp>
#include <vkframe/render_target_registry.hpp>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using vkframe::test::FakeGpu;
using namespace std::chrono_literals;

static vkframe::RenderTargetRegistryOptions options(VkExtent2D physical) {
    vkframe::RenderTargetRegistryOptions o;
    o.virtualExtent          = {1920, 1080};
    o.physicalExtent         = physical;
    o.capacity               = 4;
    o.allocator.name         = "render targets";
    o.allocator.pageSize     = 64ull * 1024 * 1024;
    o.allocator.initialPages = 0;
    return o;
}

static vkframe::RenderTargetDesc target(const char* name, std::uint32_t w, std::uint32_t h) {
    vkframe::RenderTargetDesc d;
    d.name         = name;
    d.image.format = VK_FORMAT_R16G16B16A16_SFLOAT;
    d.image.extent = {w, h, 1};
    d.image.usage  = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
    return d;
}

static bool sameExtent(VkExtent2D a, VkExtent2D b) {
    return a.width == b.width && a.height == b.height;
}

int main() {
    std::vector<std::string> warnings;
    vkframe::setLogSink([&](vkframe::LogLevel level, std::string_view msg) {
        if (level == vkframe::LogLevel::Warn) warnings.emplace_back(msg);
    });

    // Targets scale linearly with the physical extent; handles survive recreate
    {
        FakeGpu gpu;
        auto reg = vkframe::RenderTargetRegistry::create(gpu, options({1920, 1080})).orThrow();

        struct Call {
            vkframe::RenderTarget target;
            VkExtent2D            extent;
            VkImage               image;
        };
        std::vector<Call> calls;
        reg.setListener([&](vkframe::RenderTarget t, const vkframe::RenderTargetState& s) {
            calls.push_back(Call{t, s.extent, s.image.handle});
        });

        auto half = reg.alloc(target("bloom", 960, 540)).value();
        auto full = reg.alloc(target("hdr", 1920, 1080)).value();
        assert(static_cast<std::uint32_t>(half) == 0);
        assert(static_cast<std::uint32_t>(full) == 1);
        assert(reg.size() == 2);
        assert(calls.size() == 2);

        auto before = reg.get(half);
        assert(sameExtent(before.extent, {960, 540}));
        assert(sameExtent(reg.extent(full), {1920, 1080}));

        calls.clear();
        assert(reg.recreate({3840, 2160}).ok());
        assert(sameExtent(reg.physicalExtent(), {3840, 2160}));

        auto after = reg.get(half);
        assert(sameExtent(after.extent, {1920, 1080}));
        assert(sameExtent(reg.get(full).extent, {3840, 2160}));
        assert(after.image.handle != before.image.handle);
        assert(gpu.wasDestroyed(before.image.handle));
        assert(gpu.wasDestroyed(before.image.view));
        assert(gpu.isLive(after.image.handle));

        // Listener sees every target again, in allocation order
        assert(calls.size() == 2);
        assert(calls[0].target == half && sameExtent(calls[0].extent, {1920, 1080}));
        assert(calls[1].target == full && sameExtent(calls[1].extent, {3840, 2160}));
        assert(calls[0].image == after.image.handle);

        // Shrinking back gives the original sizes
        assert(reg.recreate({1920, 1080}).ok());
        assert(sameExtent(reg.extent(half), {960, 540}));
    }

    // Recreate reuses pages instead of growing
    {
        FakeGpu gpu;
        auto reg = vkframe::RenderTargetRegistry::create(gpu, options({1920, 1080})).orThrow();
        auto a = reg.alloc(target("a", 1920, 1080)).value();
        (void)reg.get(a);
        std::uint32_t pages = reg.allocator().pageCount();
        for (int i = 0; i < 5; ++i) assert(reg.recreate({1920, 1080}).ok());
        assert(reg.allocator().pageCount() == pages);
    }

    // A zero-sized surface still materializes 1x1 images
    {
        FakeGpu gpu;
        std::vector<VkExtent3D> requested;
        gpu.requirements = [&](const vkframe::ImageDesc& d) {
            requested.push_back(d.extent);
            vkframe::MemoryRequirements r;
            r.size      = VkDeviceSize{d.extent.width} * d.extent.height * 4;
            r.alignment = 256;
            return r;
        };
        auto reg = vkframe::RenderTargetRegistry::create(gpu, options({1920, 1080})).orThrow();
        auto t = reg.alloc(target("shadow", 512, 512)).value();

        requested.clear();
        assert(reg.recreate({0, 0}).ok());
        assert(requested.size() == 1);
        assert(requested[0].width == 1 && requested[0].height == 1);
        auto state = reg.get(t);
        assert(sameExtent(state.extent, {0, 0}));
        assert(state.image.handle != VK_NULL_HANDLE);
    }

    // When recreating is worthwhile
    {
        FakeGpu gpu;
        auto reg = vkframe::RenderTargetRegistry::create(gpu, options({800, 600})).orThrow();

        assert(!reg.suboptimal(10s, {800, 600}));   // unchanged
        assert(!reg.suboptimal(10s, {0, 600}));     // minimized
        assert(!reg.suboptimal(50ms, {1000, 700})); // mid-resize, small change
        assert(reg.suboptimal(101ms, {1000, 700})); // settled
        assert(!reg.suboptimal(100ms, {1000, 700}));
        assert(!reg.suboptimal(0ms, {6400, 600}));  // exactly 8x
        assert(reg.suboptimal(0ms, {7200, 600}));   // 9x
        assert(reg.suboptimal(0ms, {800, 5400}));

        assert(reg.recreate({0, 0}).ok());
        assert(reg.suboptimal(0ms, {800, 600}));    // restored from minimized
    }

    // Thresholds are configurable
    {
        FakeGpu gpu;
        auto o = options({800, 600});
        o.recreateScale = 1;
        o.quiescence    = 10ms;
        auto reg = vkframe::RenderTargetRegistry::create(gpu, o).orThrow();
        assert(reg.suboptimal(0ms, {1600, 600}));
        assert(reg.suboptimal(11ms, {900, 600}));
        assert(!reg.suboptimal(5ms, {900, 600}));
    }

    // Capacity is a contract
    {
        FakeGpu gpu;
        auto o = options({1920, 1080});
        o.capacity = 2;
        auto reg = vkframe::RenderTargetRegistry::create(gpu, o).orThrow();
        (void)reg.get(reg.alloc(target("a", 64, 64)).value());
        (void)reg.get(reg.alloc(target("b", 64, 64)).value());
        bool caught = false;
        try {
            (void)reg.alloc(target("c", 64, 64));
        } catch (const std::runtime_error& e) {
            caught = true;
            assert(std::string(e.what()).find("capacity") != std::string::npos);
        }
        assert(caught);
        assert(reg.size() == 2);
    }

    // A failed allocation leaves the registry unchanged
    {
        FakeGpu gpu;
        auto reg = vkframe::RenderTargetRegistry::create(gpu, options({1920, 1080})).orThrow();
        gpu.failNextAllocation = true;
        auto r = reg.alloc(target("oom", 64, 64));
        assert(!r.ok());
        assert(reg.size() == 0);
        (void)reg.get(reg.alloc(target("ok", 64, 64)).value());
        assert(reg.size() == 1);
    }

    // Unused targets are reported and everything is freed on destruction
    {
        FakeGpu gpu;
        {
            auto reg = vkframe::RenderTargetRegistry::create(gpu, options({1920, 1080})).orThrow();
            auto used = reg.alloc(target("used", 64, 64)).value();
            (void)reg.alloc(target("forgotten", 64, 64)).value();
            (void)reg.get(used);
            warnings.clear();
        }
        assert(warnings.size() == 1);
        assert(warnings[0].find("forgotten") != std::string::npos);
        assert(gpu.live.empty());
    }

    // A zero virtual extent is rejected
    {
        FakeGpu gpu;
        auto o = options({1920, 1080});
        o.virtualExtent = {0, 1080};
        assert(!vkframe::RenderTargetRegistry::create(gpu, o).ok());
    }

    vkframe::setLogSink({});
    std::printf("test_render_target_registry: ok\n");
    return 0;
}
