#include "fake_gpu.hpp"

#include <vkframe/deferred_deleter.hpp>
#include <vkframe/log.hpp>

#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using vkframe::test::FakeGpu;
using vkframe::test::raw;

// Each handle kind resolves to its own append() overload.
template <typename Handle, typename = void>
struct Appendable : std::false_type {};
template <typename Handle>
struct Appendable<Handle, std::void_t<decltype(std::declval<vkframe::DeferredDeleter&>().append(
                              std::declval<Handle>()))>> : std::true_type {};

static_assert(Appendable<VkImage>::value);
static_assert(Appendable<VkImageView>::value);
static_assert(Appendable<VkBuffer>::value);
static_assert(Appendable<VmaAllocation>::value);
static_assert(Appendable<VkSampler>::value);
static_assert(Appendable<VkSemaphore>::value);
static_assert(Appendable<VkFence>::value);
static_assert(Appendable<VkCommandPool>::value);
static_assert(!std::is_same_v<VkImage, VkImageView> && !std::is_same_v<VkSampler, VkCommandPool>);

int main() {
    std::vector<std::string> warnings;
    vkframe::setLogSink([&](vkframe::LogLevel level, std::string_view msg) {
        if (level == vkframe::LogLevel::Warn) warnings.emplace_back(msg);
    });

    // Every appended handle is destroyed exactly once, in insertion order
    {
        FakeGpu gpu;
        vkframe::DeferredDeleter dq(gpu, 16);

        VkFence     fence = gpu.createFence(false).value();
        VkSemaphore sem   = gpu.createSemaphore().value();
        auto        buf   = gpu.createBuffer({64, VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, false}).value();

        dq.append(fence);
        dq.append(sem);
        dq.append(buf.handle);
        dq.append(buf.memory);
        assert(dq.size() == 4);
        assert(dq.pending()[0].kind == vkframe::HandleKind::Fence);
        assert(dq.pending()[3].kind == vkframe::HandleKind::Memory);
        assert(gpu.isLive(fence));

        dq.reset();
        assert(dq.empty());
        assert(dq.capacity() == 16);
        assert(gpu.destroyed.size() == 4);
        assert(gpu.destroyed[0] == raw(fence));
        assert(gpu.destroyed[1] == raw(sem));
        assert(gpu.destroyed[2] == raw(buf.handle));
        assert(gpu.destroyed[3] == raw(buf.memory));

        // A second reset has nothing left to destroy
        dq.reset();
        assert(gpu.destroyed.size() == 4);
        assert(gpu.unknownDestroys == 0);
    }

    // Composites split into handle, view, memory
    {
        FakeGpu gpu;
        vkframe::DeferredDeleter dq(gpu, 8);

        vkframe::ImageDesc desc;
        auto dedicated = gpu.createDedicatedImage(desc, vkframe::MemoryKind::ColorImage).value();
        dq.append(dedicated);
        assert(dq.size() == 3);
        assert(dq.pending()[0].kind == vkframe::HandleKind::Image);
        assert(dq.pending()[1].kind == vkframe::HandleKind::ImageView);
        assert(dq.pending()[2].kind == vkframe::HandleKind::Memory);

        // Buffers have no view
        auto buf = gpu.createBuffer({16, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, true}).value();
        dq.append(buf);
        assert(dq.size() == 5);
        assert(dq.pending()[3].kind == vkframe::HandleKind::Buffer);
        assert(dq.pending()[4].kind == vkframe::HandleKind::Memory);

        dq.reset();
        assert(!gpu.isLive(dedicated.handle));
        assert(!gpu.isLive(dedicated.view));
        assert(!gpu.isLive(buf.memory));
        assert(gpu.liveMemoryCount() == 0);
    }

    // Null handles are not queued
    {
        FakeGpu gpu;
        vkframe::DeferredDeleter dq(gpu, 4);
        dq.append(VkImage{VK_NULL_HANDLE});
        assert(dq.empty());
    }

    // Occupancy past capacity / warnRatio warns on reset
    {
        FakeGpu gpu;
        vkframe::DeferredDeleter dq(gpu, 8, 4);
        warnings.clear();

        dq.append(gpu.createSemaphore().value());
        dq.append(gpu.createSemaphore().value());
        dq.reset(); // 2 of 8 is not past 1/4
        assert(warnings.empty());

        for (int i = 0; i < 3; ++i) dq.append(gpu.createSemaphore().value());
        dq.reset();
        assert(warnings.size() == 1);
        assert(warnings[0].find("past 1/4 capacity") != std::string::npos);
    }

    // warnRatio 0 disables the warning
    {
        FakeGpu gpu;
        vkframe::DeferredDeleter dq(gpu, 2, 0);
        warnings.clear();
        dq.append(gpu.createSemaphore().value());
        dq.append(gpu.createSemaphore().value());
        dq.reset();
        assert(warnings.empty());
    }

    // Overflow is a contract violation
    {
        FakeGpu gpu;
        vkframe::DeferredDeleter dq(gpu, 1);
        dq.append(gpu.createSemaphore().value());
        bool caught = false;
        try {
            dq.append(gpu.createSemaphore().value());
        } catch (const std::runtime_error& e) {
            caught = true;
            assert(std::string(e.what()).find("capacity") != std::string::npos);
        }
        assert(caught);
        assert(dq.size() == 1);
    }

    // Destruction and move flush remaining entries once
    {
        FakeGpu gpu;
        VkSemaphore sem = gpu.createSemaphore().value();
        {
            vkframe::DeferredDeleter a(gpu, 4);
            a.append(sem);
            vkframe::DeferredDeleter b(std::move(a));
            assert(b.size() == 1);
        }
        assert(!gpu.isLive(sem));
        assert(gpu.destroyed.size() == 1);
        assert(gpu.unknownDestroys == 0);
    }

    vkframe::setLogSink({});
    std::printf("test_deferred_deleter: ok\n");
    return 0;
}
