#include "fake_gpu.hpp"

#include <vkframe/frame_scheduler.hpp>
#include <vkframe/log.hpp>

#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using vkframe::test::FakeGpu;
using vkframe::test::raw;

static const VkExtent2D kWindow = {800, 600};

static vkframe::FrameScheduler makeScheduler(FakeGpu& gpu, std::uint32_t framesInFlight = 2) {
    vkframe::FrameSchedulerOptions o;
    o.framesInFlight = framesInFlight;
    return vkframe::FrameScheduler::create(gpu, o).orThrow();
}

// One presented frame with a single recorded command buffer.
static vkframe::Frame presentFrame(vkframe::FrameScheduler& fs) {
    auto frame = fs.beginFrame().value();
    (void)fs.acquireImage(kWindow).value();
    assert(fs.submit(frame.cmd).ok());
    assert(fs.endFrame(true).ok());
    return frame;
}

template <typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    vkframe::setLogSink([](vkframe::LogLevel, std::string_view) {});

    // Slots rotate and each slot's fence is waited on before reuse
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        assert(gpu.fencesCreated.size() == 2);
        assert(fs.framesInFlight() == 2);

        const std::uint32_t expected[] = {0, 1, 0, 1, 0};
        for (std::uint32_t i = 0; i < 5; ++i) {
            auto frame = presentFrame(fs);
            assert(frame.slot == expected[i]);
            assert(frame.number == i);
            assert(gpu.fenceWaits.back() == gpu.fencesCreated[expected[i]]);
            assert(fs.state() == vkframe::FrameState::Idle);
        }
        assert(gpu.fenceWaits.size() == 5);
        assert(fs.frameNumber() == 5);
        assert(fs.slot() == 1);
        assert(gpu.presented.size() == 5);
        assert(gpu.poolResets == 5);
    }

    // Per frame: acquire transition waits on image-available; the final
    // batch carries the present transition, the present semaphore and the fence
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        auto frame = fs.beginFrame().value();
        auto image = fs.acquireImage(kWindow).value();
        assert(fs.state() == vkframe::FrameState::Recording);
        assert(image.image == gpu.swapImages[0]);
        assert(image.extent.width == 800);

        assert(gpu.submissions.size() == 1);
        const auto& prepare = gpu.submissions[0];
        assert(prepare.wait != VK_NULL_HANDLE);
        assert(prepare.fence == VK_NULL_HANDLE);
        assert(gpu.transitions.size() == 1);
        assert(!gpu.transitions[0].toPresent && gpu.transitions[0].image == image.image);
        assert(prepare.cmds.size() == 1 && prepare.cmds[0] == gpu.transitions[0].cmd);

        assert(fs.submit(frame.cmd).ok());
        assert(gpu.submissions.back().cmds[0] == frame.cmd);

        assert(fs.endFrame(true).ok());
        const auto& last = gpu.submissions.back();
        assert(last.fence == gpu.fencesCreated[0]);
        assert(last.signal != VK_NULL_HANDLE);
        assert(gpu.transitions.back().toPresent);
        assert(gpu.transitions.back().image == image.image);
        assert(gpu.presented.size() == 1 && gpu.presented[0] == image.index);
    }

    // Deferred handles die when their slot comes around again
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);

        (void)fs.beginFrame().value();
        VkSemaphore retired = gpu.createSemaphore().value();
        fs.deleter().append(retired);
        (void)fs.acquireImage(kWindow).value();
        assert(fs.endFrame(true).ok());

        presentFrame(fs); // slot 1
        assert(gpu.isLive(retired));

        auto frame = fs.beginFrame().value(); // slot 0 again
        assert(frame.slot == 0);
        assert(gpu.fenceWaits.back() == gpu.fencesCreated[0]);
        assert(!gpu.isLive(retired));
        assert(gpu.unknownDestroys == 0);
        assert(fs.endFrame(false).ok());
    }

    // Frames that do not present still signal their fence
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu, 1);
        for (int i = 0; i < 3; ++i) {
            auto frame = fs.beginFrame().value();
            assert(fs.submit(frame.cmd).ok());
            assert(fs.endFrame(false).ok());
            const auto& last = gpu.submissions.back();
            assert(last.cmds.empty());
            assert(last.fence == gpu.fencesCreated[0]);
        }
        assert(gpu.presented.empty());
        assert(gpu.acquireCalls == 0);
    }

    // OutOfDate on acquire recreates and retries transparently
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        VkImage oldImage = gpu.swapImages[0];
        gpu.acquireScript = {vkframe::SwapchainStatus::OutOfDate};

        (void)fs.beginFrame().value();
        auto image = fs.acquireImage({1024, 768}).value();
        assert(gpu.recreations.size() == 1);
        assert(gpu.recreations[0].width == 1024);
        assert(gpu.acquireCalls == 2);
        assert(image.image != oldImage);
        assert(image.extent.width == 1024);
        assert(!fs.outOfDate());
        assert(fs.endFrame(true).ok());
    }

    // Suboptimal present marks the swapchain out of date; the next acquire
    // rebuilds it together with the present semaphores
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        gpu.presentScript = {vkframe::SwapchainStatus::Suboptimal};
        presentFrame(fs);
        VkSemaphore oldPresentSem = gpu.submissions.back().signal;
        assert(fs.outOfDate());
        assert(gpu.recreations.empty());

        presentFrame(fs);
        assert(gpu.recreations.size() == 1);
        assert(!fs.outOfDate());
        assert(!gpu.isLive(oldPresentSem));
        assert(gpu.submissions.back().signal != oldPresentSem);

        // An explicit resize does the same
        fs.markOutOfDate();
        presentFrame(fs);
        assert(gpu.recreations.size() == 2);
    }

    // OutOfDate on present as well
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        gpu.presentScript = {vkframe::SwapchainStatus::OutOfDate};
        presentFrame(fs);
        assert(fs.outOfDate());
    }

    // Suboptimal acquire proceeds with the image
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        gpu.acquireScript = {vkframe::SwapchainStatus::Suboptimal};
        presentFrame(fs);
        assert(gpu.recreations.empty());
        assert(gpu.presented.size() == 1);
    }

    // A swapchain that never settles gives up after maxRecreateAttempts
    {
        FakeGpu gpu;
        vkframe::FrameSchedulerOptions o;
        o.maxRecreateAttempts = 3;
        auto fs = vkframe::FrameScheduler::create(gpu, o).orThrow();
        gpu.alwaysOutOfDate = true;
        (void)fs.beginFrame().value();
        bool caught = false;
        try {
            (void)fs.acquireImage(kWindow);
        } catch (const std::runtime_error& e) {
            caught = true;
            assert(std::string(e.what()).find("out of date") != std::string::npos);
        }
        assert(caught);
        assert(gpu.recreations.size() == 3);
        assert(gpu.acquireCalls == 4);
    }

    // A zero-sized window is an error, not a swapchain rebuild
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        (void)fs.beginFrame().value();
        auto r = fs.acquireImage({0, 600});
        assert(!r.ok());
        assert(gpu.acquireCalls == 0);
        assert(fs.state() == vkframe::FrameState::Acquiring);
        assert(fs.endFrame(false).ok());
    }

    // Acquiring an image and not presenting it is reported, but the frame
    // still ends and the slot fence still gets signalled
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        (void)fs.beginFrame().value();
        (void)fs.acquireImage(kWindow).value();
        auto r = fs.endFrame(false);
        assert(!r.ok());
        assert(r.error().message.find("not presented") != std::string::npos);
        assert(fs.state() == vkframe::FrameState::Idle);
        assert(fs.slot() == 1);
        assert(gpu.submissions.back().fence == gpu.fencesCreated[0]);
        assert(gpu.presented.empty());
    }

    // A failed pool recycle leaves the slot fence signaled, so beginFrame()
    // can simply be called again
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        gpu.failNextPoolReset = true;
        auto r = fs.beginFrame();
        assert(!r.ok());
        assert(r.error().vkResult == -2);
        assert(fs.state() == vkframe::FrameState::Idle);
        assert(gpu.fences[raw(gpu.fencesCreated[0])] == FakeGpu::FenceState::Signaled);

        auto frame = fs.beginFrame();
        assert(frame.ok());
        assert(frame.value().slot == 0);
        assert(gpu.fenceWaits.size() == 2);
        (void)fs.acquireImage(kWindow).value();
        assert(fs.endFrame(true).ok());
        presentFrame(fs);
        presentFrame(fs);
    }

    // Same when validation mode cannot recreate the pool
    {
        FakeGpu gpu;
        gpu.validation = true;
        auto fs = makeScheduler(gpu, 1);
        VkSemaphore retired = gpu.createSemaphore().value();
        (void)fs.beginFrame().value();
        fs.deleter().append(retired);
        assert(fs.endFrame(false).ok());

        gpu.failNextPoolCreate = true;
        assert(!fs.beginFrame().ok());
        assert(gpu.isLive(retired)); // not flushed by the failed begin

        auto frame = fs.beginFrame();
        assert(frame.ok());
        assert(frame.value().cmd != VK_NULL_HANDLE);
        assert(!gpu.isLive(retired));
        assert(fs.endFrame(false).ok());
        assert(gpu.unknownDestroys == 0);
    }

    // A failed acquire transition consumes the image-available semaphore
    // and still counts the image as held by the frame
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        (void)fs.beginFrame().value();
        gpu.failNextAcquireTransition = true;
        auto r = fs.acquireImage(kWindow);
        assert(!r.ok());
        assert(fs.state() == vkframe::FrameState::Acquiring);

        const auto& drain = gpu.submissions.back();
        assert(drain.cmds.empty());
        assert(drain.wait == gpu.lastAcquireSemaphore);
        assert(drain.wait != VK_NULL_HANDLE);
        assert(drain.fence == VK_NULL_HANDLE);

        // No second image while the first is outstanding, and nothing to present
        auto again = fs.acquireImage(kWindow);
        assert(!again.ok());
        assert(gpu.acquireCalls == 1);
        assert(throws([&] { (void)fs.endFrame(true); }));

        auto ended = fs.endFrame(false);
        assert(!ended.ok());
        assert(ended.error().message.find("not presented") != std::string::npos);
        assert(gpu.submissions.back().fence == gpu.fencesCreated[0]);
        assert(fs.state() == vkframe::FrameState::Idle);

        presentFrame(fs);
        presentFrame(fs);
        assert(gpu.presented.size() == 2);
    }

    // Calls out of order are contract violations
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        assert(throws([&] { (void)fs.endFrame(false); }));
        assert(throws([&] { (void)fs.acquireImage(kWindow); }));
        assert(throws([&] { (void)fs.submit(VK_NULL_HANDLE); }));

        (void)fs.beginFrame().value();
        assert(throws([&] { (void)fs.beginFrame(); }));
        assert(throws([&] { (void)fs.endFrame(true); })); // nothing acquired
        (void)fs.acquireImage(kWindow).value();
        assert(throws([&] { (void)fs.acquireImage(kWindow); }));
        assert(fs.endFrame(true).ok());
    }

    // Validation mode recreates command pools instead of resetting them
    {
        FakeGpu gpu;
        gpu.validation = true;
        auto fs = makeScheduler(gpu, 1);
        auto a = presentFrame(fs);
        auto b = presentFrame(fs);
        assert(gpu.poolResets == 0);
        assert(a.cmd != b.cmd);

        FakeGpu plain;
        auto ps = makeScheduler(plain, 1);
        auto c = presentFrame(ps);
        auto d = presentFrame(ps);
        assert(c.cmd == d.cmd);
        assert(plain.poolResets == 2);
    }

    // Blocked time covers at least the fence wait
    {
        FakeGpu gpu;
        auto fs = makeScheduler(gpu);
        auto frame = presentFrame(fs);
        assert(frame.blocked.count() >= 0);
        assert(fs.lastFrameBlocked() >= frame.blocked);
    }

    // Teardown waits for the device and releases every object
    {
        FakeGpu gpu;
        {
            auto fs = makeScheduler(gpu, 3);
            presentFrame(fs);
            (void)fs.beginFrame().value();
            fs.deleter().append(gpu.createSemaphore().value());
            assert(fs.endFrame(false).ok());
        }
        assert(gpu.waitIdleCalls >= 1);
        assert(gpu.live.empty());
        assert(gpu.unknownDestroys == 0);
    }

    vkframe::setLogSink({});
    std::printf("test_frame_scheduler: ok\n");
    return 0;
}
