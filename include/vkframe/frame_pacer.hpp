#pragma once

#include <chrono>
#include <cstdint>

namespace vkframe {

struct FramePacerOptions {
    // Display refresh rate, or 0 when unknown (no sleeping at all).
    float refreshRateHz  = 0.0f;
    // Slack to leave between the end of the sleep and the blocking point.
    float headroomMs     = 0.5f;
    // A frame longer than period + overshootMs scales the sleep back...
    float overshootMs    = 1.0f;
    // ...by this factor.
    float overshootScale = 0.9f;
    // Fraction of (slop - headroom) folded into the sleep per frame.
    float sleepRwa       = 0.1f;
    // Weight of the newest frame time in the smoothed delta.
    float smoothedRwa    = 0.1f;
    // Frame times above this are clamped before smoothing.
    float maxSmoothedS   = 1.0f / 30.0f;
};

// Sleeps before input sampling so the CPU blocks less on the GPU and
// swapchain, trading a fraction of a millisecond of headroom for lower
// latency. Also keeps a smoothed delta time for game logic.
//
// Call sleep() once per frame with the time the frame spent blocked
// (FrameScheduler::lastFrameBlocked()).
//
// Thread safety: thread-confined.
class FramePacer {
public:
    explicit FramePacer(const FramePacerOptions& options = {});

    // Laps the frame timer, updates the controller and waits.
    void sleep(std::chrono::nanoseconds slop);

    // The controller step without the clock or the wait. Returns the new
    // sleep budget in milliseconds.
    float update(std::uint64_t slopNs, std::uint64_t deltaNs);

    // Querying the refresh rate is slow on some platforms; call this from a
    // display-changed event rather than every frame.
    void setRefreshRate(float hz) { options_.refreshRateHz = hz; }

    [[nodiscard]] float refreshRateHz()  const { return options_.refreshRateHz; }
    [[nodiscard]] float sleepMs()        const { return sleepMs_; }
    [[nodiscard]] float smoothedDeltaS() const { return smoothedDeltaS_; }
    [[nodiscard]] const FramePacerOptions& options() const { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    FramePacerOptions options_;
    float             sleepMs_        = 0.0f;
    float             smoothedDeltaS_ = 1.0f / 60.0f;
    Clock::time_point lastLap_;
};

} // namespace vkframe
