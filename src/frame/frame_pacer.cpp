#include <vkframe/frame_pacer.hpp>

#include <algorithm>
#include <thread>

namespace vkframe {

static float lerp(float a, float b, float t) { return a + (b - a) * t; }

FramePacer::FramePacer(const FramePacerOptions& options)
    : options_(options), lastLap_(Clock::now()) {}

float FramePacer::update(std::uint64_t slopNs, std::uint64_t deltaNs) {
    const float slopMs   = static_cast<float>(slopNs) / 1.0e6f;
    const float deltaMs  = static_cast<float>(deltaNs) / 1.0e6f;
    const float deltaS   = static_cast<float>(deltaNs) / 1.0e9f;
    const float periodMs = options_.refreshRateHz == 0.0f ? 0.0f
                                                          : 1000.0f / options_.refreshRateHz;

    smoothedDeltaS_ = lerp(smoothedDeltaS_, std::min(deltaS, options_.maxSmoothedS),
                           options_.smoothedRwa);

    // Without a period there is nothing to bound the sleep by; a headroom
    // that is too small for the platform would grow it forever.
    if (periodMs == 0.0f) return sleepMs_;

    if (deltaMs > periodMs + options_.overshootMs) {
        sleepMs_ *= options_.overshootScale;
    } else {
        sleepMs_ += (slopMs - options_.headroomMs) * options_.sleepRwa;
    }

    sleepMs_ = std::clamp(sleepMs_, 0.0f, std::max(periodMs - options_.headroomMs, 0.0f));
    return sleepMs_;
}

void FramePacer::sleep(std::chrono::nanoseconds slop) {
    const Clock::time_point now = Clock::now();
    const auto delta = std::chrono::duration_cast<std::chrono::nanoseconds>(now - lastLap_);
    lastLap_ = now;

    const float budgetMs = update(static_cast<std::uint64_t>(std::max<std::int64_t>(slop.count(), 0)),
                                  static_cast<std::uint64_t>(delta.count()));
    if (budgetMs <= 0.0f) return;

    // OS sleeps overshoot by a scheduler quantum or more, so only sleep the
    // first two thirds of a long wait and spin for the rest.
    const auto budget = std::chrono::nanoseconds(static_cast<std::int64_t>(budgetMs * 1.0e6f));
    const Clock::time_point deadline = Clock::now() + budget;
    if (budgetMs > 5.0f) {
        std::this_thread::sleep_for(budget * 2 / 3);
    }
    while (Clock::now() < deadline) {
    }
}

} // namespace vkframe
