#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

namespace apisim {
namespace monitor {

// Moving-window counter: at most `limit` units may be consumed within any
// window of `window` length. Each hit stores its timestamp and cost, so the
// memory used is proportional to the hits inside one window.
class MovingWindow {
public:
    using Clock = std::chrono::steady_clock;

    MovingWindow(int64_t limit, Clock::duration window);

    // True if `cost` more units fit right now. Does not consume.
    bool TestAt(Clock::time_point now, int64_t cost);
    // Consumes `cost` units if they fit. Returns false (consuming nothing) otherwise.
    bool HitAt(Clock::time_point now, int64_t cost);

    // Seconds until `cost` units would fit. 0 if they fit now. A cost larger
    // than the limit never fits; the full window length is returned for it.
    double RetryAfterAt(Clock::time_point now, int64_t cost);

    int64_t UsedAt(Clock::time_point now);

    int64_t limit() const { return limit_; }
    Clock::duration window() const { return window_; }

private:
    struct Hit {
        Clock::time_point at;
        int64_t cost;
    };

    void ExpireLocked(Clock::time_point now);
    bool FitsLocked(int64_t cost) const { return used_ + cost <= limit_; }

    const int64_t limit_;
    const Clock::duration window_;

    std::mutex mutex_;
    std::deque<Hit> hits_;
    int64_t used_{0};
};

} // namespace monitor
} // namespace apisim
