#include "apisim/monitor/MovingWindow.h"

#include <stdexcept>

namespace apisim {
namespace monitor {

MovingWindow::MovingWindow(int64_t limit, Clock::duration window)
    : limit_(limit), window_(window) {
    if (limit_ < 0) {
        throw std::invalid_argument("MovingWindow limit must be >= 0");
    }
    if (window_ <= Clock::duration::zero()) {
        throw std::invalid_argument("MovingWindow window must be > 0");
    }
}

void MovingWindow::ExpireLocked(Clock::time_point now) {
    while (!hits_.empty() && hits_.front().at + window_ <= now) {
        used_ -= hits_.front().cost;
        hits_.pop_front();
    }
}

bool MovingWindow::TestAt(Clock::time_point now, int64_t cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExpireLocked(now);
    return FitsLocked(cost);
}

bool MovingWindow::HitAt(Clock::time_point now, int64_t cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExpireLocked(now);
    if (!FitsLocked(cost)) return false;
    if (cost > 0) {
        hits_.push_back(Hit{now, cost});
        used_ += cost;
    }
    return true;
}

double MovingWindow::RetryAfterAt(Clock::time_point now, int64_t cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExpireLocked(now);
    if (FitsLocked(cost)) return 0.0;
    if (cost > limit_) {
        return std::chrono::duration<double>(window_).count();
    }

    // Walk the oldest hits until enough units have expired.
    int64_t freed = 0;
    for (const auto& hit : hits_) {
        freed += hit.cost;
        if (used_ - freed + cost <= limit_) {
            return std::chrono::duration<double>(hit.at + window_ - now).count();
        }
    }
    return std::chrono::duration<double>(window_).count();
}

int64_t MovingWindow::UsedAt(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExpireLocked(now);
    return used_;
}

} // namespace monitor
} // namespace apisim
