#pragma once

#include <chrono>
#include <mutex>

namespace apisim {
namespace monitor {

// Token bucket admission control.
// - refillRate: tokens added per second
// - capacity: maximum tokens held (burst)
// The bucket starts full.
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double refillRate, double capacity);
    TokenBucket(double refillRate, double capacity, Clock::time_point start);

    bool Allow(double cost = 1.0);
    bool AllowAt(Clock::time_point now, double cost = 1.0);

    // Seconds until `cost` tokens would be available. 0 when already available.
    // Negative when cost exceeds capacity and can never be satisfied.
    double WaitSecondsAt(Clock::time_point now, double cost = 1.0);

    double refillRate() const { return refill_rate_tokens_per_sec_; }
    double capacity() const { return capacity_tokens_; }

private:
    void RefillLocked(Clock::time_point now);

    const double refill_rate_tokens_per_sec_;
    const double capacity_tokens_;

    std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
};

} // namespace monitor
} // namespace apisim
