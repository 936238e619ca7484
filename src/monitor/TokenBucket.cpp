#include "apisim/monitor/TokenBucket.h"

#include <algorithm>
#include <stdexcept>

namespace apisim {
namespace monitor {

TokenBucket::TokenBucket(double refillRate, double capacity)
    : TokenBucket(refillRate, capacity, Clock::now()) {}

TokenBucket::TokenBucket(double refillRate, double capacity, Clock::time_point start)
    : refill_rate_tokens_per_sec_(refillRate),
      capacity_tokens_(capacity),
      tokens_(capacity),
      last_refill_(start) {
    if (refill_rate_tokens_per_sec_ < 0.0) {
        throw std::invalid_argument("TokenBucket refillRate must be >= 0");
    }
    if (capacity_tokens_ <= 0.0) {
        throw std::invalid_argument("TokenBucket capacity must be > 0");
    }
}

bool TokenBucket::Allow(double cost) {
    return AllowAt(Clock::now(), cost);
}

void TokenBucket::RefillLocked(Clock::time_point now) {
    if (now <= last_refill_) return;
    const std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_ = std::min(capacity_tokens_, tokens_ + elapsed.count() * refill_rate_tokens_per_sec_);
    last_refill_ = now;
}

bool TokenBucket::AllowAt(Clock::time_point now, double cost) {
    if (cost <= 0.0) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(now);
    if (tokens_ >= cost) {
        tokens_ -= cost;
        return true;
    }
    return false;
}

double TokenBucket::WaitSecondsAt(Clock::time_point now, double cost) {
    if (cost <= 0.0) return 0.0;
    if (cost > capacity_tokens_) return -1.0;

    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(now);
    if (tokens_ >= cost) return 0.0;
    if (refill_rate_tokens_per_sec_ <= 0.0) return -1.0;
    return (cost - tokens_) / refill_rate_tokens_per_sec_;
}

} // namespace monitor
} // namespace apisim
