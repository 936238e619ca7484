#include "apisim/monitor/TokenBucket.h"
#include "apisim/common/Logger.h"

#include <cassert>
#include <chrono>
#include <stdexcept>

using apisim::common::Logger;
using apisim::monitor::TokenBucket;

static void testBurstAndRefill() {
    auto t0 = TokenBucket::Clock::now();
    TokenBucket bucket(/*rps*/ 10.0, /*burst*/ 5.0, t0);

    for (int i = 0; i < 5; ++i) {
        assert(bucket.AllowAt(t0, 1.0));
    }
    assert(!bucket.AllowAt(t0, 1.0));

    // 100ms at 10/s -> one token.
    auto t1 = t0 + std::chrono::milliseconds(100);
    assert(bucket.AllowAt(t1, 1.0));
    assert(!bucket.AllowAt(t1, 1.0));

    // Refill is capped by capacity.
    auto t2 = t1 + std::chrono::seconds(10);
    int allowed = 0;
    for (int i = 0; i < 10; ++i) {
        if (bucket.AllowAt(t2, 1.0)) ++allowed;
    }
    assert(allowed == 5);
}

static void testWaitSeconds() {
    auto t0 = TokenBucket::Clock::now();
    TokenBucket bucket(2.0, 2.0, t0);
    assert(bucket.WaitSecondsAt(t0, 1.0) == 0.0);
    assert(bucket.AllowAt(t0, 2.0));

    const double wait = bucket.WaitSecondsAt(t0, 1.0);
    assert(wait > 0.49 && wait < 0.51);

    // More than capacity can never be satisfied.
    assert(bucket.WaitSecondsAt(t0, 3.0) < 0.0);
}

static void testNonPositiveCostAllowed() {
    TokenBucket bucket(1.0, 1.0);
    assert(bucket.AllowAt(TokenBucket::Clock::now(), 0.0));
    assert(bucket.AllowAt(TokenBucket::Clock::now(), -1.0));
}

static void testInvalidArguments() {
    bool threw = false;
    try {
        TokenBucket bad(1.0, 0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        TokenBucket bad(-1.0, 1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    Logger::Instance().SetLevel(apisim::common::LogLevel::ERROR);
    testBurstAndRefill();
    testWaitSeconds();
    testNonPositiveCostAllowed();
    testInvalidArguments();
    return 0;
}
