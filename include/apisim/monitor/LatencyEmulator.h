#pragma once

#include "apisim/network/EventLoop.h"

#include <chrono>
#include <functional>

namespace apisim {

struct RequestContext;

namespace protocol {
class HttpResponse;
}

namespace monitor {

// Stretches successful responses to the duration the real service would
// have taken. The wait is a loop timer so other requests keep running.
class LatencyEmulator {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    static constexpr const char* kAddedLatencyAttribute = "simulator.added_latency";

    explicit LatencyEmulator(apisim::network::EventLoop* loop) : loop_(loop) {}

    // recordedDurationMs (0 when absent) minus the time already spent since
    // ctx.startTime. Zero for unsuccessful responses or when already late.
    static double ExtraDelaySeconds(const RequestContext& ctx,
                                    const apisim::protocol::HttpResponse& response,
                                    Clock::time_point now);

    // Runs done after the extra delay, or immediately when there is none.
    // Records the delay on ctx.span when one is added.
    void Apply(RequestContext& ctx, const apisim::protocol::HttpResponse& response, Callback done) const;

private:
    apisim::network::EventLoop* loop_;
};

} // namespace monitor
} // namespace apisim
