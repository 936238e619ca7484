#pragma once

#include "apisim/ModeDispatcher.h"
#include "apisim/RequestContext.h"
#include "apisim/StageResult.h"
#include "apisim/common/noncopyable.h"
#include "apisim/monitor/LatencyEmulator.h"
#include "apisim/monitor/LimiterRegistry.h"
#include "apisim/monitor/SimulatorMetrics.h"
#include "apisim/network/EventLoop.h"

#include <functional>
#include <memory>

namespace apisim {

// Request lifecycle after authentication:
//   dispatch -> limiter -> latency -> metrics -> respond
// Faults at any stage end the request with a bare 500. Everything runs on
// the loop thread; only the producer and the latency wait suspend.
class Pipeline : common::noncopyable {
public:
    using Done = std::function<void(const apisim::protocol::HttpResponse&)>;
    using Clock = RequestContext::Clock;

    Pipeline(apisim::network::EventLoop* loop,
             const common::SimulatorConfig& config,
             ModeDispatcher* dispatcher,
             const apisim::monitor::LimiterRegistry* limiters,
             apisim::monitor::SimulatorMetrics* metrics);

    // start is the moment authentication succeeded. done runs exactly once.
    void Handle(apisim::protocol::HttpRequest request, Done done, Clock::time_point start = Clock::now());

private:
    struct Flight;

    void OnDispatched(const std::shared_ptr<Flight>& flight, StageResult result);
    void Limit(const std::shared_ptr<Flight>& flight, const apisim::protocol::HttpResponse& produced);
    void Record(const std::shared_ptr<Flight>& flight,
                const apisim::protocol::HttpResponse& outcome,
                double baseSeconds);
    void Fail(const std::shared_ptr<Flight>& flight, const StageResult& result);
    static void Complete(const std::shared_ptr<Flight>& flight, const apisim::protocol::HttpResponse& response);

    // Exhaustive: every error kind maps to its outcome response.
    static apisim::protocol::HttpResponse ToResponse(const StageResult& result);

    const common::SimulatorConfig& config_;
    ModeDispatcher* dispatcher_;
    const apisim::monitor::LimiterRegistry* limiters_;
    apisim::monitor::SimulatorMetrics* metrics_;
    apisim::monitor::LatencyEmulator latency_;
};

} // namespace apisim
