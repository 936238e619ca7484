#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/monitor/Histogram.h"

#include <atomic>
#include <optional>
#include <string>

namespace apisim {
namespace monitor {

// Process-wide request metrics. Owned by main and handed to the pipeline.
class SimulatorMetrics : apisim::common::noncopyable {
public:
    static constexpr const char* kLatencyBase = "aoai-simulator.latency.base";
    static constexpr const char* kLatencyFull = "aoai-simulator.latency.full";
    static constexpr const char* kTokensUsed = "aoai-simulator.tokens_used";
    static constexpr const char* kTokensRequested = "aoai-simulator.tokens_requested";

    SimulatorMetrics();
    virtual ~SimulatorMetrics() = default;

    // One completed request. Latencies in seconds. Tokens count as requested
    // whenever present and as used only for a successful status.
    virtual void RecordRequest(int statusCode,
                       const std::optional<std::string>& deployment,
                       double baseSeconds,
                       double fullSeconds,
                       const std::optional<long>& tokens);

    void IncFaults() { faults_.fetch_add(1, std::memory_order_relaxed); }
    long faults() const { return faults_.load(std::memory_order_relaxed); }

    const Histogram& latencyBase() const { return latencyBase_; }
    const Histogram& latencyFull() const { return latencyFull_; }
    const Histogram& tokensUsed() const { return tokensUsed_; }
    const Histogram& tokensRequested() const { return tokensRequested_; }

    std::string ToJson() const;

private:
    Histogram latencyBase_;
    Histogram latencyFull_;
    Histogram tokensUsed_;
    Histogram tokensRequested_;
    std::atomic<long> faults_{0};
};

} // namespace monitor
} // namespace apisim
