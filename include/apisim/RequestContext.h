#pragma once

#include "apisim/common/SimulatorConfig.h"
#include "apisim/protocol/HttpRequest.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace apisim {

// Trace record for one request. Attributes are rendered when the span is logged.
struct Span {
    std::string name;
    std::map<std::string, std::string> attributes;

    void setAttribute(const std::string& key, const std::string& value) { attributes[key] = value; }
    void setAttribute(const std::string& key, double value) { attributes[key] = std::to_string(value); }
    std::string toString() const;
};

// State of one request while it moves through the pipeline. Created after
// authentication succeeds and owned by that request alone.
//
// Producers fill in the facts they know:
//   limiterKey         which limiter applies ("openai", "docintelligence")
//   deploymentName     resource the request consumed
//   tokenCount         tokens consumed (prompt plus completion)
//   recordedDurationMs how long the real service would take to answer
struct RequestContext {
    using Clock = std::chrono::steady_clock;

    RequestContext(const common::SimulatorConfig& cfg,
                   protocol::HttpRequest req,
                   Clock::time_point start = Clock::now())
        : config(cfg), request(std::move(req)), startTime(start) {
        span.name = request.method() + " " + request.path();
    }

    const common::SimulatorConfig& config;
    const protocol::HttpRequest request;
    const Clock::time_point startTime;

    std::optional<std::string> limiterKey;
    std::optional<std::string> deploymentName;
    std::optional<long> tokenCount;
    std::optional<double> recordedDurationMs;

    Span span;
};

} // namespace apisim
