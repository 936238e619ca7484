#include "apisim/monitor/SimulatorMetrics.h"

#include <json/json.h>

namespace apisim {
namespace monitor {

SimulatorMetrics::SimulatorMetrics()
    : latencyBase_(kLatencyBase, "seconds",
                   "Latency of handling the request (before adding simulated latency)",
                   Histogram::SecondsBounds()),
      latencyFull_(kLatencyFull, "seconds",
                   "Full latency of handling the request (including simulated latency)",
                   Histogram::SecondsBounds()),
      tokensUsed_(kTokensUsed, "tokens", "Number of tokens used per request", Histogram::TokenBounds()),
      tokensRequested_(kTokensRequested, "tokens",
                       "Number of tokens across all requests (success or not)",
                       Histogram::TokenBounds()) {}

void SimulatorMetrics::RecordRequest(int statusCode,
                                     const std::optional<std::string>& deployment,
                                     double baseSeconds,
                                     double fullSeconds,
                                     const std::optional<long>& tokens) {
    Histogram::Attributes latencyAttrs{{"status_code", std::to_string(statusCode)}};
    Histogram::Attributes tokenAttrs;
    if (deployment) {
        latencyAttrs["deployment"] = *deployment;
        tokenAttrs["deployment"] = *deployment;
    }

    latencyBase_.Record(baseSeconds, latencyAttrs);
    latencyFull_.Record(fullSeconds, latencyAttrs);

    if (tokens) {
        tokensRequested_.Record(static_cast<double>(*tokens), tokenAttrs);
        if (statusCode < 300) {
            tokensUsed_.Record(static_cast<double>(*tokens), tokenAttrs);
        }
    }
}

std::string SimulatorMetrics::ToJson() const {
    Json::Value root(Json::objectValue);
    Json::Value histograms(Json::objectValue);
    histograms[kLatencyBase] = latencyBase_.ToJson();
    histograms[kLatencyFull] = latencyFull_.ToJson();
    histograms[kTokensUsed] = tokensUsed_.ToJson();
    histograms[kTokensRequested] = tokensRequested_.ToJson();
    root["histograms"] = histograms;
    root["faults"] = Json::Int64(faults());

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root);
}

} // namespace monitor
} // namespace apisim
