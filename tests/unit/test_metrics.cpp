#include "apisim/common/Logger.h"
#include "apisim/monitor/Histogram.h"
#include "apisim/monitor/SimulatorMetrics.h"

#include <cassert>
#include <cmath>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using apisim::common::Logger;
using apisim::monitor::Histogram;
using apisim::monitor::SimulatorMetrics;

static void testHistogramSeries() {
    Histogram h("test.latency", "seconds", "", {0.1, 1.0});
    assert(h.Record(0.05, {{"status_code", "200"}}));
    assert(h.Record(0.5, {{"status_code", "200"}}));
    assert(h.Record(3.0, {{"status_code", "200"}}));
    assert(h.Record(0.2, {{"status_code", "429"}}));

    auto s = h.Find({{"status_code", "200"}});
    assert(s);
    assert(s->count == 3);
    assert(std::fabs(s->sum - 3.55) < 1e-9);
    assert(s->min == 0.05);
    assert(s->max == 3.0);
    assert(s->bucketCounts.size() == 3);
    assert(s->bucketCounts[0] == 1);
    assert(s->bucketCounts[1] == 1);
    assert(s->bucketCounts[2] == 1);

    assert(h.TotalCount() == 4);
    assert(!h.Find({{"status_code", "500"}}));
}

static void testNonFiniteDropped() {
    Histogram h("x", "tokens", "", Histogram::TokenBounds());
    assert(!h.Record(std::numeric_limits<double>::quiet_NaN(), {}));
    assert(!h.Record(std::numeric_limits<double>::infinity(), {}));
    assert(h.TotalCount() == 0);
}

static void testTokensUsedOnlyOnSuccess() {
    SimulatorMetrics m;
    m.RecordRequest(200, std::string("gpt-4"), 0.01, 0.5, 100L);
    m.RecordRequest(429, std::string("gpt-4"), 0.01, 0.01, 50L);
    m.RecordRequest(200, std::nullopt, 0.01, 0.01, std::nullopt);

    assert(m.latencyBase().TotalCount() == 3);
    assert(m.latencyFull().TotalCount() == 3);
    assert(m.tokensRequested().TotalCount() == 2);
    assert(m.tokensUsed().TotalCount() == 1);

    auto used = m.tokensUsed().Find({{"deployment", "gpt-4"}});
    assert(used && used->sum == 100.0);
    auto full429 = m.latencyFull().Find({{"status_code", "429"}, {"deployment", "gpt-4"}});
    assert(full429 && full429->count == 1);
    auto noDeployment = m.latencyBase().Find({{"status_code", "200"}});
    assert(noDeployment && noDeployment->count == 1);
}

static void testConcurrentRecording() {
    SimulatorMetrics m;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&m]() {
            for (int i = 0; i < 1000; ++i) {
                m.RecordRequest(200, std::string("d"), 0.001, 0.002, 10L);
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(m.latencyFull().TotalCount() == 4000);
    assert(m.tokensUsed().TotalCount() == 4000);
}

static void testJson() {
    SimulatorMetrics m;
    m.IncFaults();
    m.RecordRequest(200, std::string("gpt-4"), 0.01, 0.02, 7L);
    const std::string json = m.ToJson();
    assert(json.find("\"aoai-simulator.latency.base\"") != std::string::npos);
    assert(json.find("\"aoai-simulator.latency.full\"") != std::string::npos);
    assert(json.find("\"aoai-simulator.tokens_used\"") != std::string::npos);
    assert(json.find("\"aoai-simulator.tokens_requested\"") != std::string::npos);
    assert(json.find("\"faults\" : 1") != std::string::npos);
    assert(m.faults() == 1);
}

int main() {
    Logger::Instance().SetLevel(apisim::common::LogLevel::ERROR);
    testHistogramSeries();
    testNonFiniteDropped();
    testTokensUsedOnlyOnSuccess();
    testConcurrentRecording();
    testJson();
    return 0;
}
