#pragma once

#include "apisim/ModeDispatcher.h"
#include "apisim/Pipeline.h"
#include "apisim/common/SimulatorConfig.h"
#include "apisim/common/noncopyable.h"
#include "apisim/generator/GeneratorManager.h"
#include "apisim/monitor/CredentialValidator.h"
#include "apisim/monitor/LimiterRegistry.h"
#include "apisim/monitor/SimulatorMetrics.h"
#include "apisim/network/EventLoop.h"
#include "apisim/protocol/HttpServer.h"
#include "apisim/replay/RecordReplayHandler.h"

#include <memory>

namespace apisim {

// HTTP front end of the simulator.
//   GET  /                    liveness, no credentials needed
//   POST /++/save-recordings  persist recordings (record mode only)
//   GET  /++/metrics          JSON snapshot of the request metrics
//   anything else             credential check, then the request pipeline
class SimulatorServer : common::noncopyable {
public:
    static constexpr const char* kSaveRecordingsPath = "/++/save-recordings";
    static constexpr const char* kMetricsPath = "/++/metrics";

    SimulatorServer(apisim::network::EventLoop* loop,
                    const common::SimulatorConfig& config,
                    apisim::monitor::SimulatorMetrics* metrics);

    // Builds the producers and limiters, then binds the listen port.
    // False (after logging) if a forwarder does not resolve or the port is taken.
    bool Start();

    // Writes recordings on shutdown in record mode.
    void Stop();

    void OnRequest(const apisim::protocol::HttpRequest& req, const apisim::protocol::ResponseWriter& writer);

private:
    apisim::protocol::HttpResponse SaveRecordings();

    apisim::network::EventLoop* loop_;
    const common::SimulatorConfig& config_;
    apisim::monitor::SimulatorMetrics* metrics_;
    apisim::monitor::CredentialValidator validator_;

    std::unique_ptr<apisim::monitor::LimiterRegistry> limiters_;
    std::unique_ptr<generator::GeneratorManager> generators_;
    std::unique_ptr<replay::RecordReplayHandler> recordReplay_;
    std::unique_ptr<ModeDispatcher> dispatcher_;
    std::unique_ptr<Pipeline> pipeline_;
    std::unique_ptr<apisim::protocol::HttpServer> http_;
};

} // namespace apisim
