#include "apisim/SimulatorServer.h"
#include "apisim/common/JsonUtil.h"
#include "apisim/common/Logger.h"
#include "apisim/network/InetAddress.h"
#include "apisim/protocol/HttpRequest.h"

namespace apisim {

using apisim::common::SimulatorMode;
using apisim::monitor::CredentialValidator;
using apisim::protocol::HttpRequest;
using apisim::protocol::HttpResponse;
using apisim::protocol::ResponseWriter;

SimulatorServer::SimulatorServer(apisim::network::EventLoop* loop,
                                 const common::SimulatorConfig& config,
                                 apisim::monitor::SimulatorMetrics* metrics)
    : loop_(loop),
      config_(config),
      metrics_(metrics),
      validator_(config.apiKey) {}

bool SimulatorServer::Start() {
    LOG_INFO << "Starting simulator in " << common::ModeName(config_.mode) << " mode";
    LOG_INFO << "Simulator api-key: " << config_.apiKey;

    limiters_ = apisim::monitor::LimiterRegistry::FromConfig(config_);

    switch (config_.mode) {
        case SimulatorMode::kGenerate:
            generators_ = generator::GeneratorManager::CreateDefault();
            break;
        case SimulatorMode::kRecord:
        case SimulatorMode::kReplay:
            recordReplay_ = replay::RecordReplayHandler::FromConfig(loop_, config_);
            if (!recordReplay_) return false;
            break;
    }

    dispatcher_ = std::make_unique<ModeDispatcher>(config_.mode, generators_.get(), recordReplay_.get());
    pipeline_ = std::make_unique<Pipeline>(loop_, config_, dispatcher_.get(), limiters_.get(), metrics_);

    http_ = std::make_unique<apisim::protocol::HttpServer>(
        loop_, apisim::network::InetAddress(config_.listenPort), "apisim");
    http_->setHttpCallback([this](const HttpRequest& req, const ResponseWriter& writer) {
        OnRequest(req, writer);
    });
    return http_->start();
}

void SimulatorServer::Stop() {
    if (recordReplay_ && config_.mode == SimulatorMode::kRecord) {
        size_t written = 0;
        if (!recordReplay_->SaveRecordings(&written)) {
            LOG_ERROR << "Saving recordings on shutdown failed";
        } else if (written > 0) {
            LOG_INFO << "Saved " << written << " recording files on shutdown";
        }
    }
}

HttpResponse SimulatorServer::SaveRecordings() {
    if (config_.mode != SimulatorMode::kRecord || !recordReplay_) {
        LOG_WARN << "Not saving recordings as not in record mode";
        return HttpResponse::text(HttpResponse::k400BadRequest, "Not saving recordings as not in record mode");
    }
    LOG_INFO << "Saving recordings...";
    size_t written = 0;
    if (!recordReplay_->SaveRecordings(&written)) {
        return HttpResponse::text(HttpResponse::k500InternalServerError, "Saving recordings failed");
    }
    LOG_INFO << "Recordings saved (" << written << " files)";
    return HttpResponse::text(HttpResponse::k200Ok, "Recordings saved");
}

void SimulatorServer::OnRequest(const HttpRequest& req, const ResponseWriter& writer) {
    if (req.path() == "/" && req.method() == "GET") {
        Json::Value body(Json::objectValue);
        body["message"] = "apisim is running";
        writer.Write(HttpResponse::json(HttpResponse::k200Ok, common::ToCompactJson(body)));
        return;
    }

    if (validator_.Validate(req) == CredentialValidator::Carrier::kNone) {
        Json::Value body(Json::objectValue);
        body["detail"] = "Missing or incorrect API Key";
        writer.Write(HttpResponse::json(HttpResponse::k401Unauthorized, common::ToCompactJson(body)));
        return;
    }

    if (req.path() == kSaveRecordingsPath && req.method() == "POST") {
        writer.Write(SaveRecordings());
        return;
    }
    if (req.path() == kMetricsPath && req.method() == "GET") {
        writer.Write(HttpResponse::json(HttpResponse::k200Ok, metrics_->ToJson()));
        return;
    }

    pipeline_->Handle(req, [writer](const HttpResponse& resp) { writer.Write(resp); });
}

} // namespace apisim
