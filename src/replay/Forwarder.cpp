#include "apisim/replay/Forwarder.h"
#include "apisim/common/JsonUtil.h"
#include "apisim/common/Logger.h"
#include "apisim/generator/OpenAiGenerator.h"
#include "apisim/monitor/CredentialValidator.h"
#include "apisim/monitor/LimiterRegistry.h"
#include "apisim/protocol/Compression.h"
#include "apisim/protocol/HttpClient.h"
#include "apisim/protocol/HttpRequest.h"
#include "apisim/replay/Recording.h"

#include <chrono>
#include <utility>

namespace apisim {
namespace replay {

using apisim::common::ForwarderKind;
using apisim::monitor::CredentialValidator;
using apisim::protocol::HttpRequest;
using apisim::protocol::HttpResponse;

Forwarder::Forwarder(apisim::network::EventLoop* loop,
                     apisim::common::ForwarderConfig cfg,
                     const apisim::network::InetAddress& upstream)
    : loop_(loop), cfg_(std::move(cfg)), upstream_(upstream) {}

std::unique_ptr<Forwarder> Forwarder::Create(apisim::network::EventLoop* loop,
                                             const apisim::common::ForwarderConfig& cfg) {
    auto addr = apisim::network::InetAddress::Resolve(cfg.host, cfg.port);
    if (!addr) {
        LOG_ERROR << "Forwarder " << cfg.name << ": cannot resolve " << cfg.host;
        return nullptr;
    }
    LOG_INFO << "Forwarder " << cfg.name << ": " << cfg.pathPrefix << " -> " << addr->toIpPort();
    return std::make_unique<Forwarder>(loop, cfg, *addr);
}

bool Forwarder::Matches(const std::string& path) const {
    return path.compare(0, cfg_.pathPrefix.size(), cfg_.pathPrefix) == 0;
}

std::string Forwarder::BuildRequest(const HttpRequest& req) const {
    HttpRequest out = req;
    out.setHeader("Host", cfg_.port == 80 ? cfg_.host : cfg_.host + ":" + std::to_string(cfg_.port));
    out.setHeader("Connection", "close");
    out.removeHeader("Keep-Alive");
    out.removeHeader("Transfer-Encoding");

    if (!cfg_.apiKey.empty()) {
        out.removeHeader(CredentialValidator::kAuthorizationHeader);
        out.removeHeader(CredentialValidator::kApiKeyHeader);
        out.removeHeader(CredentialValidator::kSubscriptionKeyHeader);
        switch (cfg_.kind) {
            case ForwarderKind::kOpenAi:
                out.setHeader(CredentialValidator::kApiKeyHeader, cfg_.apiKey);
                break;
            case ForwarderKind::kDocIntelligence:
                out.setHeader(CredentialValidator::kSubscriptionKeyHeader, cfg_.apiKey);
                break;
        }
    }
    return out.toWire();
}

void Forwarder::Forward(const HttpRequest& req, Callback cb) {
    const auto start = std::chrono::steady_clock::now();
    auto client = std::make_shared<apisim::protocol::HttpClient>(loop_, upstream_, "forward-" + cfg_.name);
    client->Send(BuildRequest(req), cfg_.timeoutMs / 1000.0,
                 [cb, start](std::optional<HttpResponse> resp) {
                     if (!resp) {
                         cb(std::nullopt);
                         return;
                     }
                     const double ms = std::chrono::duration<double, std::milli>(
                         std::chrono::steady_clock::now() - start).count();
                     cb(Exchange{std::move(*resp), ms});
                 });
}

void Forwarder::DeriveFacts(const HttpRequest& req, const HttpResponse& resp, Recording* rec) const {
    switch (cfg_.kind) {
        case ForwarderKind::kDocIntelligence:
            rec->limiterKey = apisim::monitor::LimiterRegistry::kDocIntelligence;
            return;
        case ForwarderKind::kOpenAi:
            break;
    }

    rec->limiterKey = apisim::monitor::LimiterRegistry::kOpenAi;
    auto route = apisim::generator::OpenAiGenerator::ParseRoute(req.path());
    if (route) rec->deploymentName = route->deployment;

    std::string body = resp.body();
    const auto enc = apisim::protocol::Compression::ParseContentEncoding(resp.getHeader("Content-Encoding"));
    if (enc == apisim::protocol::Compression::Encoding::kGzip ||
        enc == apisim::protocol::Compression::Encoding::kDeflate) {
        std::string plain;
        if (!apisim::protocol::Compression::Decompress(enc, body, &plain)) {
            LOG_WARN << "Cannot decode upstream body for " << req.path();
            return;
        }
        body.swap(plain);
    }

    Json::Value json;
    if (!apisim::common::ParseJson(body, &json) || !json.isObject()) return;
    const Json::Value& usage = json["usage"];
    if (!usage.isObject()) return;
    const Json::Value& total = usage["total_tokens"];
    if (total.isInt64() && total.asInt64() >= 0) rec->tokenCount = total.asInt64();
}

} // namespace replay
} // namespace apisim
