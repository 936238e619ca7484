#include "apisim/generator/DocIntelligenceGenerator.h"
#include "apisim/RequestContext.h"
#include "apisim/common/JsonUtil.h"
#include "apisim/common/Logger.h"
#include "apisim/generator/TokenEstimator.h"
#include "apisim/monitor/LimiterRegistry.h"

#include <openssl/rand.h>

#include <chrono>
#include <cstdio>
#include <ctime>

namespace apisim {
namespace generator {

using apisim::protocol::HttpResponse;

namespace {

const std::string kModelsPrefix = "/formrecognizer/documentModels/";
const std::string kAnalyzeSuffix = ":analyze";
const std::string kResultsSegment = "/analyzeResults/";

// 8-4-4-4-12 hex, version 4 layout.
std::string NewOperationId() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        for (size_t i = 0; i < sizeof(b); ++i) b[i] = static_cast<unsigned char>(now >> ((i % 8) * 8));
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return out;
}

std::string IsoNow() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string ApiVersion(const apisim::protocol::HttpRequest& req) {
    const std::string key = "api-version=";
    const std::string& q = req.query();
    size_t pos = q.find(key);
    if (pos == std::string::npos || (pos > 0 && q[pos - 1] != '&')) return "2023-07-31";
    pos += key.size();
    const size_t end = q.find('&', pos);
    return q.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

} // namespace

std::optional<HttpResponse> DocIntelligenceGenerator::Generate(RequestContext& ctx) {
    const std::string& path = ctx.request.path();
    if (path.compare(0, kModelsPrefix.size(), kModelsPrefix) != 0) return std::nullopt;
    const std::string rest = path.substr(kModelsPrefix.size());

    if (ctx.request.method() == "POST" && rest.size() > kAnalyzeSuffix.size() &&
        rest.compare(rest.size() - kAnalyzeSuffix.size(), kAnalyzeSuffix.size(), kAnalyzeSuffix) == 0) {
        const std::string model = rest.substr(0, rest.size() - kAnalyzeSuffix.size());
        if (model.find('/') != std::string::npos) return std::nullopt;
        return Analyze(ctx, model);
    }

    const size_t seg = rest.find(kResultsSegment);
    if (ctx.request.method() == "GET" && seg != std::string::npos && seg > 0) {
        const std::string model = rest.substr(0, seg);
        const std::string id = rest.substr(seg + kResultsSegment.size());
        if (id.empty() || id.find('/') != std::string::npos) return std::nullopt;
        return Result(ctx, model, id);
    }
    return std::nullopt;
}

HttpResponse DocIntelligenceGenerator::Analyze(RequestContext& ctx, const std::string& model) {
    const std::string id = NewOperationId();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        results_[id] = model;
        order_.push_back(id);
        while (order_.size() > kMaxPendingResults) {
            results_.erase(order_.front());
            order_.pop_front();
        }
    }

    ctx.limiterKey = apisim::monitor::LimiterRegistry::kDocIntelligence;
    if (ctx.config.latency.docIntelligenceMs > 0.0) {
        ctx.recordedDurationMs = ctx.config.latency.docIntelligenceMs;
    }

    std::string host = ctx.request.getHeader("Host");
    if (host.empty()) host = "localhost:" + std::to_string(ctx.config.listenPort);
    const std::string location = "http://" + host + kModelsPrefix + model + kResultsSegment + id +
                                 "?api-version=" + ApiVersion(ctx.request);

    HttpResponse resp(HttpResponse::k202Accepted);
    resp.setHeader("Operation-Location", location);
    resp.setHeader("apim-request-id", id);
    return resp;
}

HttpResponse DocIntelligenceGenerator::Result(RequestContext& ctx, const std::string& model, const std::string& id) {
    ctx.limiterKey = apisim::monitor::LimiterRegistry::kDocIntelligence;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = results_.find(id);
        if (it == results_.end() || it->second != model) {
            return HttpResponse::json(HttpResponse::k404NotFound,
                                      apisim::common::ErrorBody("NotFound", "Resource not found."));
        }
    }

    const std::string content = TokenEstimator::LoremText(32);

    Json::Value span(Json::objectValue);
    span["offset"] = 0;
    span["length"] = static_cast<int>(content.size());

    Json::Value page(Json::objectValue);
    page["pageNumber"] = 1;
    page["angle"] = 0;
    page["width"] = 8.5;
    page["height"] = 11;
    page["unit"] = "inch";
    page["spans"].append(span);

    Json::Value paragraph(Json::objectValue);
    paragraph["content"] = content;
    paragraph["spans"].append(span);

    Json::Value analyzeResult(Json::objectValue);
    analyzeResult["apiVersion"] = ApiVersion(ctx.request);
    analyzeResult["modelId"] = model;
    analyzeResult["stringIndexType"] = "utf16CodeUnit";
    analyzeResult["content"] = content;
    analyzeResult["pages"].append(page);
    analyzeResult["paragraphs"].append(paragraph);

    const std::string now = IsoNow();
    Json::Value out(Json::objectValue);
    out["status"] = "succeeded";
    out["createdDateTime"] = now;
    out["lastUpdatedDateTime"] = now;
    out["analyzeResult"] = analyzeResult;
    return HttpResponse::json(HttpResponse::k200Ok, apisim::common::ToCompactJson(out));
}

} // namespace generator
} // namespace apisim
