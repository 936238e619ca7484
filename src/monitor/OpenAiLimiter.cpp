#include "apisim/monitor/OpenAiLimiter.h"
#include "apisim/RequestContext.h"
#include "apisim/common/JsonUtil.h"
#include "apisim/common/Logger.h"

#include <algorithm>
#include <cmath>

namespace apisim {
namespace monitor {

using apisim::protocol::HttpResponse;

OpenAiLimiter::Quota::Quota(int tokensPerMinute)
    : tokens(std::max(tokensPerMinute, 0), std::chrono::seconds(60)),
      requests(RequestsPerTenSeconds(tokensPerMinute), std::chrono::seconds(10)) {}

OpenAiLimiter::OpenAiLimiter(const std::map<std::string, int>& tokensPerMinute) {
    for (const auto& kv : tokensPerMinute) {
        quotas_.emplace(kv.first, std::make_unique<Quota>(kv.second));
    }
}

int64_t OpenAiLimiter::RequestsPerTenSeconds(int tokensPerMinute) {
    if (tokensPerMinute <= 0) return 0;
    const int64_t n = static_cast<int64_t>(tokensPerMinute) * 6 / 1000;
    return std::max<int64_t>(n, 1);
}

HttpResponse OpenAiLimiter::MakeDenial(double retryAfterSeconds) {
    const long seconds = std::max(1L, static_cast<long>(std::ceil(retryAfterSeconds)));

    const std::string message = "Requests to the OpenAI API Simulator have exceeded call rate limit. "
                                "Please retry after " + std::to_string(seconds) + " seconds.";
    HttpResponse resp = HttpResponse::json(HttpResponse::k429TooManyRequests,
                                           apisim::common::ErrorBody("429", message));
    resp.setHeader("Retry-After", std::to_string(seconds));
    return resp;
}

std::optional<HttpResponse> OpenAiLimiter::Check(const RequestContext& ctx, const HttpResponse& response) {
    (void)response;
    if (!ctx.deploymentName) {
        LOG_DEBUG << "No deployment recorded for " << ctx.request.path() << ", not limiting";
        return std::nullopt;
    }
    return CheckAt(Clock::now(), *ctx.deploymentName, ctx.tokenCount.value_or(0));
}

std::optional<HttpResponse> OpenAiLimiter::CheckAt(Clock::time_point now,
                                                   const std::string& deployment,
                                                   long tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotas_.find(deployment);
    if (it == quotas_.end()) {
        LOG_WARN << "Deployment " << deployment << " has no configured quota, not limiting";
        return std::nullopt;
    }
    Quota& quota = *it->second;
    const int64_t cost = std::max(0L, tokens);

    // Both windows must admit the request before either is charged.
    if (!quota.requests.TestAt(now, 1)) {
        LOG_DEBUG << "Request limit reached for deployment " << deployment;
        return MakeDenial(quota.requests.RetryAfterAt(now, 1));
    }
    if (!quota.tokens.TestAt(now, cost)) {
        LOG_DEBUG << "Token limit reached for deployment " << deployment << " (cost " << cost << ")";
        return MakeDenial(quota.tokens.RetryAfterAt(now, cost));
    }
    quota.requests.HitAt(now, 1);
    quota.tokens.HitAt(now, cost);
    return std::nullopt;
}

} // namespace monitor
} // namespace apisim
