#include "apisim/monitor/DocIntelligenceLimiter.h"
#include "apisim/RequestContext.h"
#include "apisim/common/JsonUtil.h"
#include "apisim/common/Logger.h"

namespace apisim {
namespace monitor {

using apisim::protocol::HttpResponse;

DocIntelligenceLimiter::DocIntelligenceLimiter(int requestsPerSecond)
    : bucket_(static_cast<double>(requestsPerSecond), static_cast<double>(requestsPerSecond)) {}

HttpResponse DocIntelligenceLimiter::MakeDenial() {
    HttpResponse resp = HttpResponse::json(
        HttpResponse::k429TooManyRequests,
        apisim::common::ErrorBody("429", "Requests to the Form Recognizer API Simulator have exceeded rate limit. "
                                         "Please retry after 1 second."));
    resp.setHeader("Retry-After", "1");
    return resp;
}

std::optional<HttpResponse> DocIntelligenceLimiter::Check(const RequestContext& ctx, const HttpResponse& response) {
    (void)response;
    auto denial = CheckAt(TokenBucket::Clock::now());
    if (denial) {
        LOG_DEBUG << "Document intelligence rate limit reached for " << ctx.request.path();
    }
    return denial;
}

std::optional<HttpResponse> DocIntelligenceLimiter::CheckAt(TokenBucket::Clock::time_point now) {
    if (bucket_.AllowAt(now, 1.0)) return std::nullopt;
    return MakeDenial();
}

} // namespace monitor
} // namespace apisim
