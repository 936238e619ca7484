#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/monitor/Limiter.h"
#include "apisim/monitor/MovingWindow.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace apisim {
namespace monitor {

// Per-deployment quota modelled on the Azure OpenAI service:
// - tokens: tokensPerMinute over a moving 60s window
// - requests: tokensPerMinute / 1000 * 6 over a moving 10s window
// A quota of 0 denies every request.
class OpenAiLimiter : public Limiter, apisim::common::noncopyable {
public:
    using Clock = MovingWindow::Clock;

    // deployment name -> tokens per minute
    explicit OpenAiLimiter(const std::map<std::string, int>& tokensPerMinute);

    std::optional<apisim::protocol::HttpResponse> Check(const RequestContext& ctx,
                                                        const apisim::protocol::HttpResponse& response) override;

    std::optional<apisim::protocol::HttpResponse> CheckAt(Clock::time_point now,
                                                          const std::string& deployment,
                                                          long tokens);

    static int64_t RequestsPerTenSeconds(int tokensPerMinute);
    static apisim::protocol::HttpResponse MakeDenial(double retryAfterSeconds);

private:
    struct Quota {
        Quota(int tokensPerMinute);
        MovingWindow tokens;
        MovingWindow requests;
    };

    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Quota>> quotas_;
};

} // namespace monitor
} // namespace apisim
