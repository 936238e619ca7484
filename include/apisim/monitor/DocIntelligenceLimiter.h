#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/monitor/Limiter.h"
#include "apisim/monitor/TokenBucket.h"

namespace apisim {
namespace monitor {

// Requests-per-second limit shared by every document intelligence call.
class DocIntelligenceLimiter : public Limiter, apisim::common::noncopyable {
public:
    // rps must be positive.
    explicit DocIntelligenceLimiter(int requestsPerSecond);

    std::optional<apisim::protocol::HttpResponse> Check(const RequestContext& ctx,
                                                        const apisim::protocol::HttpResponse& response) override;

    std::optional<apisim::protocol::HttpResponse> CheckAt(TokenBucket::Clock::time_point now);

    static apisim::protocol::HttpResponse MakeDenial();

private:
    TokenBucket bucket_;
};

} // namespace monitor
} // namespace apisim
