#include "apisim/monitor/LatencyEmulator.h"
#include "apisim/RequestContext.h"
#include "apisim/common/Logger.h"
#include "apisim/protocol/HttpResponse.h"

namespace apisim {
namespace monitor {

double LatencyEmulator::ExtraDelaySeconds(const RequestContext& ctx,
                                          const apisim::protocol::HttpResponse& response,
                                          Clock::time_point now) {
    if (!response.isSuccess()) return 0.0;
    const double target = ctx.recordedDurationMs.value_or(0.0) / 1000.0;
    const double elapsed = std::chrono::duration<double>(now - ctx.startTime).count();
    const double extra = target - elapsed;
    return extra > 0.0 ? extra : 0.0;
}

void LatencyEmulator::Apply(RequestContext& ctx, const apisim::protocol::HttpResponse& response, Callback done) const {
    const double extra = ExtraDelaySeconds(ctx, response, Clock::now());
    if (extra <= 0.0) {
        done();
        return;
    }
    ctx.span.setAttribute(kAddedLatencyAttribute, extra);
    LOG_DEBUG << "Adding " << extra * 1000.0 << "ms latency to " << ctx.request.path();
    loop_->RunAfter(extra, std::move(done));
}

} // namespace monitor
} // namespace apisim
