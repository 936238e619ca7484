#include "apisim/Pipeline.h"
#include "apisim/common/Logger.h"

#include <typeinfo>
#include <utility>

namespace apisim {

using apisim::protocol::HttpResponse;

struct Pipeline::Flight {
    std::shared_ptr<RequestContext> ctx;
    Done done;
    bool completed{false};
};

namespace {

std::string Describe(const std::exception& e) {
    return std::string(typeid(e).name()) + ": " + e.what();
}

double SecondsSince(Pipeline::Clock::time_point start) {
    return std::chrono::duration<double>(Pipeline::Clock::now() - start).count();
}

} // namespace

Pipeline::Pipeline(apisim::network::EventLoop* loop,
                   const common::SimulatorConfig& config,
                   ModeDispatcher* dispatcher,
                   const apisim::monitor::LimiterRegistry* limiters,
                   apisim::monitor::SimulatorMetrics* metrics)
    : config_(config),
      dispatcher_(dispatcher),
      limiters_(limiters),
      metrics_(metrics),
      latency_(loop) {}

void Pipeline::Handle(apisim::protocol::HttpRequest request, Done done, Clock::time_point start) {
    auto flight = std::make_shared<Flight>();
    flight->ctx = std::make_shared<RequestContext>(config_, std::move(request), start);
    flight->done = std::move(done);
    LOG_DEBUG << "Handling " << flight->ctx->request.method() << " " << flight->ctx->request.target();

    try {
        dispatcher_->Dispatch(flight->ctx, [this, flight](StageResult result) {
            OnDispatched(flight, std::move(result));
        });
    } catch (const std::exception& e) {
        Fail(flight, StageResult::Fault(PipelineError::kInternalFault, Describe(e)));
    }
}

void Pipeline::OnDispatched(const std::shared_ptr<Flight>& flight, StageResult result) {
    if (flight->completed) return;
    if (!result.ok()) {
        Fail(flight, result);
        return;
    }
    try {
        Limit(flight, *result.response);
    } catch (const std::exception& e) {
        Fail(flight, StageResult::Fault(PipelineError::kInternalFault, Describe(e)));
    }
}

void Pipeline::Limit(const std::shared_ptr<Flight>& flight, const HttpResponse& produced) {
    RequestContext& ctx = *flight->ctx;

    std::optional<HttpResponse> replacement = limiters_->Apply(ctx, produced);
    auto outcome = std::make_shared<const HttpResponse>(replacement ? std::move(*replacement) : produced);
    const double baseSeconds = SecondsSince(ctx.startTime);

    latency_.Apply(ctx, *outcome, [this, flight, outcome, baseSeconds]() {
        if (flight->completed) return;
        try {
            Record(flight, *outcome, baseSeconds);
        } catch (const std::exception& e) {
            Fail(flight, StageResult::Fault(PipelineError::kInternalFault, Describe(e)));
        }
    });
}

void Pipeline::Record(const std::shared_ptr<Flight>& flight, const HttpResponse& outcome, double baseSeconds) {
    const RequestContext& ctx = *flight->ctx;
    const double fullSeconds = SecondsSince(ctx.startTime);
    try {
        metrics_->RecordRequest(outcome.statusCode(), ctx.deploymentName, baseSeconds, fullSeconds, ctx.tokenCount);
    } catch (const std::exception& e) {
        // The response still goes out unchanged.
        LOG_ERROR << "Recording metrics for " << ctx.request.path() << " failed: " << Describe(e);
    }
    LOG_DEBUG << "span " << ctx.span.toString() << " status=" << outcome.statusCode()
              << " base=" << baseSeconds << "s full=" << fullSeconds << "s";
    Complete(flight, outcome);
}

void Pipeline::Fail(const std::shared_ptr<Flight>& flight, const StageResult& result) {
    if (flight->completed) return;
    metrics_->IncFaults();
    Complete(flight, ToResponse(result));
}

HttpResponse Pipeline::ToResponse(const StageResult& result) {
    switch (result.error) {
        case PipelineError::kNone:
            return *result.response;
        case PipelineError::kDispatchFault:
            LOG_ERROR << result.detail;
            return HttpResponse(HttpResponse::k500InternalServerError);
        case PipelineError::kInternalFault:
            LOG_ERROR << "Unhandled error: " << result.detail;
            return HttpResponse(HttpResponse::k500InternalServerError);
    }
    return HttpResponse(HttpResponse::k500InternalServerError);
}

void Pipeline::Complete(const std::shared_ptr<Flight>& flight, const HttpResponse& response) {
    if (flight->completed) return;
    flight->completed = true;
    Done done = std::move(flight->done);
    done(response);
}

} // namespace apisim
