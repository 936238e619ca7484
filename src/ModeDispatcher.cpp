#include "apisim/ModeDispatcher.h"
#include "apisim/RequestContext.h"

#include <utility>

namespace apisim {

ModeDispatcher::ModeDispatcher(common::SimulatorMode mode, Producer* generator, Producer* recordReplay)
    : mode_(mode), generator_(generator), recordReplay_(recordReplay) {}

Producer* ModeDispatcher::ProducerForMode() const {
    switch (mode_) {
        case common::SimulatorMode::kGenerate:
            return generator_;
        case common::SimulatorMode::kRecord:
        case common::SimulatorMode::kReplay:
            return recordReplay_;
    }
    return nullptr;
}

void ModeDispatcher::Dispatch(const std::shared_ptr<RequestContext>& ctx, Callback cb) {
    Producer* producer = ProducerForMode();
    if (producer == nullptr) {
        cb(StageResult::Fault(PipelineError::kDispatchFault,
                              std::string("no producer for mode ") + common::ModeName(mode_)));
        return;
    }
    producer->Produce(ctx, [cb, ctx](std::optional<apisim::protocol::HttpResponse> resp) {
        if (!resp) {
            cb(StageResult::Fault(PipelineError::kDispatchFault,
                                  "No response generated for request: " + ctx->request.path()));
            return;
        }
        cb(StageResult::Ok(std::move(*resp)));
    });
}

} // namespace apisim
