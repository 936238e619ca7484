#pragma once

#include "apisim/Producer.h"
#include "apisim/StageResult.h"
#include "apisim/common/SimulatorConfig.h"

#include <functional>
#include <memory>

namespace apisim {

// Routes each request to the producer of the process-wide mode:
// generate -> generator, record/replay -> record/replay handler.
class ModeDispatcher {
public:
    using Callback = std::function<void(StageResult)>;

    // Producers are not owned. The one for an inactive mode may be null.
    ModeDispatcher(common::SimulatorMode mode, Producer* generator, Producer* recordReplay);

    // cb runs exactly once. No response becomes kDispatchFault.
    void Dispatch(const std::shared_ptr<RequestContext>& ctx, Callback cb);

    common::SimulatorMode mode() const { return mode_; }

private:
    Producer* ProducerForMode() const;

    const common::SimulatorMode mode_;
    Producer* generator_;
    Producer* recordReplay_;
};

} // namespace apisim
