#include "apisim/StageResult.h"

namespace apisim {

const char* PipelineErrorName(PipelineError error) {
    switch (error) {
        case PipelineError::kNone: return "none";
        case PipelineError::kDispatchFault: return "dispatch fault";
        case PipelineError::kInternalFault: return "internal fault";
    }
    return "unknown";
}

} // namespace apisim
