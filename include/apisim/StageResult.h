#pragma once

#include "apisim/protocol/HttpResponse.h"

#include <optional>
#include <string>
#include <utility>

namespace apisim {

enum class PipelineError {
    kNone,
    kDispatchFault, // the producer had no response
    kInternalFault, // a stage threw
};

const char* PipelineErrorName(PipelineError error);

// Outcome of one pipeline stage: a response, or an error kind with detail.
struct StageResult {
    std::optional<apisim::protocol::HttpResponse> response;
    PipelineError error{PipelineError::kNone};
    std::string detail;

    bool ok() const { return error == PipelineError::kNone; }

    static StageResult Ok(apisim::protocol::HttpResponse resp) {
        StageResult r;
        r.response = std::move(resp);
        return r;
    }
    static StageResult Fault(PipelineError error, std::string detail) {
        StageResult r;
        r.error = error;
        r.detail = std::move(detail);
        return r;
    }
};

} // namespace apisim
