#pragma once

#include "apisim/protocol/HttpResponse.h"

#include <optional>

namespace apisim {

struct RequestContext;

namespace monitor {

// Admission control for one logical resource. Implementations are shared by
// all in-flight requests and synchronise internally.
class Limiter {
public:
    virtual ~Limiter() = default;

    // A replacement response when the caller is over quota, nullopt to keep `response`.
    virtual std::optional<apisim::protocol::HttpResponse> Check(const RequestContext& ctx,
                                                                const apisim::protocol::HttpResponse& response) = 0;
};

} // namespace monitor
} // namespace apisim
