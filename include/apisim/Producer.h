#pragma once

#include "apisim/protocol/HttpResponse.h"

#include <functional>
#include <memory>
#include <optional>

namespace apisim {

struct RequestContext;

// Source of the first response for a request (generation or record/replay).
// `done` runs exactly once on the loop thread, possibly before Produce
// returns. nullopt means no response could be produced. Producers may fill
// in the facts on *ctx.
class Producer {
public:
    using Callback = std::function<void(std::optional<apisim::protocol::HttpResponse>)>;

    virtual ~Producer() = default;

    virtual void Produce(const std::shared_ptr<RequestContext>& ctx, Callback done) = 0;
};

} // namespace apisim
