#pragma once

#include "apisim/protocol/HttpResponse.h"

#include <optional>

namespace apisim {

struct RequestContext;

namespace generator {

// Synthesises a response for the requests it recognises. nullopt means
// "not mine" and lets the next generator try.
class Generator {
public:
    virtual ~Generator() = default;

    virtual std::optional<apisim::protocol::HttpResponse> Generate(RequestContext& ctx) = 0;
};

} // namespace generator
} // namespace apisim
