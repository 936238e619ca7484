#pragma once

#include "apisim/Producer.h"
#include "apisim/common/noncopyable.h"
#include "apisim/generator/Generator.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace apisim {
namespace generator {

// Tries each generator in registration order; the first response wins.
class GeneratorManager : public Producer, apisim::common::noncopyable {
public:
    GeneratorManager() = default;

    // OpenAI first, then document intelligence.
    static std::unique_ptr<GeneratorManager> CreateDefault();

    void Add(std::unique_ptr<Generator> generator);
    size_t size() const { return generators_.size(); }

    std::optional<apisim::protocol::HttpResponse> Generate(RequestContext& ctx);

    // Synchronous: done runs before Produce returns.
    void Produce(const std::shared_ptr<RequestContext>& ctx, Callback done) override;

private:
    std::vector<std::unique_ptr<Generator>> generators_;
};

} // namespace generator
} // namespace apisim
