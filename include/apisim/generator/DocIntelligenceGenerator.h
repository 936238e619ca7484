#pragma once

#include "apisim/generator/Generator.h"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace apisim {
namespace generator {

// Asynchronous analyze flow of the document intelligence API:
//   POST /formrecognizer/documentModels/{model}:analyze          -> 202 + Operation-Location
//   GET  /formrecognizer/documentModels/{model}/analyzeResults/{id} -> 200 succeeded
class DocIntelligenceGenerator : public Generator {
public:
    static constexpr size_t kMaxPendingResults = 4096;

    std::optional<apisim::protocol::HttpResponse> Generate(RequestContext& ctx) override;

private:
    apisim::protocol::HttpResponse Analyze(RequestContext& ctx, const std::string& model);
    apisim::protocol::HttpResponse Result(RequestContext& ctx, const std::string& model, const std::string& id);

    std::mutex mutex_;
    std::map<std::string, std::string> results_; // id -> model
    std::deque<std::string> order_;
};

} // namespace generator
} // namespace apisim
