#pragma once

#include "apisim/generator/Generator.h"

#include <string>

namespace Json {
class Value;
}

namespace apisim {
namespace generator {

// Azure OpenAI style endpoints:
//   POST /openai/deployments/{deployment}/chat/completions
//   POST /openai/deployments/{deployment}/completions
//   POST /openai/deployments/{deployment}/embeddings
class OpenAiGenerator : public Generator {
public:
    enum class Operation {
        kChatCompletions,
        kCompletions,
        kEmbeddings,
    };

    struct Route {
        std::string deployment;
        Operation operation;
    };

    static constexpr int kDefaultEmbeddingDimensions = 1536;
    // Larger max_tokens or dimensions values are rejected with 400.
    static constexpr int kMaxCompletionTokens = 128000;
    static constexpr int kMaxEmbeddingDimensions = 3072;

    std::optional<apisim::protocol::HttpResponse> Generate(RequestContext& ctx) override;

    // Recognises the deployment path layout. Does not look at the method.
    static std::optional<Route> ParseRoute(const std::string& path);

private:
    apisim::protocol::HttpResponse ChatCompletion(RequestContext& ctx, const Route& route, const std::string& model,
                                                  const Json::Value& body);
    apisim::protocol::HttpResponse Completion(RequestContext& ctx, const Route& route, const std::string& model,
                                              const Json::Value& body);
    apisim::protocol::HttpResponse Embedding(RequestContext& ctx, const Route& route, const std::string& model,
                                             const Json::Value& body);
};

} // namespace generator
} // namespace apisim
