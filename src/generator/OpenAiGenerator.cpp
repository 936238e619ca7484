#include "apisim/generator/OpenAiGenerator.h"
#include "apisim/RequestContext.h"
#include "apisim/common/JsonUtil.h"
#include "apisim/common/Logger.h"
#include "apisim/generator/TokenEstimator.h"
#include "apisim/monitor/LimiterRegistry.h"

#include <openssl/rand.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <random>
#include <vector>

namespace apisim {
namespace generator {

using apisim::protocol::HttpResponse;

namespace {

const std::string kDeploymentsPrefix = "/openai/deployments/";

int64_t NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string RandomId(const std::string& prefix) {
    unsigned char raw[12];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        return prefix + std::to_string(NowSeconds());
    }
    static const char* kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    std::string out = prefix;
    for (unsigned char c : raw) out += kAlphabet[c % 62];
    return out;
}

// Reads an optional positive integer field. Absent or null yields fallback;
// any other value outside [1, ceiling] is rejected.
std::optional<int> PositiveField(const Json::Value& body, const char* name, int fallback, int ceiling) {
    const Json::Value& v = body[name];
    if (v.isNull()) return std::min(std::max(fallback, 1), ceiling);
    if (!v.isInt64()) return std::nullopt;
    const int64_t n = v.asInt64();
    if (n < 1 || n > ceiling) return std::nullopt;
    return static_cast<int>(n);
}

Json::Value Usage(int promptTokens, int completionTokens, bool withCompletion) {
    Json::Value usage(Json::objectValue);
    usage["prompt_tokens"] = promptTokens;
    if (withCompletion) usage["completion_tokens"] = completionTokens;
    usage["total_tokens"] = Json::Int64(promptTokens) + completionTokens;
    return usage;
}

HttpResponse InvalidRequest(const std::string& message) {
    Json::Value error(Json::objectValue);
    error["message"] = message;
    error["type"] = "invalid_request_error";
    error["param"] = Json::Value(Json::nullValue);
    error["code"] = Json::Value(Json::nullValue);
    Json::Value body(Json::objectValue);
    body["error"] = error;
    return HttpResponse::json(HttpResponse::k400BadRequest, apisim::common::ToCompactJson(body));
}

HttpResponse OutOfRange(const char* name, int ceiling) {
    return InvalidRequest(std::string("'") + name + "' must be an integer between 1 and " +
                          std::to_string(ceiling) + ".");
}

void SetFacts(RequestContext& ctx, const std::string& deployment, long tokens, double latencyMs) {
    ctx.limiterKey = apisim::monitor::LimiterRegistry::kOpenAi;
    ctx.deploymentName = deployment;
    ctx.tokenCount = tokens;
    if (latencyMs > 0.0) ctx.recordedDurationMs = latencyMs;
}

} // namespace

std::optional<OpenAiGenerator::Route> OpenAiGenerator::ParseRoute(const std::string& path) {
    if (path.compare(0, kDeploymentsPrefix.size(), kDeploymentsPrefix) != 0) return std::nullopt;
    const std::string rest = path.substr(kDeploymentsPrefix.size());
    const size_t slash = rest.find('/');
    if (slash == std::string::npos || slash == 0) return std::nullopt;

    Route route;
    route.deployment = rest.substr(0, slash);
    const std::string op = rest.substr(slash + 1);
    if (op == "chat/completions") {
        route.operation = Operation::kChatCompletions;
    } else if (op == "completions") {
        route.operation = Operation::kCompletions;
    } else if (op == "embeddings") {
        route.operation = Operation::kEmbeddings;
    } else {
        return std::nullopt;
    }
    return route;
}

std::optional<HttpResponse> OpenAiGenerator::Generate(RequestContext& ctx) {
    if (ctx.request.method() != "POST") return std::nullopt;
    auto route = ParseRoute(ctx.request.path());
    if (!route) return std::nullopt;

    std::string model = route->deployment;
    if (!ctx.config.deployments.empty()) {
        const auto* deployment = ctx.config.FindDeployment(route->deployment);
        if (deployment == nullptr) {
            LOG_WARN << "Deployment not found: " << route->deployment;
            return HttpResponse::json(
                HttpResponse::k404NotFound,
                apisim::common::ErrorBody("DeploymentNotFound",
                                          "The API deployment for this resource does not exist."));
        }
        if (!deployment->model.empty()) model = deployment->model;
    }

    Json::Value body;
    std::string errors;
    if (!apisim::common::ParseJson(ctx.request.body(), &body, &errors) || !body.isObject()) {
        LOG_DEBUG << "Rejecting request body for " << ctx.request.path() << ": " << errors;
        return InvalidRequest("The request body is not valid JSON.");
    }

    switch (route->operation) {
        case Operation::kChatCompletions: return ChatCompletion(ctx, *route, model, body);
        case Operation::kCompletions: return Completion(ctx, *route, model, body);
        case Operation::kEmbeddings: return Embedding(ctx, *route, model, body);
    }
    return std::nullopt;
}

HttpResponse OpenAiGenerator::ChatCompletion(RequestContext& ctx, const Route& route, const std::string& model,
                                             const Json::Value& body) {
    if (!body["messages"].isArray() || body["messages"].empty()) {
        return InvalidRequest("'messages' is a required property");
    }
    const auto maxTokens = PositiveField(body, "max_tokens", ctx.config.defaultMaxTokens, kMaxCompletionTokens);
    if (!maxTokens) return OutOfRange("max_tokens", kMaxCompletionTokens);
    const int promptTokens = TokenEstimator::Estimate(TokenEstimator::ChatText(body["messages"]));
    const int completionTokens = *maxTokens;
    const std::string id = RandomId("chatcmpl-");
    const int64_t created = NowSeconds();
    const std::string text = TokenEstimator::LoremText(completionTokens);

    SetFacts(ctx, route.deployment, static_cast<long>(promptTokens) + completionTokens,
             completionTokens * ctx.config.latency.chatCompletionsMsPerToken);

    if (body["stream"].isBool() && body["stream"].asBool()) {
        // Server-sent events: one role chunk, one content chunk, one finish chunk.
        auto chunk = [&](const Json::Value& delta, const Json::Value& finishReason) {
            Json::Value c(Json::objectValue);
            c["id"] = id;
            c["object"] = "chat.completion.chunk";
            c["created"] = Json::Int64(created);
            c["model"] = model;
            Json::Value choice(Json::objectValue);
            choice["index"] = 0;
            choice["delta"] = delta;
            choice["finish_reason"] = finishReason;
            c["choices"].append(choice);
            return "data: " + apisim::common::ToCompactJson(c) + "\n\n";
        };
        Json::Value role(Json::objectValue);
        role["role"] = "assistant";
        Json::Value content(Json::objectValue);
        content["content"] = text;
        std::string events = chunk(role, Json::Value(Json::nullValue));
        events += chunk(content, Json::Value(Json::nullValue));
        events += chunk(Json::Value(Json::objectValue), "length");
        events += "data: [DONE]\n\n";

        HttpResponse resp(HttpResponse::k200Ok, events);
        resp.setContentType("text/event-stream");
        return resp;
    }

    Json::Value message(Json::objectValue);
    message["role"] = "assistant";
    message["content"] = text;
    Json::Value choice(Json::objectValue);
    choice["index"] = 0;
    choice["message"] = message;
    choice["finish_reason"] = "length";

    Json::Value out(Json::objectValue);
    out["id"] = id;
    out["object"] = "chat.completion";
    out["created"] = Json::Int64(created);
    out["model"] = model;
    out["choices"].append(choice);
    out["usage"] = Usage(promptTokens, completionTokens, true);
    return HttpResponse::json(HttpResponse::k200Ok, apisim::common::ToCompactJson(out));
}

HttpResponse OpenAiGenerator::Completion(RequestContext& ctx, const Route& route, const std::string& model,
                                         const Json::Value& body) {
    const auto maxTokens = PositiveField(body, "max_tokens", ctx.config.defaultMaxTokens, kMaxCompletionTokens);
    if (!maxTokens) return OutOfRange("max_tokens", kMaxCompletionTokens);
    const int promptTokens = TokenEstimator::Estimate(TokenEstimator::PromptText(body["prompt"]));
    const int completionTokens = *maxTokens;

    SetFacts(ctx, route.deployment, static_cast<long>(promptTokens) + completionTokens,
             completionTokens * ctx.config.latency.completionsMsPerToken);

    Json::Value choice(Json::objectValue);
    choice["index"] = 0;
    choice["text"] = TokenEstimator::LoremText(completionTokens);
    choice["logprobs"] = Json::Value(Json::nullValue);
    choice["finish_reason"] = "length";

    Json::Value out(Json::objectValue);
    out["id"] = RandomId("cmpl-");
    out["object"] = "text_completion";
    out["created"] = Json::Int64(NowSeconds());
    out["model"] = model;
    out["choices"].append(choice);
    out["usage"] = Usage(promptTokens, completionTokens, true);
    return HttpResponse::json(HttpResponse::k200Ok, apisim::common::ToCompactJson(out));
}

HttpResponse OpenAiGenerator::Embedding(RequestContext& ctx, const Route& route, const std::string& model,
                                        const Json::Value& body) {
    const Json::Value& input = body["input"];
    if (!input.isString() && !input.isArray()) {
        return InvalidRequest("'input' is a required property");
    }
    const auto dims = PositiveField(body, "dimensions", kDefaultEmbeddingDimensions, kMaxEmbeddingDimensions);
    if (!dims) return OutOfRange("dimensions", kMaxEmbeddingDimensions);
    const int dimensions = *dims;

    std::vector<std::string> inputs;
    if (input.isString()) {
        inputs.push_back(input.asString());
    } else {
        for (const auto& item : input) {
            if (item.isString()) inputs.push_back(item.asString());
        }
    }

    int promptTokens = 0;
    Json::Value data(Json::arrayValue);
    for (size_t i = 0; i < inputs.size(); ++i) {
        promptTokens += TokenEstimator::Estimate(inputs[i]);
        // Same text, same vector.
        std::mt19937 rng(static_cast<uint32_t>(std::hash<std::string>()(inputs[i])));
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        Json::Value vec(Json::arrayValue);
        for (int d = 0; d < dimensions; ++d) vec.append(dist(rng));

        Json::Value item(Json::objectValue);
        item["object"] = "embedding";
        item["index"] = static_cast<int>(i);
        item["embedding"] = vec;
        data.append(item);
    }
    if (promptTokens == 0) promptTokens = 1;

    SetFacts(ctx, route.deployment, promptTokens, ctx.config.latency.embeddingsMs);

    Json::Value out(Json::objectValue);
    out["object"] = "list";
    out["data"] = data;
    out["model"] = model;
    out["usage"] = Usage(promptTokens, 0, false);
    return HttpResponse::json(HttpResponse::k200Ok, apisim::common::ToCompactJson(out));
}

} // namespace generator
} // namespace apisim
