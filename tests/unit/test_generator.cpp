#include "apisim/RequestContext.h"
#include "apisim/common/JsonUtil.h"
#include "apisim/common/Logger.h"
#include "apisim/generator/DocIntelligenceGenerator.h"
#include "apisim/generator/GeneratorManager.h"
#include "apisim/generator/OpenAiGenerator.h"
#include "apisim/generator/TokenEstimator.h"
#include "apisim/monitor/LimiterRegistry.h"

#include <cassert>
#include <memory>
#include <string>

using apisim::RequestContext;
using apisim::common::Logger;
using apisim::common::OpenAiDeployment;
using apisim::common::ParseJson;
using apisim::common::SimulatorConfig;
using apisim::generator::DocIntelligenceGenerator;
using apisim::generator::GeneratorManager;
using apisim::generator::OpenAiGenerator;
using apisim::generator::TokenEstimator;
using apisim::monitor::LimiterRegistry;
using apisim::protocol::HttpRequest;
using apisim::protocol::HttpResponse;

static HttpRequest makeRequest(const std::string& method, const std::string& path, const std::string& body = "") {
    HttpRequest req;
    req.setMethod(method);
    req.setPath(path);
    req.setBody(body);
    return req;
}

static SimulatorConfig makeConfig() {
    SimulatorConfig cfg;
    OpenAiDeployment d;
    d.name = "gpt-35";
    d.model = "gpt-3.5-turbo";
    d.tokensPerMinute = 1000;
    cfg.deployments[d.name] = d;
    OpenAiDeployment e;
    e.name = "embedding";
    e.model = "text-embedding-ada-002";
    cfg.deployments[e.name] = e;
    cfg.defaultMaxTokens = 10;
    cfg.latency.chatCompletionsMsPerToken = 20.0;
    cfg.latency.embeddingsMs = 100.0;
    return cfg;
}

static void testTokenEstimator() {
    assert(TokenEstimator::Estimate("") == 1);
    assert(TokenEstimator::Estimate("abcd") == 1);
    assert(TokenEstimator::Estimate("abcde") == 2);

    Json::Value messages;
    assert(ParseJson(R"([{"role":"user","content":"hi"},{"role":"user","content":[{"type":"text","text":"there"}]}])",
                     &messages));
    assert(TokenEstimator::ChatText(messages) == "hi\nthere\n");

    Json::Value prompt;
    assert(ParseJson(R"(["a","b"])", &prompt));
    assert(TokenEstimator::PromptText(prompt) == "a\nb\n");

    assert(TokenEstimator::LoremText(0).empty());
    assert(TokenEstimator::LoremText(3) == "lorem ipsum dolor.");
}

static void testParseRoute() {
    auto chat = OpenAiGenerator::ParseRoute("/openai/deployments/gpt-35/chat/completions");
    assert(chat && chat->deployment == "gpt-35");
    assert(chat->operation == OpenAiGenerator::Operation::kChatCompletions);

    auto completion = OpenAiGenerator::ParseRoute("/openai/deployments/x/completions");
    assert(completion && completion->operation == OpenAiGenerator::Operation::kCompletions);

    auto embeddings = OpenAiGenerator::ParseRoute("/openai/deployments/x/embeddings");
    assert(embeddings && embeddings->operation == OpenAiGenerator::Operation::kEmbeddings);

    assert(!OpenAiGenerator::ParseRoute("/openai/deployments//embeddings"));
    assert(!OpenAiGenerator::ParseRoute("/openai/deployments/x/images"));
    assert(!OpenAiGenerator::ParseRoute("/other"));
}

static void testChatCompletion() {
    SimulatorConfig cfg = makeConfig();
    OpenAiGenerator gen;
    RequestContext ctx(cfg, makeRequest("POST", "/openai/deployments/gpt-35/chat/completions",
                                        R"({"messages":[{"role":"user","content":"hello world!"}],"max_tokens":5})"));
    auto resp = gen.Generate(ctx);
    assert(resp);
    assert(resp->statusCode() == 200);
    assert(resp->getHeader("Content-Type") == "application/json");

    Json::Value out;
    assert(ParseJson(resp->body(), &out));
    assert(out["object"].asString() == "chat.completion");
    assert(out["model"].asString() == "gpt-3.5-turbo");
    assert(out["choices"][0]["message"]["role"].asString() == "assistant");
    assert(out["usage"]["prompt_tokens"].asInt() == 4);
    assert(out["usage"]["completion_tokens"].asInt() == 5);
    assert(out["usage"]["total_tokens"].asInt() == 9);

    assert(ctx.limiterKey && *ctx.limiterKey == LimiterRegistry::kOpenAi);
    assert(ctx.deploymentName && *ctx.deploymentName == "gpt-35");
    assert(ctx.tokenCount && *ctx.tokenCount == 9);
    assert(ctx.recordedDurationMs && *ctx.recordedDurationMs == 100.0);
}

static void testChatCompletionStream() {
    SimulatorConfig cfg = makeConfig();
    OpenAiGenerator gen;
    RequestContext ctx(cfg, makeRequest("POST", "/openai/deployments/gpt-35/chat/completions",
                                        R"({"messages":[{"role":"user","content":"hi"}],"stream":true})"));
    auto resp = gen.Generate(ctx);
    assert(resp && resp->statusCode() == 200);
    assert(resp->getHeader("Content-Type") == "text/event-stream");
    assert(resp->body().rfind("data: {", 0) == 0);
    const std::string done = "data: [DONE]\n\n";
    assert(resp->body().size() > done.size());
    assert(resp->body().compare(resp->body().size() - done.size(), done.size(), done) == 0);
    assert(ctx.tokenCount && *ctx.tokenCount == 1 + 10);
}

static void testCompletionUsesDefaultMaxTokens() {
    SimulatorConfig cfg = makeConfig();
    OpenAiGenerator gen;
    RequestContext ctx(cfg, makeRequest("POST", "/openai/deployments/gpt-35/completions", R"({"prompt":"12345678"})"));
    auto resp = gen.Generate(ctx);
    assert(resp && resp->statusCode() == 200);
    Json::Value out;
    assert(ParseJson(resp->body(), &out));
    assert(out["object"].asString() == "text_completion");
    assert(out["usage"]["total_tokens"].asInt() == 2 + 10);
    // No per-token latency configured for completions.
    assert(!ctx.recordedDurationMs);
}

static void testEmbeddings() {
    SimulatorConfig cfg = makeConfig();
    OpenAiGenerator gen;
    const std::string body = R"({"input":["same text","same text"],"dimensions":8})";
    RequestContext ctx(cfg, makeRequest("POST", "/openai/deployments/embedding/embeddings", body));
    auto resp = gen.Generate(ctx);
    assert(resp && resp->statusCode() == 200);

    Json::Value out;
    assert(ParseJson(resp->body(), &out));
    assert(out["data"].size() == 2);
    assert(out["data"][0]["embedding"].size() == 8);
    assert(out["data"][0]["embedding"] == out["data"][1]["embedding"]);
    assert(out["model"].asString() == "text-embedding-ada-002");
    assert(!out["usage"].isMember("completion_tokens"));
    assert(ctx.tokenCount && *ctx.tokenCount == 6);
    assert(ctx.recordedDurationMs && *ctx.recordedDurationMs == 100.0);
}

static void testOpenAiErrors() {
    SimulatorConfig cfg = makeConfig();
    OpenAiGenerator gen;

    RequestContext unknown(cfg, makeRequest("POST", "/openai/deployments/missing/embeddings", R"({"input":"x"})"));
    auto notFound = gen.Generate(unknown);
    assert(notFound && notFound->statusCode() == 404);
    assert(notFound->body().find("DeploymentNotFound") != std::string::npos);
    assert(!unknown.limiterKey);

    RequestContext malformed(cfg, makeRequest("POST", "/openai/deployments/gpt-35/completions", "{not json"));
    auto bad = gen.Generate(malformed);
    assert(bad && bad->statusCode() == 400);
    assert(bad->body().find("invalid_request_error") != std::string::npos);

    RequestContext noMessages(cfg, makeRequest("POST", "/openai/deployments/gpt-35/chat/completions", "{}"));
    auto missing = gen.Generate(noMessages);
    assert(missing && missing->statusCode() == 400);

    RequestContext get(cfg, makeRequest("GET", "/openai/deployments/gpt-35/completions"));
    assert(!gen.Generate(get));

    // Without configured deployments any name is served.
    SimulatorConfig open;
    RequestContext anyName(open, makeRequest("POST", "/openai/deployments/whatever/embeddings", R"({"input":"x"})"));
    auto served = gen.Generate(anyName);
    assert(served && served->statusCode() == 200);
}

static void testDocIntelligenceFlow() {
    SimulatorConfig cfg;
    cfg.latency.docIntelligenceMs = 250.0;
    DocIntelligenceGenerator gen;

    HttpRequest post = makeRequest("POST", "/formrecognizer/documentModels/prebuilt-read:analyze", "{}");
    post.setQuery("api-version=2023-07-31");
    post.setHeader("Host", "sim.local:8000");
    RequestContext analyze(cfg, post);
    auto accepted = gen.Generate(analyze);
    assert(accepted && accepted->statusCode() == 202);
    assert(analyze.limiterKey && *analyze.limiterKey == LimiterRegistry::kDocIntelligence);
    assert(analyze.recordedDurationMs && *analyze.recordedDurationMs == 250.0);

    const std::string location = accepted->getHeader("Operation-Location");
    const std::string prefix = "http://sim.local:8000/formrecognizer/documentModels/prebuilt-read/analyzeResults/";
    assert(location.rfind(prefix, 0) == 0);
    const size_t q = location.find('?');
    assert(q != std::string::npos);
    const std::string id = location.substr(prefix.size(), q - prefix.size());
    assert(id.size() == 36);

    RequestContext poll(cfg, makeRequest("GET", "/formrecognizer/documentModels/prebuilt-read/analyzeResults/" + id));
    auto result = gen.Generate(poll);
    assert(result && result->statusCode() == 200);
    Json::Value out;
    assert(ParseJson(result->body(), &out));
    assert(out["status"].asString() == "succeeded");
    assert(out["analyzeResult"]["modelId"].asString() == "prebuilt-read");

    RequestContext unknown(cfg, makeRequest("GET", "/formrecognizer/documentModels/prebuilt-read/analyzeResults/nope"));
    auto missing = gen.Generate(unknown);
    assert(missing && missing->statusCode() == 404);

    RequestContext other(cfg, makeRequest("GET", "/formrecognizer/info"));
    assert(!gen.Generate(other));
}

static void testManagerProduces() {
    SimulatorConfig cfg = makeConfig();
    auto manager = GeneratorManager::CreateDefault();
    assert(manager->size() == 2);

    auto ctx = std::make_shared<RequestContext>(
        cfg, makeRequest("POST", "/openai/deployments/gpt-35/completions", R"({"prompt":"x"})"));
    bool called = false;
    manager->Produce(ctx, [&](std::optional<HttpResponse> resp) {
        called = true;
        assert(resp && resp->statusCode() == 200);
    });
    assert(called);

    auto unmatched = std::make_shared<RequestContext>(cfg, makeRequest("GET", "/nothing/here"));
    called = false;
    manager->Produce(unmatched, [&](std::optional<HttpResponse> resp) {
        called = true;
        assert(!resp);
    });
    assert(called);
}

static void testNumericFieldsAreBounded() {
    SimulatorConfig cfg = makeConfig();
    OpenAiGenerator gen;
    const std::string chat = "/openai/deployments/gpt-35/chat/completions";
    const std::string msgs = R"("messages":[{"role":"user","content":"hi"}])";

    const char* badMaxTokens[] = {"1e10", "2147483647", "128001", "0", "-5", "2.5", "\"7\"", "true"};
    for (const char* v : badMaxTokens) {
        RequestContext ctx(cfg, makeRequest("POST", chat, "{" + msgs + ",\"max_tokens\":" + v + "}"));
        auto resp = gen.Generate(ctx);
        assert(resp && resp->statusCode() == 400);
        Json::Value out;
        assert(ParseJson(resp->body(), &out));
        assert(out["error"]["type"].asString() == "invalid_request_error");
        assert(!ctx.tokenCount);
    }

    RequestContext atCeiling(cfg, makeRequest("POST", "/openai/deployments/gpt-35/completions",
                                              R"({"prompt":"abcd","max_tokens":128000})"));
    auto ok = gen.Generate(atCeiling);
    assert(ok && ok->statusCode() == 200);
    assert(atCeiling.tokenCount && *atCeiling.tokenCount == 1 + 128000);

    RequestContext integralDouble(cfg, makeRequest("POST", chat, "{" + msgs + ",\"max_tokens\":6.0}"));
    auto six = gen.Generate(integralDouble);
    assert(six && six->statusCode() == 200);
    assert(integralDouble.tokenCount && *integralDouble.tokenCount == 1 + 6);

    const std::string embeddings = "/openai/deployments/embedding/embeddings";
    RequestContext huge(cfg, makeRequest("POST", embeddings, R"({"input":"x","dimensions":2000000000})"));
    auto rejected = gen.Generate(huge);
    assert(rejected && rejected->statusCode() == 400);

    RequestContext widest(cfg, makeRequest("POST", embeddings, R"({"input":"x","dimensions":3072})"));
    auto vec = gen.Generate(widest);
    assert(vec && vec->statusCode() == 200);
    Json::Value out;
    assert(ParseJson(vec->body(), &out));
    assert(out["data"][0]["embedding"].size() == 3072);

    // An oversized configured default is capped rather than honoured.
    cfg.defaultMaxTokens = 1 << 30;
    RequestContext capped(cfg, makeRequest("POST", chat, "{" + msgs + "}"));
    auto cappedResp = gen.Generate(capped);
    assert(cappedResp && cappedResp->statusCode() == 200);
    assert(capped.tokenCount && *capped.tokenCount == 1 + OpenAiGenerator::kMaxCompletionTokens);
}

int main() {
    Logger::Instance().SetLevel(apisim::common::LogLevel::ERROR);
    testTokenEstimator();
    testParseRoute();
    testChatCompletion();
    testChatCompletionStream();
    testCompletionUsesDefaultMaxTokens();
    testEmbeddings();
    testOpenAiErrors();
    testNumericFieldsAreBounded();
    testDocIntelligenceFlow();
    testManagerProduces();
    return 0;
}
