#include "apisim/RequestContext.h"
#include "apisim/common/Logger.h"
#include "apisim/common/SimulatorConfig.h"
#include "apisim/monitor/DocIntelligenceLimiter.h"
#include "apisim/monitor/LimiterRegistry.h"
#include "apisim/monitor/OpenAiLimiter.h"

#include <cassert>
#include <chrono>
#include <memory>
#include <string>

using apisim::RequestContext;
using apisim::common::Logger;
using apisim::common::SimulatorConfig;
using apisim::monitor::DocIntelligenceLimiter;
using apisim::monitor::Limiter;
using apisim::monitor::LimiterRegistry;
using apisim::monitor::OpenAiLimiter;
using apisim::protocol::HttpRequest;
using apisim::protocol::HttpResponse;

static HttpRequest makeRequest(const std::string& path) {
    HttpRequest req;
    req.setMethod("POST");
    req.setPath(path);
    return req;
}

static void testRequestsPerTenSeconds() {
    assert(OpenAiLimiter::RequestsPerTenSeconds(0) == 0);
    assert(OpenAiLimiter::RequestsPerTenSeconds(10) == 1);
    assert(OpenAiLimiter::RequestsPerTenSeconds(10000) == 60);
    assert(OpenAiLimiter::RequestsPerTenSeconds(100000) == 600);
}

static void testZeroQuotaAlwaysDenies() {
    OpenAiLimiter limiter({{"gpt-4", 0}});
    auto now = OpenAiLimiter::Clock::now();
    auto denial = limiter.CheckAt(now, "gpt-4", 0);
    assert(denial);
    assert(denial->statusCode() == 429);
    assert(!denial->getHeader("Retry-After").empty());
    assert(denial->body().find("exceeded call rate limit") != std::string::npos);
    assert(limiter.CheckAt(now + std::chrono::minutes(5), "gpt-4", 10));
}

static void testTokenWindow() {
    // 1000 tpm -> 6 requests per 10s.
    OpenAiLimiter limiter({{"small", 1000}});
    auto t0 = OpenAiLimiter::Clock::now();
    assert(!limiter.CheckAt(t0, "small", 600));
    assert(!limiter.CheckAt(t0 + std::chrono::seconds(11), "small", 400));

    auto denial = limiter.CheckAt(t0 + std::chrono::seconds(22), "small", 1);
    assert(denial);
    // The first 600 tokens leave the window at t0+60s.
    assert(denial->getHeader("Retry-After") == "38");

    assert(!limiter.CheckAt(t0 + std::chrono::seconds(60), "small", 600));
}

static void testRequestWindow() {
    OpenAiLimiter limiter({{"tiny", 100}}); // 1 request per 10s
    auto t0 = OpenAiLimiter::Clock::now();
    assert(!limiter.CheckAt(t0, "tiny", 1));
    auto denial = limiter.CheckAt(t0 + std::chrono::seconds(1), "tiny", 1);
    assert(denial);
    assert(denial->getHeader("Retry-After") == "9");
    assert(!limiter.CheckAt(t0 + std::chrono::seconds(10), "tiny", 1));
}

static void testDeniedRequestChargesNothing() {
    OpenAiLimiter limiter({{"d", 1000}});
    auto t0 = OpenAiLimiter::Clock::now();
    // Over the token quota: denied, and the request window stays untouched.
    for (int i = 0; i < 10; ++i) {
        assert(limiter.CheckAt(t0, "d", 5000));
    }
    for (int i = 0; i < 6; ++i) {
        assert(!limiter.CheckAt(t0, "d", 1));
    }
    assert(limiter.CheckAt(t0, "d", 1));
}

static void testUnknownDeploymentPasses() {
    OpenAiLimiter limiter({{"known", 0}});
    assert(!limiter.CheckAt(OpenAiLimiter::Clock::now(), "unknown", 100000));
}

static void testDocIntelligenceLimiter() {
    DocIntelligenceLimiter limiter(2);
    auto t0 = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    assert(!limiter.CheckAt(t0));
    assert(!limiter.CheckAt(t0));
    auto denial = limiter.CheckAt(t0);
    assert(denial);
    assert(denial->statusCode() == 429);
    assert(denial->getHeader("Retry-After") == "1");
    assert(!limiter.CheckAt(t0 + std::chrono::milliseconds(500)));
}

class CountingLimiter : public Limiter {
public:
    std::optional<HttpResponse> Check(const RequestContext&, const HttpResponse&) override {
        calls++;
        return HttpResponse(HttpResponse::k429TooManyRequests);
    }
    int calls{0};
};

static void testRegistryLookup() {
    SimulatorConfig cfg;
    LimiterRegistry registry;
    auto counting = std::make_unique<CountingLimiter>();
    CountingLimiter* raw = counting.get();
    registry.Register("custom", std::move(counting));

    HttpResponse ok(HttpResponse::k200Ok, "{}");

    RequestContext noKey(cfg, makeRequest("/x"));
    assert(!registry.Apply(noKey, ok));
    assert(raw->calls == 0);

    RequestContext unknownKey(cfg, makeRequest("/x"));
    unknownKey.limiterKey = "missing";
    assert(!registry.Apply(unknownKey, ok));
    assert(raw->calls == 0);

    RequestContext keyed(cfg, makeRequest("/x"));
    keyed.limiterKey = "custom";
    auto replaced = registry.Apply(keyed, ok);
    assert(replaced && replaced->statusCode() == 429);
    assert(raw->calls == 1);
}

static void testRegistryFromConfig() {
    SimulatorConfig cfg;
    apisim::common::OpenAiDeployment d;
    d.name = "gpt-4";
    d.model = "gpt-4";
    d.tokensPerMinute = 0;
    cfg.deployments[d.name] = d;
    cfg.docIntelligenceRps = 15;

    auto registry = LimiterRegistry::FromConfig(cfg);
    assert(registry->Find(LimiterRegistry::kOpenAi) != nullptr);
    assert(registry->Find(LimiterRegistry::kDocIntelligence) != nullptr);
    assert(registry->size() == 2);

    RequestContext ctx(cfg, makeRequest("/openai/deployments/gpt-4/chat/completions"));
    ctx.limiterKey = LimiterRegistry::kOpenAi;
    ctx.deploymentName = "gpt-4";
    ctx.tokenCount = 10;
    auto denial = registry->Apply(ctx, HttpResponse(HttpResponse::k200Ok));
    assert(denial && denial->statusCode() == 429);

    cfg.docIntelligenceRps = 0;
    auto noDoc = LimiterRegistry::FromConfig(cfg);
    assert(noDoc->Find(LimiterRegistry::kDocIntelligence) == nullptr);
}

int main() {
    Logger::Instance().SetLevel(apisim::common::LogLevel::ERROR);
    testRequestsPerTenSeconds();
    testZeroQuotaAlwaysDenies();
    testTokenWindow();
    testRequestWindow();
    testDeniedRequestChargesNothing();
    testUnknownDeploymentPasses();
    testDocIntelligenceLimiter();
    testRegistryLookup();
    testRegistryFromConfig();
    return 0;
}
