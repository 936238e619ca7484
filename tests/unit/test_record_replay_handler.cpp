#include "apisim/RequestContext.h"
#include "apisim/common/Logger.h"
#include "apisim/network/EventLoop.h"
#include "apisim/protocol/Compression.h"
#include "apisim/replay/Forwarder.h"
#include "apisim/replay/RecordReplayHandler.h"
#include "apisim/replay/Recording.h"
#include "apisim/replay/RecordingStore.h"

#include <cassert>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using apisim::RequestContext;
using apisim::common::ForwarderConfig;
using apisim::common::ForwarderKind;
using apisim::common::Logger;
using apisim::common::RecordingOptions;
using apisim::common::SimulatorConfig;
using apisim::common::SimulatorMode;
using apisim::network::EventLoop;
using apisim::network::InetAddress;
using apisim::protocol::Compression;
using apisim::protocol::HttpRequest;
using apisim::protocol::HttpResponse;
using apisim::replay::Forwarder;
using apisim::replay::RecordReplayHandler;
using apisim::replay::Recording;
using apisim::replay::RecordingStore;

static const std::string kPath = "/openai/deployments/gpt-4/chat/completions";

static std::string makeTempDir() {
    char tmpl[] = "/tmp/apisim_replay_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    assert(dir != nullptr);
    return dir;
}

static HttpRequest makeRequest(const std::string& body) {
    HttpRequest req;
    req.setMethod("POST");
    req.setPath(kPath);
    req.setQuery("api-version=2024-02-01");
    req.setBody(body);
    return req;
}

static void seedRecording(const std::string& dir, const HttpRequest& req) {
    RecordingStore store(dir, false);
    Recording r;
    r.method = req.method();
    r.target = req.target();
    r.requestDigest = Recording::Digest(req);
    r.status = 200;
    r.headers["Content-Type"] = "application/json";
    r.body = "{\"recorded\":true}";
    r.durationMs = 750.0;
    r.limiterKey = std::string("openai");
    r.deploymentName = std::string("gpt-4");
    r.tokenCount = 30L;
    store.Add(kPath, r);
    assert(store.Save());
}

static void testReplayReturnsRecordedExchange() {
    const std::string dir = makeTempDir();
    const HttpRequest req = makeRequest("{\"messages\":[]}");
    seedRecording(dir, req);

    RecordingOptions options;
    options.dir = dir;
    RecordReplayHandler handler(SimulatorMode::kReplay, options, {});

    SimulatorConfig cfg;
    auto ctx = std::make_shared<RequestContext>(cfg, req);
    bool called = false;
    handler.Produce(ctx, [&](std::optional<HttpResponse> resp) {
        called = true;
        assert(resp && resp->statusCode() == 200);
        assert(resp->body() == "{\"recorded\":true}");
        assert(resp->getHeader("Content-Type") == "application/json");
    });
    assert(called);
    assert(ctx->limiterKey && *ctx->limiterKey == "openai");
    assert(ctx->deploymentName && *ctx->deploymentName == "gpt-4");
    assert(ctx->tokenCount && *ctx->tokenCount == 30);
    assert(ctx->recordedDurationMs && *ctx->recordedDurationMs == 750.0);

    // Save is a record-mode operation.
    assert(!handler.SaveRecordings());
}

static void testReplayMissIsNoResponse() {
    const std::string dir = makeTempDir();
    seedRecording(dir, makeRequest("{\"messages\":[]}"));

    RecordingOptions options;
    options.dir = dir;
    RecordReplayHandler handler(SimulatorMode::kReplay, options, {});
    SimulatorConfig cfg;

    // Same path, different body.
    auto ctx = std::make_shared<RequestContext>(cfg, makeRequest("{\"messages\":[1]}"));
    bool called = false;
    handler.Produce(ctx, [&](std::optional<HttpResponse> resp) {
        called = true;
        assert(!resp);
    });
    assert(called);
    assert(!ctx->limiterKey);
}

static void testRecordWithoutForwarder() {
    RecordingOptions options;
    options.dir = makeTempDir();
    RecordReplayHandler handler(SimulatorMode::kRecord, options, {});
    SimulatorConfig cfg;
    auto ctx = std::make_shared<RequestContext>(cfg, makeRequest("{}"));
    bool called = false;
    handler.Produce(ctx, [&](std::optional<HttpResponse> resp) {
        called = true;
        assert(!resp);
    });
    assert(called);

    size_t written = 99;
    assert(handler.SaveRecordings(&written));
    assert(written == 0);
}

static void testForwarderRequestRewrite() {
    EventLoop loop;
    ForwarderConfig fc;
    fc.name = "openai";
    fc.pathPrefix = "/openai/";
    fc.host = "upstream.example";
    fc.port = 8080;
    fc.apiKey = "upstream-key";
    fc.kind = ForwarderKind::kOpenAi;
    Forwarder fwd(&loop, fc, InetAddress(8080, true));

    assert(fwd.Matches(kPath));
    assert(!fwd.Matches("/formrecognizer/x"));

    HttpRequest req = makeRequest("{}");
    req.setHeader("api-key", "simulator-key");
    req.setHeader("Authorization", "Bearer token");
    req.setHeader("Connection", "keep-alive");
    const std::string wire = fwd.BuildRequest(req);

    assert(wire.rfind("POST " + kPath + "?api-version=2024-02-01 HTTP/1.1\r\n", 0) == 0);
    assert(wire.find("Host: upstream.example:8080\r\n") != std::string::npos);
    assert(wire.find("upstream-key") != std::string::npos);
    assert(wire.find("simulator-key") == std::string::npos);
    assert(wire.find("Bearer token") == std::string::npos);
    assert(wire.find("keep-alive") == std::string::npos);

    fc.kind = ForwarderKind::kDocIntelligence;
    fc.apiKey.clear();
    Forwarder passthrough(&loop, fc, InetAddress(8080, true));
    assert(passthrough.BuildRequest(req).find("simulator-key") != std::string::npos);
}

static void testForwarderDerivesFacts() {
    EventLoop loop;
    ForwarderConfig fc;
    fc.name = "openai";
    fc.pathPrefix = "/openai/";
    fc.host = "localhost";
    Forwarder fwd(&loop, fc, InetAddress(80, true));

    const std::string json = "{\"usage\":{\"prompt_tokens\":10,\"total_tokens\":25}}";
    std::string packed;
    assert(Compression::Compress(Compression::Encoding::kGzip, json, &packed));
    HttpResponse resp(200, packed);
    resp.setHeader("Content-Encoding", "gzip");

    Recording rec;
    fwd.DeriveFacts(makeRequest("{}"), resp, &rec);
    assert(rec.limiterKey && *rec.limiterKey == "openai");
    assert(rec.deploymentName && *rec.deploymentName == "gpt-4");
    assert(rec.tokenCount && *rec.tokenCount == 25);

    fc.kind = ForwarderKind::kDocIntelligence;
    Forwarder doc(&loop, fc, InetAddress(80, true));
    Recording docRec;
    doc.DeriveFacts(makeRequest("{}"), HttpResponse(202), &docRec);
    assert(docRec.limiterKey && *docRec.limiterKey == "docintelligence");
    assert(!docRec.deploymentName);
    assert(!docRec.tokenCount);
}

static void testForwarderIgnoresMalformedUsage() {
    EventLoop loop;
    ForwarderConfig fc;
    fc.name = "openai";
    fc.pathPrefix = "/openai/";
    fc.host = "localhost";
    Forwarder fwd(&loop, fc, InetAddress(80, true));

    const char* bodies[] = {
        "{\"usage\":5}",
        "{\"usage\":[1,2]}",
        "{\"usage\":{\"total_tokens\":\"many\"}}",
        "{\"usage\":{\"total_tokens\":1e19}}",
        "{\"usage\":{\"total_tokens\":-3}}",
        "[1]",
    };
    for (const char* body : bodies) {
        Recording rec;
        fwd.DeriveFacts(makeRequest("{}"), HttpResponse(200, body), &rec);
        assert(rec.limiterKey && *rec.limiterKey == "openai");
        assert(rec.deploymentName && *rec.deploymentName == "gpt-4");
        assert(!rec.tokenCount);
    }
}

int main() {
    Logger::Instance().SetLevel(apisim::common::LogLevel::FATAL);
    testReplayReturnsRecordedExchange();
    testReplayMissIsNoResponse();
    testRecordWithoutForwarder();
    testForwarderRequestRewrite();
    testForwarderDerivesFacts();
    testForwarderIgnoresMalformedUsage();
    return 0;
}
