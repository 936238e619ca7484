#include "apisim/replay/RecordReplayHandler.h"
#include "apisim/RequestContext.h"
#include "apisim/common/Logger.h"

#include <exception>
#include <utility>

namespace apisim {
namespace replay {

using apisim::common::SimulatorMode;
using apisim::protocol::HttpResponse;

RecordReplayHandler::RecordReplayHandler(SimulatorMode mode,
                                         const apisim::common::RecordingOptions& options,
                                         std::vector<std::unique_ptr<Forwarder>> forwarders)
    : mode_(mode),
      autosave_(options.autosave),
      forwarders_(std::move(forwarders)),
      store_(options.dir, options.compress) {}

std::unique_ptr<RecordReplayHandler> RecordReplayHandler::FromConfig(apisim::network::EventLoop* loop,
                                                                     const apisim::common::SimulatorConfig& cfg) {
    std::vector<std::unique_ptr<Forwarder>> forwarders;
    if (cfg.mode == SimulatorMode::kRecord) {
        for (const auto& fc : cfg.forwarders) {
            auto fwd = Forwarder::Create(loop, fc);
            if (!fwd) return nullptr;
            forwarders.push_back(std::move(fwd));
        }
        if (forwarders.empty()) {
            LOG_WARN << "Record mode without forwarders: every request will fail";
        }
    }
    LOG_INFO << "Recording directory: " << cfg.recording.dir
             << ", autosave: " << (cfg.recording.autosave ? "on" : "off")
             << ", compress: " << (cfg.recording.compress ? "on" : "off");
    return std::make_unique<RecordReplayHandler>(cfg.mode, cfg.recording, std::move(forwarders));
}

Forwarder* RecordReplayHandler::FindForwarder(const std::string& path) const {
    Forwarder* best = nullptr;
    for (const auto& f : forwarders_) {
        if (!f->Matches(path)) continue;
        if (best == nullptr || f->config().pathPrefix.size() > best->config().pathPrefix.size()) {
            best = f.get();
        }
    }
    return best;
}

void RecordReplayHandler::Produce(const std::shared_ptr<RequestContext>& ctx, Callback done) {
    switch (mode_) {
        case SimulatorMode::kRecord:
            Record(ctx, done);
            return;
        case SimulatorMode::kReplay:
            Replay(ctx, done);
            return;
        case SimulatorMode::kGenerate:
            break;
    }
    LOG_ERROR << "Record/replay handler used in " << apisim::common::ModeName(mode_) << " mode";
    done(std::nullopt);
}

void RecordReplayHandler::Replay(const std::shared_ptr<RequestContext>& ctx, const Callback& done) {
    const std::string digest = Recording::Digest(ctx->request);
    std::optional<Recording> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        found = store_.Find(ctx->request.path(), digest);
    }
    if (!found) {
        LOG_WARN << "No recording for " << ctx->request.method() << " " << ctx->request.target();
        done(std::nullopt);
        return;
    }
    found->applyTo(*ctx);
    done(found->toResponse());
}

void RecordReplayHandler::Record(const std::shared_ptr<RequestContext>& ctx, const Callback& done) {
    Forwarder* fwd = FindForwarder(ctx->request.path());
    if (fwd == nullptr) {
        LOG_WARN << "No forwarder for " << ctx->request.path();
        done(std::nullopt);
        return;
    }

    // Digest before forwarding so a failure surfaces in the caller's frame.
    const std::string digest = Recording::Digest(ctx->request);
    fwd->Forward(ctx->request, [this, ctx, fwd, done, digest](std::optional<Forwarder::Exchange> exchange) {
        // Runs from the upstream client's completion, outside any caller frame.
        std::optional<HttpResponse> result;
        try {
            if (exchange) result = Capture(*ctx, *fwd, digest, std::move(*exchange));
        } catch (const std::exception& e) {
            LOG_ERROR << "Recording " << ctx->request.method() << " " << ctx->request.target()
                      << " failed: " << e.what();
            result.reset();
        }
        done(std::move(result));
    });
}

HttpResponse RecordReplayHandler::Capture(RequestContext& ctx, const Forwarder& fwd,
                                          const std::string& digest, Forwarder::Exchange exchange) {
    Recording rec;
    rec.method = ctx.request.method();
    rec.target = ctx.request.target();
    rec.requestDigest = digest;
    rec.status = exchange.response.statusCode();
    rec.headers = exchange.response.headers();
    rec.body = exchange.response.body();
    rec.durationMs = exchange.durationMs;
    fwd.DeriveFacts(ctx.request, exchange.response, &rec);
    rec.applyTo(ctx);

    const std::string path = ctx.request.path();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.Add(path, std::move(rec));
        if (autosave_ && !store_.SavePath(path)) {
            LOG_ERROR << "Autosave failed for " << path;
        }
    }
    LOG_DEBUG << "Recorded " << ctx.request.method() << " " << ctx.request.target()
              << " -> " << exchange.response.statusCode() << " in " << exchange.durationMs << "ms";
    return std::move(exchange.response);
}

bool RecordReplayHandler::SaveRecordings(size_t* written) {
    if (mode_ != SimulatorMode::kRecord) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.Save(written);
}

} // namespace replay
} // namespace apisim
