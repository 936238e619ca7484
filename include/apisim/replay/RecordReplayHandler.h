#pragma once

#include "apisim/Producer.h"
#include "apisim/common/SimulatorConfig.h"
#include "apisim/common/noncopyable.h"
#include "apisim/network/EventLoop.h"
#include "apisim/replay/Forwarder.h"
#include "apisim/replay/RecordingStore.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apisim {
namespace replay {

// Producer for record and replay modes.
// - record: forward to the matching upstream, store the exchange, return the upstream response
// - replay: return the stored exchange whose request digest matches
// Store access (appends, lookups, saves) is serialised by one mutex.
class RecordReplayHandler : public Producer, apisim::common::noncopyable {
public:
    RecordReplayHandler(apisim::common::SimulatorMode mode,
                        const apisim::common::RecordingOptions& options,
                        std::vector<std::unique_ptr<Forwarder>> forwarders);

    // nullptr when a forwarder host does not resolve.
    static std::unique_ptr<RecordReplayHandler> FromConfig(apisim::network::EventLoop* loop,
                                                           const apisim::common::SimulatorConfig& cfg);

    void Produce(const std::shared_ptr<RequestContext>& ctx, Callback done) override;

    // Writes recordings changed since the last save. Only valid in record mode.
    bool SaveRecordings(size_t* written = nullptr);

    apisim::common::SimulatorMode mode() const { return mode_; }

private:
    void Replay(const std::shared_ptr<RequestContext>& ctx, const Callback& done);
    void Record(const std::shared_ptr<RequestContext>& ctx, const Callback& done);
    // Stores the exchange and returns the response to hand back. May throw.
    apisim::protocol::HttpResponse Capture(RequestContext& ctx, const Forwarder& fwd,
                                           const std::string& digest, Forwarder::Exchange exchange);
    Forwarder* FindForwarder(const std::string& path) const;

    const apisim::common::SimulatorMode mode_;
    const bool autosave_;
    std::vector<std::unique_ptr<Forwarder>> forwarders_;

    std::mutex mutex_;
    RecordingStore store_;
};

} // namespace replay
} // namespace apisim
