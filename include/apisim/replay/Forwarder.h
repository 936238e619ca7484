#pragma once

#include "apisim/common/SimulatorConfig.h"
#include "apisim/network/EventLoop.h"
#include "apisim/network/InetAddress.h"
#include "apisim/protocol/HttpResponse.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace apisim {
namespace protocol {
class HttpRequest;
}

namespace replay {

struct Recording;

// Sends requests under one path prefix to a real upstream over plain HTTP/1.1.
class Forwarder {
public:
    struct Exchange {
        apisim::protocol::HttpResponse response;
        double durationMs{0.0};
    };
    using Callback = std::function<void(std::optional<Exchange>)>;

    Forwarder(apisim::network::EventLoop* loop,
              apisim::common::ForwarderConfig cfg,
              const apisim::network::InetAddress& upstream);

    // Resolves cfg.host once. nullptr (after logging) when it does not resolve.
    static std::unique_ptr<Forwarder> Create(apisim::network::EventLoop* loop,
                                             const apisim::common::ForwarderConfig& cfg);

    bool Matches(const std::string& path) const;
    const apisim::common::ForwarderConfig& config() const { return cfg_; }

    // Upstream wire request: Host rewritten, Connection: close, the
    // simulator's credentials replaced by the configured upstream key.
    std::string BuildRequest(const apisim::protocol::HttpRequest& req) const;

    // cb runs once on the loop thread; nullopt on connect failure, timeout
    // or malformed response.
    void Forward(const apisim::protocol::HttpRequest& req, Callback cb);

    // Limiter key, deployment and token count as the simulator would have set them.
    void DeriveFacts(const apisim::protocol::HttpRequest& req,
                     const apisim::protocol::HttpResponse& resp,
                     Recording* rec) const;

private:
    apisim::network::EventLoop* loop_;
    apisim::common::ForwarderConfig cfg_;
    apisim::network::InetAddress upstream_;
};

} // namespace replay
} // namespace apisim
