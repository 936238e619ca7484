#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/Callbacks.h"
#include "apisim/network/EventLoop.h"
#include "apisim/network/InetAddress.h"
#include "apisim/protocol/HttpResponse.h"
#include "apisim/protocol/HttpResponseContext.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace apisim {
namespace network {
class TcpClient;
}

namespace protocol {

// One request/response exchange over a fresh connection. The callback runs
// exactly once on the loop thread: with the parsed response, or with nullopt
// on connect failure, timeout, malformed response or early close.
class HttpClient : apisim::common::noncopyable,
                   public std::enable_shared_from_this<HttpClient> {
public:
    using ResponseCallback = std::function<void(std::optional<HttpResponse>)>;

    HttpClient(apisim::network::EventLoop* loop,
               const apisim::network::InetAddress& serverAddr,
               const std::string& name);
    ~HttpClient();

    // rawRequest is sent verbatim once connected.
    void Send(std::string rawRequest, double timeoutSeconds, ResponseCallback cb);

private:
    void OnConnection(const apisim::network::TcpConnectionPtr& conn);
    void OnMessage(const apisim::network::TcpConnectionPtr& conn, apisim::network::Buffer* buf);
    void Finish(std::optional<HttpResponse> response, const char* reason);

    apisim::network::EventLoop* loop_;
    std::unique_ptr<apisim::network::TcpClient> client_;
    HttpResponseContext parser_;
    std::string request_;
    ResponseCallback callback_;
    apisim::network::EventLoop::TimerId timer_{0};
    bool done_{false};
    // Keeps this object alive from Send until Finish.
    std::shared_ptr<HttpClient> self_;
};

} // namespace protocol
} // namespace apisim
