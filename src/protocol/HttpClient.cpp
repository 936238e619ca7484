#include "apisim/protocol/HttpClient.h"
#include "apisim/network/Buffer.h"
#include "apisim/network/TcpClient.h"
#include "apisim/network/TcpConnection.h"
#include "apisim/common/Logger.h"

#include <cstring>

namespace apisim {
namespace protocol {

using apisim::network::TcpConnectionPtr;

HttpClient::HttpClient(apisim::network::EventLoop* loop,
                       const apisim::network::InetAddress& serverAddr,
                       const std::string& name)
    : loop_(loop),
      client_(new apisim::network::TcpClient(loop, serverAddr, name)) {
    client_->SetConnectionCallback(
        std::bind(&HttpClient::OnConnection, this, std::placeholders::_1));
    client_->SetMessageCallback(
        [this](const TcpConnectionPtr& conn, apisim::network::Buffer* buf, std::chrono::system_clock::time_point) {
            OnMessage(conn, buf);
        });
    client_->SetConnectFailedCallback([this](int err) {
        LOG_WARN << "Upstream connect failed: " << std::strerror(err);
        Finish(std::nullopt, "connect failed");
    });
}

HttpClient::~HttpClient() {
    if (timer_ != 0) loop_->Cancel(timer_);
}

void HttpClient::Send(std::string rawRequest, double timeoutSeconds, ResponseCallback cb) {
    request_ = std::move(rawRequest);
    callback_ = std::move(cb);
    self_ = shared_from_this();
    if (timeoutSeconds > 0.0) {
        timer_ = loop_->RunAfter(timeoutSeconds, [this]() {
            timer_ = 0;
            Finish(std::nullopt, "timeout");
        });
    }
    client_->Connect();
}

void HttpClient::OnConnection(const TcpConnectionPtr& conn) {
    if (done_) return;
    if (conn->connected()) {
        conn->Send(request_);
        return;
    }
    if (parser_.finishOnClose()) {
        Finish(parser_.response(), nullptr);
    } else {
        Finish(std::nullopt, "connection closed before a complete response");
    }
}

void HttpClient::OnMessage(const TcpConnectionPtr& conn, apisim::network::Buffer* buf) {
    (void)conn;
    if (done_) {
        buf->RetrieveAll();
        return;
    }
    const bool complete = parser_.feed(buf->Peek(), buf->ReadableBytes());
    buf->RetrieveAll();
    if (complete) {
        Finish(parser_.response(), nullptr);
    } else if (parser_.hasError()) {
        Finish(std::nullopt, "malformed upstream response");
    }
}

void HttpClient::Finish(std::optional<HttpResponse> response, const char* reason) {
    if (done_) return;
    done_ = true;
    if (timer_ != 0) {
        loop_->Cancel(timer_);
        timer_ = 0;
    }
    if (reason) {
        LOG_WARN << "Upstream request failed: " << reason;
    }

    ResponseCallback cb = std::move(callback_);
    callback_ = nullptr;
    if (cb) cb(std::move(response));

    // Tear down outside of the current TcpConnection/Connector callback.
    std::shared_ptr<HttpClient> self = std::move(self_);
    loop_->QueueInLoop([self]() { self->client_.reset(); });
}

} // namespace protocol
} // namespace apisim
