#include "apisim/network/TcpClient.h"
#include "apisim/network/Connector.h"
#include "apisim/network/EventLoop.h"
#include "apisim/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

namespace apisim {
namespace network {

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& name)
    : loop_(loop),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      name_(name) {
    connector_->SetResultCallback([this](int sockfd, int err) { OnConnectResult(sockfd, err); });
}

TcpClient::~TcpClient() {
    // Queued connector functors may outlive us.
    connector_->SetResultCallback([](int sockfd, int) {
        if (sockfd >= 0) ::close(sockfd);
    });
    if (!connection_) {
        connector_->Stop();
        return;
    }
    EventLoop* loop = loop_;
    connection_->SetCloseCallback([loop](const TcpConnectionPtr& conn) {
        loop->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
    });
    connection_->ForceClose();
}

void TcpClient::Connect() {
    LOG_DEBUG << name_ << " connecting to " << connector_->serverAddress().toIpPort();
    connector_->Start();
}

void TcpClient::OnConnectResult(int sockfd, int err) {
    if (sockfd < 0) {
        if (connectFailedCallback_) connectFailedCallback_(err);
        return;
    }

    struct sockaddr_in local{};
    socklen_t len = static_cast<socklen_t>(sizeof local);
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        LOG_DEBUG << name_ << " getsockname failed errno=" << errno;
    }

    auto conn = std::make_shared<TcpConnection>(loop_, name_, sockfd, InetAddress(local),
                                                connector_->serverAddress());
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) {
        connection_.reset();
        loop_->QueueInLoop([c]() { c->ConnectDestroyed(); });
    });
    connection_ = conn;
    conn->ConnectEstablished();
}

} // namespace network
} // namespace apisim
