#include "apisim/network/TcpServer.h"
#include "apisim/network/Acceptor.h"
#include "apisim/network/EventLoop.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <sys/socket.h>

namespace apisim {
namespace network {

namespace {

InetAddress LocalAddressOf(int sockfd) {
    struct sockaddr_in local{};
    socklen_t len = static_cast<socklen_t>(sizeof local);
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        LOG_DEBUG << "getsockname failed fd=" << sockfd << " errno=" << errno;
    }
    return InetAddress(local);
}

} // namespace

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(name),
      acceptor_(std::make_unique<Acceptor>(loop, listenAddr)) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { OnAccepted(sockfd, peer); });
}

TcpServer::~TcpServer() {
    auto live = std::move(connections_);
    connections_.clear();
    for (auto& entry : live) {
        entry.second->ConnectDestroyed();
    }
}

bool TcpServer::Start() {
    if (listening_) return true;
    if (!acceptor_->Listen()) {
        LOG_ERROR << name_ << ": cannot listen on " << hostport_;
        return false;
    }
    listening_ = true;
    LOG_INFO << name_ << " listening on " << hostport_;
    return true;
}

void TcpServer::OnAccepted(int sockfd, const InetAddress& peerAddr) {
    const std::string connName = name_ + "#" + std::to_string(++accepted_);
    auto conn = std::make_shared<TcpConnection>(loop_, connName, sockfd,
                                                LocalAddressOf(sockfd), peerAddr);
    connections_.emplace(connName, conn);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { OnClosed(c); });
    conn->ConnectEstablished();
}

void TcpServer::OnClosed(const TcpConnectionPtr& conn) {
    // Runs inside the connection's own event handler; detach on the next turn.
    loop_->QueueInLoop([this, conn]() {
        if (connections_.erase(conn->name()) == 0) return;
        loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
    });
}

} // namespace network
} // namespace apisim
