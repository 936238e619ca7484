#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/Callbacks.h"
#include "apisim/network/InetAddress.h"
#include "apisim/network/TcpConnection.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace apisim {
namespace network {

class Acceptor;
class EventLoop;

// Listening socket whose connections all run on the owning loop.
class TcpServer : apisim::common::noncopyable {
public:
    TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    EventLoop* getLoop() const { return loop_; }
    size_t connectionCount() const { return connections_.size(); }

    // Loop thread only. False when the port cannot be bound.
    bool Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }

private:
    void OnAccepted(int sockfd, const InetAddress& peerAddr);
    void OnClosed(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    bool listening_ = false;
    uint64_t accepted_ = 0;
    std::unordered_map<std::string, TcpConnectionPtr> connections_;
};

} // namespace network
} // namespace apisim
