#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/Callbacks.h"
#include "apisim/network/InetAddress.h"
#include "apisim/network/TcpConnection.h"

#include <functional>
#include <memory>
#include <string>

namespace apisim {
namespace network {

class Connector;
class EventLoop;

// Owns at most one outbound connection. Loop thread only.
class TcpClient : apisim::common::noncopyable {
public:
    using ConnectFailedCallback = std::function<void(int err)>;

    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& name);
    ~TcpClient();

    void Connect();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb) { connectFailedCallback_ = cb; }

private:
    void OnConnectResult(int sockfd, int err);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    ConnectFailedCallback connectFailedCallback_;

    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace apisim
