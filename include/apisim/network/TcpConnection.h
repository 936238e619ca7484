#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/Buffer.h"
#include "apisim/network/Callbacks.h"
#include "apisim/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace apisim {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One accepted or connected stream socket. Lives on a single loop; Send,
// Shutdown and ForceClose may be called from any thread.
class TcpConnection : apisim::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    enum class State { Connecting, Connected, Draining, Closed };

    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    const std::string& name() const { return name_; }
    const std::string& peer() const { return peer_; }
    State state() const { return state_; }
    bool connected() const { return state_ == State::Connected; }

    // Per-connection protocol state, e.g. the HTTP parser.
    void SetContext(const std::any& context) { context_ = context; }
    std::any* GetMutableContext() { return &context_; }

    Buffer* inputBuffer() { return &inputBuffer_; }
    size_t pendingOutput() const { return outputBuffer_.ReadableBytes(); }

    void Send(const std::string& message);
    // Half-closes once the output buffer has drained.
    void Shutdown();
    void ForceClose();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    void ConnectEstablished();
    void ConnectDestroyed();

private:
    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const std::string& message);
    // Writes as much of [data, data+len) as the socket takes. Returns the
    // byte count written, or -1 when the peer is gone.
    ssize_t WriteSome(const char* data, size_t len);
    void ShutdownIfDrained();

    EventLoop* loop_;
    const std::string name_;
    const std::string peer_;
    std::atomic<State> state_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    CloseCallback closeCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;
};

} // namespace network
} // namespace apisim
