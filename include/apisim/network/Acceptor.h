#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/Channel.h"
#include "apisim/network/Socket.h"

#include <functional>

namespace apisim {
namespace network {

class EventLoop;
class InetAddress;

// Listening socket registered on a loop. Hands each accepted fd to the
// callback, which takes ownership of it.
class Acceptor : apisim::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { callback_ = cb; }

    // False when bind or listen failed; the failure is logged.
    bool Listen();

private:
    void AcceptPending();

    Socket socket_;
    Channel channel_;
    NewConnectionCallback callback_;
    bool bound_ = false;
    bool listening_ = false;
};

} // namespace network
} // namespace apisim
