#include "apisim/network/Acceptor.h"
#include "apisim/network/EventLoop.h"
#include "apisim/network/InetAddress.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace apisim {
namespace network {

namespace {
// Accepts per readiness event before yielding back to the loop.
const int kAcceptBatch = 16;
} // namespace

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : socket_(Socket::CreateNonblocking()),
      channel_(loop, socket_.fd()) {
    if (socket_.fd() >= 0) {
        socket_.SetReuseAddr(true);
        bound_ = socket_.BindAddress(listenAddr);
    }
    channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { AcceptPending(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        channel_.DisableAll();
        channel_.Remove();
    }
}

bool Acceptor::Listen() {
    if (!bound_ || !socket_.Listen()) return false;
    listening_ = true;
    channel_.EnableReading();
    return true;
}

void Acceptor::AcceptPending() {
    for (int i = 0; i < kAcceptBatch; ++i) {
        InetAddress peer;
        const int connfd = socket_.Accept(&peer);
        if (connfd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_ERROR << "accept failed: " << std::strerror(errno);
            }
            return;
        }
        if (callback_) {
            callback_(connfd, peer);
        } else {
            ::close(connfd);
        }
    }
}

} // namespace network
} // namespace apisim
