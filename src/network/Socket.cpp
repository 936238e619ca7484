#include "apisim/network/Socket.h"
#include "apisim/network/InetAddress.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace apisim {
namespace network {

Socket::~Socket() {
    if (sockfd_ >= 0) ::close(sockfd_);
}

int Socket::CreateNonblocking() {
    const int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_ERROR << "socket() failed: " << std::strerror(errno);
    }
    return sockfd;
}

int Socket::GetSocketError(int sockfd) {
    int err = 0;
    socklen_t len = static_cast<socklen_t>(sizeof err);
    return ::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0 ? errno : err;
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) == 0) return true;
    LOG_ERROR << "bind " << localaddr.toIpPort() << " failed: " << std::strerror(errno);
    return false;
}

bool Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) == 0) return true;
    LOG_ERROR << "listen failed: " << std::strerror(errno);
    return false;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr{};
    socklen_t len = static_cast<socklen_t>(sizeof addr);
    const int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                                 SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) *peeraddr = InetAddress(addr);
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_DEBUG << "shutdown(SHUT_WR) fd=" << sockfd_ << " errno=" << errno;
    }
}

void Socket::SetFlag(Flag flag, bool on) {
    int level = SOL_SOCKET;
    int name = SO_KEEPALIVE;
    switch (flag) {
        case kNoDelay: level = IPPROTO_TCP; name = TCP_NODELAY; break;
        case kReuseAddr: name = SO_REUSEADDR; break;
        case kKeepAlive: name = SO_KEEPALIVE; break;
    }
    const int value = on ? 1 : 0;
    if (::setsockopt(sockfd_, level, name, &value, sizeof value) < 0) {
        LOG_DEBUG << "setsockopt(" << name << ") fd=" << sockfd_ << " errno=" << errno;
    }
}

} // namespace network
} // namespace apisim
