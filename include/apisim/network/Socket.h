#pragma once

#include "apisim/common/noncopyable.h"

namespace apisim {
namespace network {

class InetAddress;

// Owns a TCP socket fd and closes it on destruction.
class Socket : apisim::common::noncopyable {
public:
    explicit Socket(int sockfd) : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    // Non-blocking accept; -1 with errno set when nothing is pending.
    int Accept(InetAddress* peeraddr);
    void ShutdownWrite();

    void SetTcpNoDelay(bool on) { SetFlag(kNoDelay, on); }
    void SetReuseAddr(bool on) { SetFlag(kReuseAddr, on); }
    void SetKeepAlive(bool on) { SetFlag(kKeepAlive, on); }

    static int CreateNonblocking();
    // Pending SO_ERROR of sockfd, or the getsockopt errno.
    static int GetSocketError(int sockfd);

private:
    enum Flag { kNoDelay, kReuseAddr, kKeepAlive };
    void SetFlag(Flag flag, bool on);

    const int sockfd_;
};

} // namespace network
} // namespace apisim
