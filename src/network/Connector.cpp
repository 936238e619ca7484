#include "apisim/network/Connector.h"
#include "apisim/network/Channel.h"
#include "apisim/network/EventLoop.h"
#include "apisim/network/Socket.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace apisim {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop), serverAddr_(serverAddr) {}

Connector::~Connector() {
    if (channel_) {
        LOG_WARN << "Connector to " << serverAddr_.toIpPort() << " destroyed mid-connect";
    }
}

void Connector::Start() {
    wanted_ = true;
    loop_->RunInLoop([self = shared_from_this()]() {
        if (self->wanted_) self->Begin();
    });
}

void Connector::Stop() {
    wanted_ = false;
    loop_->QueueInLoop([self = shared_from_this()]() {
        if (self->channel_) ::close(self->ReleaseChannel());
    });
}

void Connector::Begin() {
    const int sockfd = Socket::CreateNonblocking();
    if (sockfd < 0) {
        Finish(-1, errno);
        return;
    }

    const int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int err = ret == 0 ? 0 : errno;
    if (err != 0 && err != EINPROGRESS && err != EINTR && err != EISCONN) {
        ::close(sockfd);
        Finish(-1, err);
        return;
    }

    // Writability signals completion either way; SO_ERROR tells which.
    channel_ = std::make_unique<Channel>(loop_, sockfd);
    channel_->SetWriteCallback([this] { OnWritable(); });
    channel_->SetErrorCallback([this] { OnWritable(); });
    channel_->EnableWriting();
}

void Connector::OnWritable() {
    if (!channel_) return;
    const int sockfd = ReleaseChannel();
    const int err = Socket::GetSocketError(sockfd);
    if (err != 0) {
        ::close(sockfd);
        Finish(-1, err);
        return;
    }
    if (!wanted_) {
        ::close(sockfd);
        return;
    }
    Finish(sockfd, 0);
}

int Connector::ReleaseChannel() {
    channel_->DisableAll();
    channel_->Remove();
    const int sockfd = channel_->fd();
    // The channel may be mid-HandleEvent; free it on the next loop turn.
    std::shared_ptr<Channel> doomed(std::move(channel_));
    loop_->QueueInLoop([doomed]() {});
    return sockfd;
}

void Connector::Finish(int sockfd, int err) {
    if (err != 0) {
        LOG_WARN << "Connect to " << serverAddr_.toIpPort() << " failed: " << std::strerror(err);
    }
    if (!wanted_) return;
    if (resultCallback_) {
        resultCallback_(sockfd, err);
    } else if (sockfd >= 0) {
        ::close(sockfd);
    }
}

} // namespace network
} // namespace apisim
