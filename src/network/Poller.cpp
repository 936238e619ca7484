#include "apisim/network/Poller.h"
#include "apisim/network/Channel.h"
#include "apisim/network/EpollPoller.h"
#include "apisim/common/Logger.h"

#include <cstdlib>

#if APISIM_WITH_URING
#include "apisim/network/UringPoller.h"
#endif

namespace apisim {
namespace network {

bool Poller::HasChannel(Channel* channel) const {
    const auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

std::unique_ptr<Poller> Poller::NewDefaultPoller(EventLoop* loop) {
    const bool wantUring = std::getenv("APISIM_USE_URING") != nullptr;
#if APISIM_WITH_URING
    if (wantUring) {
        LOG_INFO << "Polling with io_uring";
        return std::make_unique<UringPoller>(loop);
    }
#else
    if (wantUring) {
        LOG_WARN << "io_uring requested but not built in, polling with epoll";
    }
#endif
    return std::make_unique<EpollPoller>(loop);
}

} // namespace network
} // namespace apisim
