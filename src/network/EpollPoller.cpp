#include "apisim/network/EpollPoller.h"
#include "apisim/network/Channel.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <unistd.h>

namespace apisim {
namespace network {

namespace {
const size_t kInitialReadySlots = 16;
} // namespace

EpollPoller::EpollPoller(EventLoop* loop)
    : Poller(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      ready_(kInitialReadySlots) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed errno=" << errno;
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeout_ms, ChannelList* active_channels) {
    const int n = ::epoll_wait(epollfd_, ready_.data(), static_cast<int>(ready_.size()), timeout_ms);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) LOG_ERROR << "epoll_wait errno=" << savedErrno;
        return now;
    }
    for (int i = 0; i < n; ++i) {
        auto* channel = static_cast<Channel*>(ready_[static_cast<size_t>(i)].data.ptr);
        channel->set_revents(ready_[static_cast<size_t>(i)].events);
        active_channels->push_back(channel);
    }
    // A full batch hints at more pending events than slots.
    if (static_cast<size_t>(n) == ready_.size()) {
        ready_.resize(ready_.size() * 2);
    }
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    using State = Channel::PollState;
    const State state = channel->poll_state();

    if (state == State::New) {
        channels_[channel->fd()] = channel;
    }
    if (state != State::Armed) {
        if (channel->IsNoneEvent()) {
            channel->set_poll_state(State::Parked);
        } else if (Control(EPOLL_CTL_ADD, channel)) {
            channel->set_poll_state(State::Armed);
        }
        return;
    }
    if (channel->IsNoneEvent()) {
        Control(EPOLL_CTL_DEL, channel);
        channel->set_poll_state(State::Parked);
    } else {
        Control(EPOLL_CTL_MOD, channel);
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    channels_.erase(channel->fd());
    if (channel->poll_state() == Channel::PollState::Armed) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channel->set_poll_state(Channel::PollState::New);
}

bool EpollPoller::Control(int operation, Channel* channel) {
    struct epoll_event ev{};
    ev.events = channel->events();
    ev.data.ptr = channel;
    if (::epoll_ctl(epollfd_, operation, channel->fd(), &ev) == 0) return true;

    // A DEL can race a peer that already closed the fd.
    if (operation == EPOLL_CTL_DEL) {
        LOG_ERROR << "epoll_ctl DEL fd=" << channel->fd() << " errno=" << errno;
    } else {
        LOG_FATAL << "epoll_ctl op=" << operation << " fd=" << channel->fd() << " errno=" << errno;
    }
    return false;
}

} // namespace network
} // namespace apisim
