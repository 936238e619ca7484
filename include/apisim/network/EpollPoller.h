#pragma once

#include "apisim/network/Poller.h"

#include <sys/epoll.h>
#include <vector>

namespace apisim {
namespace network {

// Level-triggered epoll. Channels watching nothing are parked: dropped from
// the kernel set but kept in channels_ until RemoveChannel.
class EpollPoller : public Poller {
public:
    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller() override;

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels) override;
    void UpdateChannel(Channel* channel) override;
    void RemoveChannel(Channel* channel) override;

private:
    bool Control(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> ready_;
};

} // namespace network
} // namespace apisim
