#pragma once

#include "apisim/common/noncopyable.h"

#include <chrono>
#include <memory>
#include <unordered_map>
#include <vector>

namespace apisim {
namespace network {

class Channel;
class EventLoop;

// Readiness backend of an EventLoop. Loop thread only.
class Poller : apisim::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop) : loop_(loop) {}
    virtual ~Poller() = default;

    // Blocks up to timeout_ms and appends ready channels. Returns the wake time.
    virtual std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels) = 0;
    virtual void UpdateChannel(Channel* channel) = 0;
    virtual void RemoveChannel(Channel* channel) = 0;
    bool HasChannel(Channel* channel) const;

    // epoll, or io_uring when APISIM_USE_URING is set and support was built in.
    static std::unique_ptr<Poller> NewDefaultPoller(EventLoop* loop);

protected:
    EventLoop* ownerLoop() const { return loop_; }

    std::unordered_map<int, Channel*> channels_;

private:
    EventLoop* loop_;
};

} // namespace network
} // namespace apisim
