#pragma once

#include "apisim/network/Poller.h"

#include <cstdint>
#include <liburing.h>
#include <unordered_map>

namespace apisim {
namespace network {

// Readiness polling through io_uring one-shot POLL_ADD requests.
// Each armed poll carries (generation << 32 | fd + 1) as user data so
// completions for a superseded registration can be told apart and dropped.
class UringPoller : public Poller {
public:
    explicit UringPoller(EventLoop* loop);
    ~UringPoller() override;

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels) override;
    void UpdateChannel(Channel* channel) override;
    void RemoveChannel(Channel* channel) override;

private:
    struct Armed {
        uint32_t generation{0};
        bool pending{false};
    };

    static uint64_t Tag(int fd, uint32_t generation);
    void Arm(Channel* channel);
    void Disarm(int fd);

    static const unsigned kQueueDepth = 256;

    struct io_uring ring_;
    std::unordered_map<int, Armed> armed_;
};

} // namespace network
} // namespace apisim
