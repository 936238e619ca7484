#include "apisim/network/UringPoller.h"
#include "apisim/network/Channel.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <linux/time_types.h>
#include <vector>

namespace apisim {
namespace network {

UringPoller::UringPoller(EventLoop* loop)
    : Poller(loop) {
    int ret = io_uring_queue_init(kQueueDepth, &ring_, 0);
    if (ret < 0) {
        LOG_FATAL << "io_uring_queue_init failed: " << -ret;
    }
}

UringPoller::~UringPoller() {
    io_uring_queue_exit(&ring_);
}

uint64_t UringPoller::Tag(int fd, uint32_t generation) {
    return (static_cast<uint64_t>(generation) << 32) | static_cast<uint64_t>(fd + 1);
}

std::chrono::system_clock::time_point UringPoller::Poll(int timeout_ms, ChannelList* active_channels) {
    struct __kernel_timespec ts;
    ts.tv_sec = timeout_ms / 1000;
    ts.tv_nsec = (timeout_ms % 1000) * 1000000LL;

    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_submit_and_wait_timeout(&ring_, &cqe, 1, &ts, nullptr);
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    if (ret < 0 && ret != -ETIME && ret != -EINTR) {
        LOG_ERROR << "io_uring_submit_and_wait_timeout failed: " << -ret;
        return now;
    }

    unsigned head;
    unsigned count = 0;
    std::vector<Channel*> rearm;
    io_uring_for_each_cqe(&ring_, head, cqe) {
        ++count;
        const uint64_t tag = io_uring_cqe_get_data64(cqe);
        if (tag == 0) continue; // poll_remove completion
        const int fd = static_cast<int>(tag & 0xffffffffu) - 1;
        const uint32_t generation = static_cast<uint32_t>(tag >> 32);

        auto ait = armed_.find(fd);
        auto cit = channels_.find(fd);
        if (ait == armed_.end() || cit == channels_.end() || ait->second.generation != generation) {
            continue;
        }
        ait->second.pending = false;
        if (cqe->res >= 0) {
            cit->second->set_revents(static_cast<uint32_t>(cqe->res));
            active_channels->push_back(cit->second);
            rearm.push_back(cit->second);
        } else if (cqe->res != -ECANCELED) {
            LOG_ERROR << "io_uring poll error for fd " << fd << ": " << -cqe->res;
        }
    }
    io_uring_cq_advance(&ring_, count);

    for (Channel* channel : rearm) {
        if (!channel->IsNoneEvent()) Arm(channel);
    }
    return now;
}

void UringPoller::Arm(Channel* channel) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        io_uring_submit(&ring_);
        sqe = io_uring_get_sqe(&ring_);
    }
    if (!sqe) {
        LOG_ERROR << "io_uring submission queue full, fd=" << channel->fd();
        return;
    }
    Armed& a = armed_[channel->fd()];
    ++a.generation;
    a.pending = true;
    io_uring_prep_poll_add(sqe, channel->fd(), static_cast<unsigned>(channel->events()));
    io_uring_sqe_set_data64(sqe, Tag(channel->fd(), a.generation));
}

void UringPoller::Disarm(int fd) {
    auto it = armed_.find(fd);
    if (it == armed_.end() || !it->second.pending) return;
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        io_uring_submit(&ring_);
        sqe = io_uring_get_sqe(&ring_);
    }
    if (sqe) {
        io_uring_prep_poll_remove(sqe, Tag(fd, it->second.generation));
        io_uring_sqe_set_data64(sqe, 0);
    }
    // Bumping the generation makes any in-flight completion stale.
    ++it->second.generation;
    it->second.pending = false;
}

void UringPoller::UpdateChannel(Channel* channel) {
    channels_[channel->fd()] = channel;
    Disarm(channel->fd());
    if (!channel->IsNoneEvent()) {
        Arm(channel);
    }
}

void UringPoller::RemoveChannel(Channel* channel) {
    // The generation entry is kept so a reused fd never matches a stale completion.
    Disarm(channel->fd());
    channels_.erase(channel->fd());
}

} // namespace network
} // namespace apisim
