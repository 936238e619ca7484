#include "apisim/network/Channel.h"
#include "apisim/network/EventLoop.h"
#include "apisim/common/Logger.h"

#include <sys/epoll.h>

namespace apisim {
namespace network {

const uint32_t Channel::kReadMask = EPOLLIN | EPOLLPRI;
const uint32_t Channel::kWriteMask = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd) : loop_(loop), fd_(fd) {}

Channel::~Channel() {
    if (registered_) {
        LOG_WARN << "Channel fd=" << fd_ << " destroyed while still registered";
    }
}

void Channel::Tie(const std::shared_ptr<void>& obj) {
    tie_ = obj;
    tied_ = true;
}

void Channel::SetInterest(uint32_t events) {
    events_ = events;
    registered_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    registered_ = false;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receive_time) {
    if (!tied_) {
        Dispatch(receive_time);
        return;
    }
    if (std::shared_ptr<void> owner = tie_.lock()) {
        Dispatch(receive_time);
    }
}

void Channel::Dispatch(std::chrono::system_clock::time_point receive_time) {
    const uint32_t r = revents_;
    // Hang-up with no data left to read.
    if ((r & EPOLLHUP) && !(r & EPOLLIN) && close_callback_) close_callback_();
    if ((r & EPOLLERR) && error_callback_) error_callback_();
    if ((r & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) && read_callback_) read_callback_(receive_time);
    if ((r & EPOLLOUT) && write_callback_) write_callback_();
}

} // namespace network
} // namespace apisim
