#pragma once

#include "apisim/common/noncopyable.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace apisim {
namespace network {

class EventLoop;

// Binds one fd to its event callbacks. Does not own the fd.
class Channel : apisim::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    // Where the poller has this channel: never seen, in the kernel set, or
    // known but currently watching nothing.
    enum class PollState { New, Armed, Parked };

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void HandleEvent(std::chrono::system_clock::time_point receive_time);

    void SetReadCallback(ReadEventCallback cb) { read_callback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { write_callback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { close_callback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { error_callback_ = std::move(cb); }

    // Callbacks are skipped once obj has expired.
    void Tie(const std::shared_ptr<void>& obj);

    int fd() const { return fd_; }
    uint32_t events() const { return events_; }
    void set_revents(uint32_t revents) { revents_ = revents; }
    bool IsNoneEvent() const { return events_ == 0; }
    bool IsWriting() const { return (events_ & kWriteMask) != 0; }

    void EnableReading() { SetInterest(events_ | kReadMask); }
    void EnableWriting() { SetInterest(events_ | kWriteMask); }
    void DisableWriting() { SetInterest(events_ & ~kWriteMask); }
    void DisableAll() { SetInterest(0); }

    PollState poll_state() const { return poll_state_; }
    void set_poll_state(PollState state) { poll_state_ = state; }

    void Remove();

private:
    static const uint32_t kReadMask;
    static const uint32_t kWriteMask;

    void SetInterest(uint32_t events);
    void Dispatch(std::chrono::system_clock::time_point receive_time);

    EventLoop* loop_;
    const int fd_;
    uint32_t events_ = 0;
    uint32_t revents_ = 0;
    PollState poll_state_ = PollState::New;
    bool registered_ = false;
    bool tied_ = false;
    std::weak_ptr<void> tie_;

    ReadEventCallback read_callback_;
    EventCallback write_callback_;
    EventCallback close_callback_;
    EventCallback error_callback_;
};

} // namespace network
} // namespace apisim
