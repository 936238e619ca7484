#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/Channel.h"
#include "apisim/network/Poller.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace apisim {
namespace network {

// One loop per thread. Everything except Quit, RunInLoop, QueueInLoop,
// RunAfter and Cancel must be called from the loop thread.
class EventLoop : apisim::common::noncopyable {
public:
    using Functor = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    // One-shot timer backed by a timerfd. Non-positive delays fire on the next poll.
    TimerId RunAfter(double delaySeconds, Functor cb);
    // No-op if the timer already fired or was cancelled.
    void Cancel(TimerId id);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    struct Timer {
        ~Timer();
        int fd{-1};
        std::unique_ptr<Channel> channel;
        Functor callback;
    };

    void HandleRead(); // For wakeup
    void DoPendingFunctors();
    void AddTimerInLoop(TimerId id, double delaySeconds, Functor cb);
    void FireTimer(TimerId id);
    void ReleaseTimer(std::unique_ptr<Timer> timer);

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<Poller> poller_;

    // wakeup fd
    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;

    std::atomic<TimerId> next_timer_id_;
    std::map<TimerId, std::unique_ptr<Timer>> timers_;
};

} // namespace network
} // namespace apisim
