#include "apisim/network/EventLoop.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace apisim {
namespace network {

namespace {

__thread EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

int CreateEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL << "Failed in eventfd errno=" << errno;
    }
    return evtfd;
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(Poller::NewDefaultPoller(this)),
      wakeup_fd_(CreateEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)),
      next_timer_id_(1) {
    LOG_DEBUG << "EventLoop created " << this << " in thread " << thread_id_;

    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in this thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_->SetReadCallback(std::bind(&EventLoop::HandleRead, this));
    wakeup_channel_->EnableReading();
}

EventLoop::Timer::~Timer() {
    if (fd >= 0) ::close(fd);
}

EventLoop::~EventLoop() {
    for (auto& kv : timers_) {
        kv.second->channel->DisableAll();
        kv.second->channel->Remove();
    }
    timers_.clear();
    wakeup_channel_->DisableAll();
    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    looping_ = true;
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " start looping";

    while (!quit_) {
        active_channels_.clear();
        const auto now = poller_->Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(now);
        }
        DoPendingFunctors();
    }

    LOG_DEBUG << "EventLoop " << this << " stop looping";
    looping_ = false;
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }

    if (!IsInLoopThread() || calling_pending_functors_) {
        WakeUp();
    }
}

EventLoop::TimerId EventLoop::RunAfter(double delaySeconds, Functor cb) {
    const TimerId id = next_timer_id_.fetch_add(1);
    if (IsInLoopThread()) {
        AddTimerInLoop(id, delaySeconds, std::move(cb));
    } else {
        QueueInLoop([this, id, delaySeconds, cb = std::move(cb)]() mutable {
            AddTimerInLoop(id, delaySeconds, std::move(cb));
        });
    }
    return id;
}

void EventLoop::AddTimerInLoop(TimerId id, double delaySeconds, Functor cb) {
    std::unique_ptr<Timer> timer(new Timer);
    timer->fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer->fd < 0) {
        LOG_ERROR << "timerfd_create failed errno=" << errno << ", running timer callback on next iteration";
        QueueInLoop(std::move(cb));
        return;
    }

    // A zero it_value disarms a timerfd, so clamp to 1us.
    long long ns = delaySeconds > 0.0 ? static_cast<long long>(delaySeconds * 1e9) : 0;
    if (ns < 1000) ns = 1000;
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = static_cast<time_t>(ns / 1000000000LL);
    howlong.it_value.tv_nsec = static_cast<long>(ns % 1000000000LL);
    if (::timerfd_settime(timer->fd, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "timerfd_settime failed errno=" << errno << ", running timer callback on next iteration";
        QueueInLoop(std::move(cb));
        return;
    }

    timer->callback = std::move(cb);
    timer->channel.reset(new Channel(this, timer->fd));
    timer->channel->SetReadCallback([this, id](std::chrono::system_clock::time_point) { FireTimer(id); });
    timer->channel->EnableReading();
    timers_[id] = std::move(timer);
}

void EventLoop::FireTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    std::unique_ptr<Timer> timer = std::move(it->second);
    timers_.erase(it);

    uint64_t expirations = 0;
    if (::read(timer->fd, &expirations, sizeof expirations) != sizeof expirations) {
        LOG_DEBUG << "timerfd read returned short for timer " << id;
    }
    Functor cb = std::move(timer->callback);
    // The channel is still inside HandleEvent; free it after this iteration.
    ReleaseTimer(std::move(timer));
    if (cb) cb();
}

void EventLoop::Cancel(TimerId id) {
    if (!IsInLoopThread()) {
        QueueInLoop([this, id]() { Cancel(id); });
        return;
    }
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    std::unique_ptr<Timer> timer = std::move(it->second);
    timers_.erase(it);
    ReleaseTimer(std::move(timer));
}

void EventLoop::ReleaseTimer(std::unique_ptr<Timer> timer) {
    timer->channel->DisableAll();
    timer->channel->Remove();
    std::shared_ptr<Timer> dying(std::move(timer));
    QueueInLoop([dying]() {});
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::WakeUp writes " << n << " bytes instead of 8";
    }
}

void EventLoop::HandleRead() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::HandleRead reads " << n << " bytes instead of 8";
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) {
    return poller_->HasChannel(channel);
}

void EventLoop::DoPendingFunctors() {
    std::vector<Functor> functors;
    calling_pending_functors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }

    for (const auto& functor : functors) {
        functor();
    }
    calling_pending_functors_ = false;
}

} // namespace network
} // namespace apisim
