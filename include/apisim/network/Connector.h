#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/InetAddress.h"

#include <functional>
#include <memory>

namespace apisim {
namespace network {

class Channel;
class EventLoop;

// One non-blocking connect attempt, no retries. The result callback gets
// either a connected fd and 0, or -1 and the errno of the failure.
class Connector : public std::enable_shared_from_this<Connector>,
                  apisim::common::noncopyable {
public:
    using ResultCallback = std::function<void(int sockfd, int err)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetResultCallback(ResultCallback cb) { resultCallback_ = std::move(cb); }

    void Start();
    // Abandons a pending attempt; the callback is not invoked afterwards.
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    void Begin();
    void OnWritable();
    int ReleaseChannel();
    void Finish(int sockfd, int err);

    EventLoop* loop_;
    const InetAddress serverAddr_;
    bool wanted_ = false;
    std::unique_ptr<Channel> channel_;
    ResultCallback resultCallback_;
};

} // namespace network
} // namespace apisim
