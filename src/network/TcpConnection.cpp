#include "apisim/network/TcpConnection.h"
#include "apisim/network/Channel.h"
#include "apisim/network/EventLoop.h"
#include "apisim/network/Socket.h"
#include "apisim/common/Logger.h"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace apisim {
namespace network {

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& name,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(name),
      peer_(peerAddr.toIpPort()),
      state_(State::Connecting),
      socket_(std::make_unique<Socket>(sockfd)),
      channel_(std::make_unique<Channel>(loop, sockfd)) {
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point at) { HandleRead(at); });
    channel_->SetWriteCallback([this] { HandleWrite(); });
    channel_->SetCloseCallback([this] { HandleClose(); });
    channel_->SetErrorCallback([this] { HandleError(); });

    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
    LOG_DEBUG << "connection " << name_ << " " << localAddr.toIpPort() << " <- " << peer_;
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "connection " << name_ << " released, fd=" << channel_->fd();
}

void TcpConnection::ConnectEstablished() {
    state_ = State::Connected;
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (connectionCallback_) connectionCallback_(shared_from_this());
}

void TcpConnection::ConnectDestroyed() {
    if (state_ != State::Closed) {
        state_ = State::Closed;
        channel_->DisableAll();
        if (connectionCallback_) connectionCallback_(shared_from_this());
    }
    channel_->Remove();
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    int savedErrno = 0;
    const ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        if (messageCallback_) messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        return;
    }
    if (n < 0 && (savedErrno == EAGAIN || savedErrno == EINTR)) return;
    if (n < 0) {
        LOG_DEBUG << "connection " << name_ << " read failed, errno=" << savedErrno;
    }
    HandleClose();
}

ssize_t TcpConnection::WriteSome(const char* data, size_t len) {
    const ssize_t n = ::write(channel_->fd(), data, len);
    if (n >= 0) return n;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
    LOG_DEBUG << "connection " << name_ << " write failed, errno=" << errno;
    return -1;
}

void TcpConnection::HandleWrite() {
    if (!channel_->IsWriting()) return;
    const ssize_t n = WriteSome(outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
    if (n < 0) {
        outputBuffer_.RetrieveAll();
        channel_->DisableWriting();
        return;
    }
    outputBuffer_.Retrieve(static_cast<size_t>(n));
    if (outputBuffer_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        ShutdownIfDrained();
    }
}

void TcpConnection::HandleClose() {
    if (state_ == State::Closed) return;
    state_ = State::Closed;
    channel_->DisableAll();

    TcpConnectionPtr self(shared_from_this());
    if (connectionCallback_) connectionCallback_(self);
    if (closeCallback_) closeCallback_(self);
}

void TcpConnection::HandleError() {
    const int err = Socket::GetSocketError(channel_->fd());
    if (err != 0) {
        LOG_DEBUG << "connection " << name_ << " SO_ERROR=" << err;
    }
}

void TcpConnection::Send(const std::string& message) {
    if (state_ != State::Connected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(message);
        return;
    }
    loop_->RunInLoop([self = shared_from_this(), message]() { self->SendInLoop(message); });
}

void TcpConnection::SendInLoop(const std::string& message) {
    if (state_ == State::Closed) return;

    size_t written = 0;
    // Only write directly when nothing is queued, otherwise bytes reorder.
    if (outputBuffer_.ReadableBytes() == 0 && !channel_->IsWriting()) {
        const ssize_t n = WriteSome(message.data(), message.size());
        if (n < 0) return;
        written = static_cast<size_t>(n);
    }
    if (written == message.size()) return;

    outputBuffer_.Append(message.data() + written, message.size() - written);
    if (!channel_->IsWriting()) channel_->EnableWriting();
}

void TcpConnection::Shutdown() {
    State expected = State::Connected;
    if (!state_.compare_exchange_strong(expected, State::Draining)) return;
    loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownIfDrained(); });
}

void TcpConnection::ShutdownIfDrained() {
    if (state_ == State::Draining && !channel_->IsWriting()) {
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    const State s = state_;
    if (s != State::Connected && s != State::Draining) return;
    state_ = State::Draining;
    loop_->RunInLoop([self = shared_from_this()]() {
        if (self->state_ != State::Closed) self->HandleClose();
    });
}

} // namespace network
} // namespace apisim
