#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/network/TcpServer.h"
#include "apisim/protocol/HttpResponse.h"

#include <functional>
#include <memory>

namespace apisim {
namespace protocol {

class HttpRequest;

struct HttpSession;

// Completes one request. Cheap to copy; only the first Write has effect.
// Must be used on the server's loop thread. Writing after the client went
// away is a silent no-op.
class ResponseWriter {
public:
    ResponseWriter(const apisim::network::TcpConnectionPtr& conn,
                   const std::shared_ptr<HttpSession>& session,
                   bool closeConnection);

    void Write(const HttpResponse& response) const;
    bool written() const { return *written_; }

private:
    std::weak_ptr<apisim::network::TcpConnection> conn_;
    std::weak_ptr<HttpSession> session_;
    bool closeConnection_;
    std::shared_ptr<bool> written_;
};

// HTTP/1.x server with asynchronous handlers. While a response is pending,
// pipelined requests on that connection wait in the input buffer.
class HttpServer : apisim::common::noncopyable {
public:
    using HttpCallback = std::function<void(const HttpRequest&, const ResponseWriter&)>;

    HttpServer(apisim::network::EventLoop* loop,
               const apisim::network::InetAddress& listenAddr,
               const std::string& name);

    apisim::network::EventLoop* getLoop() const { return server_.getLoop(); }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }

    bool start();

private:
    friend class ResponseWriter;

    void onConnection(const apisim::network::TcpConnectionPtr& conn);
    void onMessage(const apisim::network::TcpConnectionPtr& conn,
                   apisim::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    static void processInput(const apisim::network::TcpConnectionPtr& conn,
                             const std::shared_ptr<HttpSession>& session);

    apisim::network::TcpServer server_;
    HttpCallback httpCallback_;
};

} // namespace protocol
} // namespace apisim
