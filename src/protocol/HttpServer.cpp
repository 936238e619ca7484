#include "apisim/protocol/HttpServer.h"
#include "apisim/protocol/HttpContext.h"
#include "apisim/protocol/HttpRequest.h"
#include "apisim/network/Buffer.h"
#include "apisim/network/EventLoop.h"
#include "apisim/common/Logger.h"

namespace apisim {
namespace protocol {

using apisim::network::Buffer;
using apisim::network::TcpConnectionPtr;

struct HttpSession {
    HttpContext parser;
    HttpServer::HttpCallback* handler{nullptr};
    bool awaitingResponse{false};
    bool dispatching{false};
    bool closing{false};
};

namespace {

bool WantsClose(const HttpRequest& req) {
    const std::string connection = req.getHeader("Connection");
    if (HttpRequest::iequals(connection, "close")) return true;
    return req.getVersion() == HttpRequest::kHttp10 && !HttpRequest::iequals(connection, "keep-alive");
}

} // namespace

ResponseWriter::ResponseWriter(const TcpConnectionPtr& conn,
                               const std::shared_ptr<HttpSession>& session,
                               bool closeConnection)
    : conn_(conn),
      session_(session),
      closeConnection_(closeConnection),
      written_(std::make_shared<bool>(false)) {}

void ResponseWriter::Write(const HttpResponse& response) const {
    if (*written_) {
        LOG_WARN << "Response written twice, ignoring status " << response.statusCode();
        return;
    }
    *written_ = true;

    TcpConnectionPtr conn = conn_.lock();
    std::shared_ptr<HttpSession> session = session_.lock();
    if (!conn || !session || !conn->connected()) {
        LOG_DEBUG << "Client went away before response " << response.statusCode() << " was written";
        return;
    }

    Buffer buf;
    response.appendToBuffer(&buf, closeConnection_);
    conn->Send(buf.RetrieveAllAsString());

    session->awaitingResponse = false;
    if (closeConnection_) {
        session->closing = true;
        conn->Shutdown();
        return;
    }
    // A handler that answered synchronously returns into processInput,
    // which picks up the next pipelined request itself.
    if (!session->dispatching) {
        HttpServer::processInput(conn, session);
    }
}

HttpServer::HttpServer(apisim::network::EventLoop* loop,
                       const apisim::network::InetAddress& listenAddr,
                       const std::string& name)
    : server_(loop, listenAddr, name) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

bool HttpServer::start() {
    return server_.Start();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        auto session = std::make_shared<HttpSession>();
        session->handler = &httpCallback_;
        conn->SetContext(session);
    } else {
        conn->SetContext(std::any());
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    (void)buf;
    (void)receiveTime;
    auto* session = std::any_cast<std::shared_ptr<HttpSession>>(conn->GetMutableContext());
    if (!session || !*session) return;
    processInput(conn, *session);
}

void HttpServer::processInput(const TcpConnectionPtr& conn, const std::shared_ptr<HttpSession>& session) {
    Buffer* buf = conn->inputBuffer();
    while (!session->awaitingResponse && !session->closing && conn->connected()) {
        if (!session->parser.parseRequest(buf, std::chrono::system_clock::now())) {
            LOG_DEBUG << "Malformed request on " << conn->name();
            HttpResponse bad = HttpResponse::text(HttpResponse::k400BadRequest, "Bad Request");
            Buffer out;
            bad.appendToBuffer(&out, true);
            conn->Send(out.RetrieveAllAsString());
            session->closing = true;
            conn->Shutdown();
            return;
        }
        if (!session->parser.gotAll()) {
            return;
        }

        HttpRequest request;
        request.swap(session->parser.request());
        session->parser.reset();
        session->awaitingResponse = true;

        ResponseWriter writer(conn, session, WantsClose(request));
        session->dispatching = true;
        if (session->handler && *session->handler) {
            (*session->handler)(request, writer);
        } else {
            writer.Write(HttpResponse::text(HttpResponse::k404NotFound, "Not Found"));
        }
        session->dispatching = false;
    }
}

} // namespace protocol
} // namespace apisim
