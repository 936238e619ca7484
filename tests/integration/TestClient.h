#pragma once

// Blocking loopback client used by the integration tests.

#include "apisim/protocol/HttpResponse.h"
#include "apisim/protocol/HttpResponseContext.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cstdint>
#include <string>

namespace testclient {

inline sockaddr_in loopback(uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    return addr;
}

// Binds port 0 and reports what the kernel picked. Racy, but fine for tests.
inline uint16_t pickFreePort() {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr = loopback(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr) == 0);
    socklen_t len = sizeof addr;
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    ::close(fd);
    const uint16_t port = ntohs(addr.sin_port);
    assert(port != 0);
    return port;
}

inline int connectTo(uint16_t port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    const sockaddr_in addr = loopback(port);
    assert(::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof addr) == 0);
    return fd;
}

inline void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::send(fd, data.data() + off, data.size() - off, 0);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

// Reads until the peer closes. Each poll may wait up to timeoutMs.
inline std::string recvUntilClose(int fd, int timeoutMs = 5000) {
    std::string out;
    pollfd pfd{fd, POLLIN, 0};
    for (;;) {
        assert(::poll(&pfd, 1, timeoutMs) == 1);
        char buf[8192];
        const ssize_t n = ::recv(fd, buf, sizeof buf, 0);
        if (n <= 0) return out;
        out.append(buf, static_cast<size_t>(n));
    }
}

// One request on a fresh connection with Connection: close. extraHeaders
// holds complete "Name: value\r\n" lines.
inline apisim::protocol::HttpResponse roundTrip(uint16_t port,
                                                const std::string& method,
                                                const std::string& target,
                                                const std::string& extraHeaders,
                                                const std::string& body = "") {
    const int fd = connectTo(port);
    sendAll(fd, method + " " + target + " HTTP/1.1\r\n"
                "Host: 127.0.0.1:" + std::to_string(port) + "\r\n"
                "Connection: close\r\n" + extraHeaders +
                "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);

    apisim::protocol::HttpResponseContext parser;
    pollfd pfd{fd, POLLIN, 0};
    while (!parser.gotAll()) {
        assert(::poll(&pfd, 1, 5000) == 1);
        char buf[8192];
        const ssize_t n = ::recv(fd, buf, sizeof buf, 0);
        if (n <= 0) {
            parser.finishOnClose();
            break;
        }
        parser.feed(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    assert(parser.gotAll());
    return parser.response();
}

} // namespace testclient
