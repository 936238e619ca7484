#pragma once

#include "apisim/protocol/HttpRequest.h"

#include <chrono>
#include <cstddef>

namespace apisim {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x request parser. Consumes exactly one request from the
// buffer; bytes of a following pipelined request are left in place.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    HttpContext()
        : state_(kExpectRequestLine) {}

    // return false if some error
    bool parseRequest(apisim::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }
    std::chrono::system_clock::time_point receiveTime() const { return receiveTime_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool beginBody();
    bool parseChunked(apisim::network::Buffer* buf, bool* needMore);

    HttpRequestParseState state_;
    HttpRequest request_;
    std::chrono::system_clock::time_point receiveTime_;
    size_t headerBytes_{0};

    // Body parsing state
    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkRemaining_{0};
    bool expectingChunkSize_{true};
    bool inTrailers_{false};
};

} // namespace protocol
} // namespace apisim
