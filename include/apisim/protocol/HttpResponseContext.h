#pragma once

#include "apisim/protocol/HttpResponse.h"

#include <cstddef>
#include <string>

namespace apisim {
namespace protocol {

// Incremental HTTP/1.x response parser used on the upstream side.
// - Supports Content-Length and Transfer-Encoding: chunked (body is de-chunked).
// - Without either, the body runs until the peer closes; call finishOnClose().
class HttpResponseContext {
public:
    enum ParseState { kExpectHeaders, kExpectBody, kGotAll, kError };

    // Returns true once a complete response has been parsed.
    bool feed(const char* data, size_t len);
    // Peer closed the connection. Completes a read-until-close body.
    bool finishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    void reset();

    // Valid once gotAll(). Framing headers are dropped from the result.
    const HttpResponse& response() const { return response_; }

private:
    bool parseHeaderBlock(const std::string& block);
    void consumeBody();
    void consumeChunked();
    void fail() { state_ = kError; }

    ParseState state_{kExpectHeaders};
    std::string pending_;
    HttpResponse response_;

    bool chunked_{false};
    bool untilClose_{false};
    size_t bodyRemaining_{0};
    size_t chunkRemaining_{0};
    bool expectingChunkSize_{true};
    bool inTrailers_{false};
};

} // namespace protocol
} // namespace apisim
