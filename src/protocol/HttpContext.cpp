#include "apisim/protocol/HttpContext.h"
#include "apisim/network/Buffer.h"
#include "apisim/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace apisim {
namespace protocol {

namespace {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

} // namespace

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    headerBytes_ = 0;
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkRemaining_ = 0;
    expectingChunkSize_ = true;
    inTrailers_ = false;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space == end || !request_.setMethod(start, space)) return false;

    start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end || start == space) return false;

    const char* question = std::find(start, space, '?');
    request_.setPath(start, question);
    if (question != space) {
        request_.setQuery(question + 1, space);
    }

    start = space + 1;
    if (end - start != 8 || !std::equal(start, end - 1, "HTTP/1.")) return false;
    if (*(end - 1) == '1') {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (*(end - 1) == '0') {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::beginBody() {
    chunked_ = false;
    bodyRemaining_ = 0;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty() && ToLowerCopy(te).find("chunked") != std::string::npos) {
        chunked_ = true;
        expectingChunkSize_ = true;
        inTrailers_ = false;
        state_ = kExpectBody;
        return true;
    }

    const std::string cl = request_.getHeader("Content-Length");
    if (!cl.empty()) {
        char* endp = nullptr;
        long long v = std::strtoll(cl.c_str(), &endp, 10);
        if (endp == cl.c_str() || *endp != '\0' || v < 0) {
            return false;
        }
        bodyRemaining_ = static_cast<size_t>(v);
    }
    state_ = bodyRemaining_ > 0 ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::parseChunked(apisim::network::Buffer* buf, bool* needMore) {
    while (state_ == kExpectBody) {
        if (inTrailers_) {
            // Trailer lines are discarded; an empty line ends the message.
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                *needMore = true;
                return true;
            }
            const bool empty = crlf == buf->Peek();
            buf->RetrieveUntil(crlf + 2);
            if (empty) state_ = kGotAll;
            continue;
        }

        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                *needMore = true;
                return true;
            }
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);

            auto semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
            if (line.empty()) return false;

            char* endp = nullptr;
            unsigned long long sz = std::strtoull(line.c_str(), &endp, 16);
            if (endp == line.c_str() || *endp != '\0') return false;
            chunkRemaining_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
            if (chunkRemaining_ == 0) inTrailers_ = true;
            continue;
        }

        // chunk data followed by CRLF; wait until both are buffered
        if (buf->ReadableBytes() < chunkRemaining_ + 2) {
            *needMore = true;
            return true;
        }
        const char* tail = buf->Peek() + chunkRemaining_;
        if (tail[0] != '\r' || tail[1] != '\n') return false;
        request_.appendBody(buf->Peek(), chunkRemaining_);
        buf->Retrieve(chunkRemaining_ + 2);
        chunkRemaining_ = 0;
        expectingChunkSize_ = true;
    }
    return true;
}

// return false if any error
bool HttpContext::parseRequest(apisim::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    while (state_ != kGotAll) {
        if (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) {
                    LOG_WARN << "Request header block exceeds " << kMaxHeaderBytes << " bytes";
                    return false;
                }
                return true;
            }
            headerBytes_ += static_cast<size_t>(crlf + 2 - buf->Peek());
            if (headerBytes_ > kMaxHeaderBytes) return false;

            if (state_ == kExpectRequestLine) {
                if (!processRequestLine(buf->Peek(), crlf)) return false;
                receiveTime_ = receiveTime;
                buf->RetrieveUntil(crlf + 2);
                state_ = kExpectHeaders;
                continue;
            }

            if (crlf == buf->Peek()) {
                // empty line, end of headers
                buf->RetrieveUntil(crlf + 2);
                if (!beginBody()) return false;
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon == crlf) return false;
            request_.addHeader(buf->Peek(), colon, crlf);
            buf->RetrieveUntil(crlf + 2);
            continue;
        }

        // kExpectBody
        if (chunked_) {
            bool needMore = false;
            if (!parseChunked(buf, &needMore)) return false;
            if (needMore) return true;
            continue;
        }
        const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
        if (n == 0) return true;
        request_.appendBody(buf->Peek(), n);
        buf->Retrieve(n);
        bodyRemaining_ -= n;
        if (bodyRemaining_ == 0) state_ = kGotAll;
    }
    return true;
}

} // namespace protocol
} // namespace apisim
