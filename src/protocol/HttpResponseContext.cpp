#include "apisim/protocol/HttpResponseContext.h"
#include "apisim/protocol/HttpRequest.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace apisim {
namespace protocol {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(b, e - b);
}

bool ContainsTokenCI(const std::string& v, const std::string& token) {
    std::string lv;
    lv.reserve(v.size());
    for (unsigned char c : v) lv.push_back(static_cast<char>(std::tolower(c)));
    return lv.find(token) != std::string::npos;
}

} // namespace

void HttpResponseContext::reset() {
    state_ = kExpectHeaders;
    pending_.clear();
    response_ = HttpResponse();
    chunked_ = false;
    untilClose_ = false;
    bodyRemaining_ = 0;
    chunkRemaining_ = 0;
    expectingChunkSize_ = true;
    inTrailers_ = false;
}

bool HttpResponseContext::parseHeaderBlock(const std::string& block) {
    size_t lineEnd = block.find("\r\n");
    const std::string statusLine = block.substr(0, lineEnd);

    // HTTP/1.1 200 OK
    if (statusLine.rfind("HTTP/1.", 0) != 0) return false;
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos) return false;
    const size_t sp2 = statusLine.find(' ', sp1 + 1);
    const std::string code = statusLine.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    char* endp = nullptr;
    long status = std::strtol(code.c_str(), &endp, 10);
    if (code.size() != 3 || *endp != '\0' || status < 100 || status > 599) return false;
    response_.setStatusCode(static_cast<int>(status));
    if (sp2 != std::string::npos) response_.setStatusMessage(statusLine.substr(sp2 + 1));

    std::string te;
    std::string cl;
    size_t pos = lineEnd + 2;
    while (pos < block.size()) {
        const size_t next = block.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = block.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        const std::string key = Trim(line.substr(0, colon));
        const std::string val = Trim(line.substr(colon + 1));
        if (HttpRequest::iequals(key, "Transfer-Encoding")) {
            te = val;
        } else if (HttpRequest::iequals(key, "Content-Length")) {
            cl = val;
        } else if (!HttpRequest::iequals(key, "Connection") && !HttpRequest::iequals(key, "Keep-Alive")) {
            response_.setHeader(key, val);
        }
    }

    chunked_ = ContainsTokenCI(te, "chunked");
    if (chunked_) {
        expectingChunkSize_ = true;
    } else if (!cl.empty()) {
        long long n = std::strtoll(cl.c_str(), &endp, 10);
        if (*endp != '\0' || n < 0) return false;
        bodyRemaining_ = static_cast<size_t>(n);
    } else if (status == 204 || status == 304 || status < 200) {
        bodyRemaining_ = 0;
    } else {
        untilClose_ = true;
    }
    return true;
}

void HttpResponseContext::consumeChunked() {
    std::string body = response_.body();
    size_t off = 0;
    while (state_ == kExpectBody) {
        if (expectingChunkSize_ || inTrailers_) {
            const size_t crlf = pending_.find("\r\n", off);
            if (crlf == std::string::npos) break;
            std::string line = pending_.substr(off, crlf - off);
            off = crlf + 2;
            if (inTrailers_) {
                if (line.empty()) state_ = kGotAll;
                continue;
            }
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = Trim(line);
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (line.empty() || *endp != '\0') {
                fail();
                return;
            }
            chunkRemaining_ = static_cast<size_t>(n);
            expectingChunkSize_ = false;
            if (chunkRemaining_ == 0) inTrailers_ = true;
            continue;
        }
        if (pending_.size() - off < chunkRemaining_ + 2) break;
        if (pending_.compare(off + chunkRemaining_, 2, "\r\n") != 0) {
            fail();
            return;
        }
        body.append(pending_, off, chunkRemaining_);
        off += chunkRemaining_ + 2;
        chunkRemaining_ = 0;
        expectingChunkSize_ = true;
    }
    pending_.erase(0, off);
    response_.setBody(body);
}

void HttpResponseContext::consumeBody() {
    if (chunked_) {
        consumeChunked();
        return;
    }
    if (untilClose_) {
        response_.setBody(response_.body() + pending_);
        pending_.clear();
        return;
    }
    const size_t take = std::min(bodyRemaining_, pending_.size());
    if (take > 0) {
        response_.setBody(response_.body() + pending_.substr(0, take));
        pending_.erase(0, take);
        bodyRemaining_ -= take;
    }
    if (bodyRemaining_ == 0) state_ = kGotAll;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError || state_ == kGotAll) return state_ == kGotAll;
    pending_.append(data, len);

    if (state_ == kExpectHeaders) {
        const size_t end = pending_.find("\r\n\r\n");
        if (end == std::string::npos) {
            if (pending_.size() > 64 * 1024) fail();
            return false;
        }
        const std::string block = pending_.substr(0, end + 4);
        pending_.erase(0, end + 4);
        if (!parseHeaderBlock(block)) {
            fail();
            return false;
        }
        state_ = kExpectBody;
    }

    if (state_ == kExpectBody) consumeBody();
    return state_ == kGotAll;
}

bool HttpResponseContext::finishOnClose() {
    if (state_ == kExpectBody && untilClose_) {
        state_ = kGotAll;
    } else if (state_ != kGotAll) {
        fail();
    }
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace apisim
