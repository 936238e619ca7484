#include "apisim/protocol/HttpResponse.h"
#include "apisim/protocol/HttpRequest.h"
#include "apisim/network/Buffer.h"

#include <cstdio>
#include <cstring>

namespace apisim {
namespace protocol {

HttpResponse HttpResponse::json(int statusCode, const std::string& body) {
    HttpResponse r(statusCode, body);
    r.setContentType("application/json");
    return r;
}

HttpResponse HttpResponse::text(int statusCode, const std::string& body) {
    HttpResponse r(statusCode, body);
    r.setContentType("text/plain; charset=utf-8");
    return r;
}

const char* HttpResponse::reasonPhrase(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

std::string HttpResponse::statusMessage() const {
    return statusMessage_.empty() ? reasonPhrase(statusCode_) : statusMessage_;
}

void HttpResponse::setHeader(const std::string& key, const std::string& value) {
    removeHeader(key);
    headers_[key] = value;
}

std::string HttpResponse::getHeader(const std::string& key) const {
    for (const auto& h : headers_) {
        if (HttpRequest::iequals(h.first, key)) return h.second;
    }
    return std::string();
}

bool HttpResponse::hasHeader(const std::string& key) const {
    for (const auto& h : headers_) {
        if (HttpRequest::iequals(h.first, key)) return true;
    }
    return false;
}

void HttpResponse::removeHeader(const std::string& key) {
    for (auto it = headers_.begin(); it != headers_.end();) {
        if (HttpRequest::iequals(it->first, key)) {
            it = headers_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpResponse::appendToBuffer(apisim::network::Buffer* output, bool closeConnection) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage());
    output->Append("\r\n");

    std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
    output->Append(buf, std::strlen(buf));
    output->Append(closeConnection ? "Connection: close\r\n" : "Connection: Keep-Alive\r\n");

    for (const auto& header : headers_) {
        if (HttpRequest::iequals(header.first, "Content-Length") ||
            HttpRequest::iequals(header.first, "Transfer-Encoding") ||
            HttpRequest::iequals(header.first, "Connection")) {
            continue;
        }
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    output->Append(body_);
}

} // namespace protocol
} // namespace apisim
