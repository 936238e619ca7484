#include "apisim/protocol/HttpRequest.h"

#include <cctype>
#include <cstring>

namespace apisim {
namespace protocol {

namespace {

bool IsTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    return std::strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

} // namespace

bool HttpRequest::iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool HttpRequest::setMethod(const char* start, const char* end) {
    if (start == end) return false;
    for (const char* p = start; p != end; ++p) {
        if (!IsTokenChar(*p)) return false;
    }
    method_.assign(start, end);
    return true;
}

void HttpRequest::addHeader(const char* start, const char* colon, const char* end) {
    std::string field(start, colon);
    ++colon;
    while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
        ++colon;
    }
    std::string value(colon, end);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    setHeader(field, value);
}

std::map<std::string, std::string>::const_iterator HttpRequest::findHeader(const std::string& field) const {
    auto exact = headers_.find(field);
    if (exact != headers_.end()) return exact;
    for (auto it = headers_.begin(); it != headers_.end(); ++it) {
        if (iequals(it->first, field)) return it;
    }
    return headers_.end();
}

std::string HttpRequest::getHeader(const std::string& field) const {
    auto it = findHeader(field);
    return it == headers_.end() ? std::string() : it->second;
}

bool HttpRequest::hasHeader(const std::string& field) const {
    return findHeader(field) != headers_.end();
}

void HttpRequest::setHeader(const std::string& field, const std::string& value) {
    removeHeader(field);
    headers_[field] = value;
}

void HttpRequest::removeHeader(const std::string& field) {
    for (auto it = headers_.begin(); it != headers_.end();) {
        if (iequals(it->first, field)) {
            it = headers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string HttpRequest::toWire() const {
    std::string out;
    out.reserve(256 + body_.size());
    out += method_;
    out += ' ';
    out += target();
    out += " HTTP/1.1\r\n";
    for (const auto& h : headers_) {
        if (iequals(h.first, "Content-Length") || iequals(h.first, "Transfer-Encoding")) continue;
        out += h.first;
        out += ": ";
        out += h.second;
        out += "\r\n";
    }
    if (!body_.empty() || method_ == "POST" || method_ == "PUT" || method_ == "PATCH") {
        out += "Content-Length: ";
        out += std::to_string(body_.size());
        out += "\r\n";
    }
    out += "\r\n";
    out += body_;
    return out;
}

void HttpRequest::swap(HttpRequest& that) {
    method_.swap(that.method_);
    std::swap(version_, that.version_);
    path_.swap(that.path_);
    query_.swap(that.query_);
    headers_.swap(that.headers_);
    body_.swap(that.body_);
}

} // namespace protocol
} // namespace apisim
