#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace apisim {
namespace protocol {

class HttpRequest {
public:
    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Any RFC 7230 token is accepted so the catch-all route sees every method.
    bool setMethod(const char* start, const char* end);
    void setMethod(const std::string& m) { method_ = m; }
    const std::string& method() const { return method_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    void setPath(const std::string& p) { path_ = p; }
    const std::string& path() const { return path_; }

    // Query string without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    void setQuery(const std::string& q) { query_ = q; }
    const std::string& query() const { return query_; }

    // path plus "?query" when a query is present.
    std::string target() const { return query_.empty() ? path_ : path_ + "?" + query_; }

    void addHeader(const char* start, const char* colon, const char* end);

    // Header lookups ignore case. Missing headers read as "".
    std::string getHeader(const std::string& field) const;
    bool hasHeader(const std::string& field) const;
    void setHeader(const std::string& field, const std::string& value);
    void removeHeader(const std::string& field);

    const std::map<std::string, std::string>& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    // HTTP/1.1 wire form with a Content-Length matching the body.
    std::string toWire() const;

    void swap(HttpRequest& that);

    static bool iequals(const std::string& a, const std::string& b);

private:
    std::map<std::string, std::string>::const_iterator findHeader(const std::string& field) const;

    std::string method_;
    Version version_;
    std::string path_;
    std::string query_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace apisim
