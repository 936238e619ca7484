#pragma once

#include <map>
#include <string>
#include <utility>

namespace apisim {
namespace network {
class Buffer;
}

namespace protocol {

// Value type: status, headers, body. Stages replace responses rather than
// editing one that another stage already produced.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k202Accepted = 202,
        k400BadRequest = 400,
        k401Unauthorized = 401,
        k404NotFound = 404,
        k429TooManyRequests = 429,
        k500InternalServerError = 500,
        k502BadGateway = 502,
    };

    HttpResponse() : statusCode_(k200Ok) {}
    explicit HttpResponse(int statusCode, std::string body = std::string())
        : statusCode_(statusCode), body_(std::move(body)) {}

    static HttpResponse json(int statusCode, const std::string& body);
    static HttpResponse text(int statusCode, const std::string& body);

    int statusCode() const { return statusCode_; }
    void setStatusCode(int code) { statusCode_ = code; }
    bool isSuccess() const { return statusCode_ < 300; }

    // Defaults to the standard reason phrase for the status code.
    std::string statusMessage() const;
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }

    void setContentType(const std::string& contentType) { setHeader("Content-Type", contentType); }

    // Header lookups ignore case.
    void setHeader(const std::string& key, const std::string& value);
    std::string getHeader(const std::string& key) const;
    bool hasHeader(const std::string& key) const;
    void removeHeader(const std::string& key);
    const std::map<std::string, std::string>& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // Framing headers (Content-Length, Transfer-Encoding, Connection) are
    // always generated here; copies of them in headers() are skipped.
    void appendToBuffer(apisim::network::Buffer* output, bool closeConnection) const;

    static const char* reasonPhrase(int statusCode);

private:
    int statusCode_;
    std::string statusMessage_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace apisim
