#pragma once

#include "apisim/protocol/HttpResponse.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace apisim {

struct RequestContext;

namespace protocol {
class HttpRequest;
}

namespace replay {

// One recorded exchange plus the request facts observed when it was recorded.
struct Recording {
    std::string method;
    std::string target;        // path plus "?query"
    std::string requestDigest; // hex SHA-256 of method, target and body

    int status{200};
    std::map<std::string, std::string> headers;
    std::string body;
    double durationMs{0.0};

    std::optional<std::string> limiterKey;
    std::optional<std::string> deploymentName;
    std::optional<long> tokenCount;

    apisim::protocol::HttpResponse toResponse() const;
    // Copies the recorded facts and duration into ctx.
    void applyTo(RequestContext& ctx) const;

    static std::string Digest(const std::string& method, const std::string& target, const std::string& body);
    static std::string Digest(const apisim::protocol::HttpRequest& req);

    // Length-prefixed text: each field is "<name> <length>\n<bytes>\n",
    // records are bracketed by "begin 0" and "end 0".
    static std::string Serialize(const std::vector<Recording>& recordings);
    // False on a truncated or malformed stream; *out keeps the records read so far.
    static bool Parse(const std::string& data, std::vector<Recording>* out);
};

} // namespace replay
} // namespace apisim
