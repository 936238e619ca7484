#pragma once

#include <string>

namespace apisim {
namespace protocol {
class HttpRequest;
}

namespace monitor {

// Gate in front of every authenticated route. Carriers are checked in order:
//   Authorization              accepted whenever non-empty (trust delegated upstream)
//   api-key                    must equal the shared secret
//   ocp-apim-subscription-key  must equal the shared secret
class CredentialValidator {
public:
    enum class Carrier {
        kNone,
        kBearer,
        kApiKey,
        kSubscriptionKey,
    };

    static constexpr const char* kAuthorizationHeader = "Authorization";
    static constexpr const char* kApiKeyHeader = "api-key";
    static constexpr const char* kSubscriptionKeyHeader = "ocp-apim-subscription-key";

    explicit CredentialValidator(std::string secret);

    // kNone means rejected.
    Carrier Validate(const apisim::protocol::HttpRequest& req) const;

    // Constant-time for equal lengths. Different lengths never match.
    static bool SecretEquals(const std::string& presented, const std::string& secret);
    static const char* CarrierName(Carrier carrier);

private:
    std::string secret_;
};

} // namespace monitor
} // namespace apisim
