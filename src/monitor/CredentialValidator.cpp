#include "apisim/monitor/CredentialValidator.h"
#include "apisim/common/Logger.h"
#include "apisim/protocol/HttpRequest.h"

#include <openssl/crypto.h>

#include <utility>

namespace apisim {
namespace monitor {

CredentialValidator::CredentialValidator(std::string secret) : secret_(std::move(secret)) {}

bool CredentialValidator::SecretEquals(const std::string& presented, const std::string& secret) {
    if (presented.size() != secret.size()) return false;
    if (secret.empty()) return false;
    return CRYPTO_memcmp(presented.data(), secret.data(), secret.size()) == 0;
}

CredentialValidator::Carrier CredentialValidator::Validate(const apisim::protocol::HttpRequest& req) const {
    if (!req.getHeader(kAuthorizationHeader).empty()) {
        LOG_INFO << "Authorization carrier accepted for " << req.path();
        return Carrier::kBearer;
    }

    const std::string apiKey = req.getHeader(kApiKeyHeader);
    if (!apiKey.empty() && SecretEquals(apiKey, secret_)) {
        return Carrier::kApiKey;
    }

    const std::string subscriptionKey = req.getHeader(kSubscriptionKeyHeader);
    if (!subscriptionKey.empty() && SecretEquals(subscriptionKey, secret_)) {
        return Carrier::kSubscriptionKey;
    }

    LOG_WARN << "Missing or incorrect API key for " << req.method() << " " << req.path();
    return Carrier::kNone;
}

const char* CredentialValidator::CarrierName(Carrier carrier) {
    switch (carrier) {
        case Carrier::kNone: return "none";
        case Carrier::kBearer: return "authorization";
        case Carrier::kApiKey: return "api-key";
        case Carrier::kSubscriptionKey: return "ocp-apim-subscription-key";
    }
    return "unknown";
}

} // namespace monitor
} // namespace apisim
