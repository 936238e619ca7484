#include "apisim/monitor/CredentialValidator.h"
#include "apisim/common/Logger.h"
#include "apisim/protocol/HttpRequest.h"

#include <cassert>

using apisim::common::Logger;
using apisim::monitor::CredentialValidator;
using apisim::protocol::HttpRequest;

static HttpRequest makeRequest() {
    HttpRequest req;
    req.setMethod("POST");
    req.setPath("/openai/deployments/gpt-4/chat/completions");
    return req;
}

static void testNoCarrierRejected() {
    CredentialValidator v("secret-key");
    assert(v.Validate(makeRequest()) == CredentialValidator::Carrier::kNone);
}

static void testBearerAcceptedWithoutValidation() {
    CredentialValidator v("secret-key");
    HttpRequest req = makeRequest();
    req.setHeader("Authorization", "Bearer anything-at-all");
    assert(v.Validate(req) == CredentialValidator::Carrier::kBearer);

    // Bearer wins even when another carrier holds a wrong key.
    req.setHeader("api-key", "wrong");
    assert(v.Validate(req) == CredentialValidator::Carrier::kBearer);
}

static void testApiKey() {
    CredentialValidator v("secret-key");
    HttpRequest req = makeRequest();
    req.setHeader("api-key", "secret-key");
    assert(v.Validate(req) == CredentialValidator::Carrier::kApiKey);

    req.setHeader("api-key", "secret-kez");
    assert(v.Validate(req) == CredentialValidator::Carrier::kNone);

    req.setHeader("api-key", "secret");
    assert(v.Validate(req) == CredentialValidator::Carrier::kNone);
}

static void testSubscriptionKey() {
    CredentialValidator v("secret-key");
    HttpRequest req = makeRequest();
    req.setHeader("Ocp-Apim-Subscription-Key", "secret-key");
    assert(v.Validate(req) == CredentialValidator::Carrier::kSubscriptionKey);

    // A wrong primary key does not block a correct secondary one.
    req.setHeader("api-key", "wrong");
    assert(v.Validate(req) == CredentialValidator::Carrier::kSubscriptionKey);
}

static void testHeaderNamesIgnoreCase() {
    CredentialValidator v("k");
    HttpRequest req = makeRequest();
    req.setHeader("API-KEY", "k");
    assert(v.Validate(req) == CredentialValidator::Carrier::kApiKey);
}

static void testSecretEquals() {
    assert(CredentialValidator::SecretEquals("abc", "abc"));
    assert(!CredentialValidator::SecretEquals("abc", "abd"));
    assert(!CredentialValidator::SecretEquals("abc", "abcd"));
    assert(!CredentialValidator::SecretEquals("", ""));
}

int main() {
    Logger::Instance().SetLevel(apisim::common::LogLevel::ERROR);
    testNoCarrierRejected();
    testBearerAcceptedWithoutValidation();
    testApiKey();
    testSubscriptionKey();
    testHeaderNamesIgnoreCase();
    testSecretEquals();
    return 0;
}
