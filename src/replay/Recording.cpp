#include "apisim/replay/Recording.h"
#include "apisim/RequestContext.h"
#include "apisim/protocol/HttpRequest.h"

#include <openssl/evp.h>

#include <cstdio>
#include <utility>
#include <stdexcept>

namespace apisim {
namespace replay {

using apisim::protocol::HttpResponse;

namespace {

void PutField(std::string* out, const char* name, const std::string& value) {
    out->append(name);
    out->push_back(' ');
    out->append(std::to_string(value.size()));
    out->push_back('\n');
    out->append(value);
    out->push_back('\n');
}

// Reads one field at *pos. False at end of data or on malformed input.
bool GetField(const std::string& data, size_t* pos, std::string* name, std::string* value) {
    const size_t eol = data.find('\n', *pos);
    if (eol == std::string::npos) return false;
    const size_t sp = data.find(' ', *pos);
    if (sp == std::string::npos || sp > eol) return false;
    *name = data.substr(*pos, sp - *pos);

    size_t len = 0;
    try {
        len = static_cast<size_t>(std::stoull(data.substr(sp + 1, eol - sp - 1)));
    } catch (const std::logic_error&) {
        return false;
    }
    const size_t start = eol + 1;
    if (len > data.size() || start + len >= data.size()) return false;
    if (data[start + len] != '\n') return false;
    *value = data.substr(start, len);
    *pos = start + len + 1;
    return true;
}

bool ToLong(const std::string& s, long* out) {
    try {
        size_t used = 0;
        *out = std::stol(s, &used);
        return used == s.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ToDouble(const std::string& s, double* out) {
    try {
        size_t used = 0;
        *out = std::stod(s, &used);
        return used == s.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

} // namespace

HttpResponse Recording::toResponse() const {
    HttpResponse resp(status, body);
    for (const auto& kv : headers) resp.setHeader(kv.first, kv.second);
    return resp;
}

void Recording::applyTo(RequestContext& ctx) const {
    ctx.limiterKey = limiterKey;
    ctx.deploymentName = deploymentName;
    ctx.tokenCount = tokenCount;
    ctx.recordedDurationMs = durationMs;
}

std::string Recording::Digest(const std::string& method, const std::string& target, const std::string& body) {
    EVP_MD_CTX* md = EVP_MD_CTX_new();
    if (md == nullptr) throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    const bool ok = EVP_DigestInit_ex(md, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(md, method.data(), method.size()) == 1 &&
                    EVP_DigestUpdate(md, "\n", 1) == 1 &&
                    EVP_DigestUpdate(md, target.data(), target.size()) == 1 &&
                    EVP_DigestUpdate(md, "\n", 1) == 1 &&
                    EVP_DigestUpdate(md, body.data(), body.size()) == 1 &&
                    EVP_DigestFinal_ex(md, hash, &hashLen) == 1;
    EVP_MD_CTX_free(md);
    if (!ok) throw std::runtime_error("SHA-256 digest failed");

    std::string hex;
    hex.reserve(hashLen * 2);
    char buf[3];
    for (unsigned int i = 0; i < hashLen; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", hash[i]);
        hex.append(buf, 2);
    }
    return hex;
}

std::string Recording::Digest(const apisim::protocol::HttpRequest& req) {
    return Digest(req.method(), req.target(), req.body());
}

std::string Recording::Serialize(const std::vector<Recording>& recordings) {
    std::string out;
    for (const auto& r : recordings) {
        PutField(&out, "begin", "");
        PutField(&out, "method", r.method);
        PutField(&out, "target", r.target);
        PutField(&out, "digest", r.requestDigest);
        PutField(&out, "status", std::to_string(r.status));
        PutField(&out, "duration_ms", std::to_string(r.durationMs));
        for (const auto& kv : r.headers) {
            PutField(&out, "header", kv.first + ": " + kv.second);
        }
        PutField(&out, "body", r.body);
        if (r.limiterKey) PutField(&out, "limiter", *r.limiterKey);
        if (r.deploymentName) PutField(&out, "deployment", *r.deploymentName);
        if (r.tokenCount) PutField(&out, "tokens", std::to_string(*r.tokenCount));
        PutField(&out, "end", "");
    }
    return out;
}

bool Recording::Parse(const std::string& data, std::vector<Recording>* out) {
    size_t pos = 0;
    std::string name;
    std::string value;
    while (pos < data.size()) {
        if (!GetField(data, &pos, &name, &value) || name != "begin") return false;

        Recording r;
        bool closed = false;
        while (!closed) {
            if (!GetField(data, &pos, &name, &value)) return false;
            if (name == "end") {
                closed = true;
            } else if (name == "method") {
                r.method = value;
            } else if (name == "target") {
                r.target = value;
            } else if (name == "digest") {
                r.requestDigest = value;
            } else if (name == "status") {
                long status = 0;
                if (!ToLong(value, &status)) return false;
                r.status = static_cast<int>(status);
            } else if (name == "duration_ms") {
                if (!ToDouble(value, &r.durationMs)) return false;
            } else if (name == "header") {
                const size_t colon = value.find(": ");
                if (colon == std::string::npos) return false;
                r.headers[value.substr(0, colon)] = value.substr(colon + 2);
            } else if (name == "body") {
                r.body = value;
            } else if (name == "limiter") {
                r.limiterKey = value;
            } else if (name == "deployment") {
                r.deploymentName = value;
            } else if (name == "tokens") {
                long tokens = 0;
                if (!ToLong(value, &tokens)) return false;
                r.tokenCount = tokens;
            }
            // Unknown fields are skipped.
        }
        if (r.requestDigest.empty()) return false;
        out->push_back(std::move(r));
    }
    return true;
}

} // namespace replay
} // namespace apisim
