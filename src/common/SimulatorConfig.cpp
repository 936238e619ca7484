#include "apisim/common/SimulatorConfig.h"
#include "apisim/common/Config.h"
#include "apisim/common/Logger.h"

#include <openssl/rand.h>

#include <cstdlib>
#include <stdexcept>

namespace apisim {
namespace common {

namespace {

std::string EnvOr(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return fallback;
    return v;
}

int ToInt(const Config::Section& kv, const std::string& key, int defaultVal) {
    auto it = kv.find(key);
    if (it == kv.end() || it->second.empty()) return defaultVal;
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        return defaultVal;
    }
}

std::string ToString(const Config::Section& kv, const std::string& key, const std::string& defaultVal = "") {
    auto it = kv.find(key);
    return it == kv.end() ? defaultVal : it->second;
}

} // namespace

std::optional<SimulatorMode> ParseMode(const std::string& name) {
    if (name == "generate") return SimulatorMode::kGenerate;
    if (name == "record") return SimulatorMode::kRecord;
    if (name == "replay") return SimulatorMode::kReplay;
    return std::nullopt;
}

const char* ModeName(SimulatorMode mode) {
    switch (mode) {
        case SimulatorMode::kGenerate: return "generate";
        case SimulatorMode::kRecord: return "record";
        case SimulatorMode::kReplay: return "replay";
    }
    return "unknown";
}

std::string GenerateApiKey() {
    unsigned char raw[16];
    if (RAND_bytes(raw, sizeof(raw)) != 1) return "";
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(sizeof(raw) * 2);
    for (unsigned char c : raw) {
        out.push_back(kHex[c >> 4]);
        out.push_back(kHex[c & 0x0f]);
    }
    return out;
}

const OpenAiDeployment* SimulatorConfig::FindDeployment(const std::string& name) const {
    auto it = deployments.find(name);
    return it == deployments.end() ? nullptr : &it->second;
}

std::optional<SimulatorConfig> SimulatorConfig::FromIni(const Config& ini) {
    SimulatorConfig cfg;

    const std::string modeName = EnvOr("SIMULATOR_MODE", ini.GetString("global", "mode", "generate"));
    auto mode = ParseMode(modeName);
    if (!mode) {
        LOG_ERROR << "Invalid simulator mode '" << modeName << "' (expected generate, record or replay)";
        return std::nullopt;
    }
    cfg.mode = *mode;

    cfg.apiKey = EnvOr("SIMULATOR_API_KEY", ini.GetString("global", "api_key"));
    if (cfg.apiKey.empty()) {
        cfg.apiKey = GenerateApiKey();
        if (cfg.apiKey.empty()) {
            LOG_ERROR << "No api_key configured and key generation failed";
            return std::nullopt;
        }
        LOG_INFO << "No api_key configured, generated: " << cfg.apiKey;
    }

    int port = ini.GetInt("global", "listen_port", 8000);
    if (port <= 0 || port > 65535) {
        LOG_ERROR << "Invalid listen_port " << port;
        return std::nullopt;
    }
    cfg.listenPort = static_cast<uint16_t>(port);
    cfg.logLevel = ini.GetString("global", "log_level", "INFO");
    cfg.ioModel = ini.GetString("global", "io_model", "epoll");

    static const std::string kDeploymentPrefix = "openai_deployment:";
    for (const auto& sec : ini.GetSectionsWithPrefix(kDeploymentPrefix)) {
        OpenAiDeployment d;
        d.name = sec.first.substr(kDeploymentPrefix.size());
        if (d.name.empty()) continue;
        d.model = ToString(sec.second, "model", d.name);
        d.tokensPerMinute = ToInt(sec.second, "tokens_per_minute", 0);
        if (d.tokensPerMinute < 0) {
            LOG_WARN << "Deployment " << d.name << " has negative tokens_per_minute, using 0";
            d.tokensPerMinute = 0;
        }
        cfg.deployments[d.name] = d;
    }

    cfg.docIntelligenceRps = ini.GetInt("doc_intelligence", "rps", 15);

    cfg.recording.dir = EnvOr("RECORDING_DIR", ini.GetString("recording", "dir", ".recording"));
    cfg.recording.autosave = ini.GetBool("recording", "autosave", false);
    cfg.recording.compress = ini.GetBool("recording", "compress", false);

    static const std::string kForwarderPrefix = "forwarder:";
    for (const auto& sec : ini.GetSectionsWithPrefix(kForwarderPrefix)) {
        ForwarderConfig f;
        f.name = sec.first.substr(kForwarderPrefix.size());
        f.pathPrefix = ToString(sec.second, "path_prefix", "/");
        f.host = ToString(sec.second, "host");
        int fport = ToInt(sec.second, "port", 80);
        f.apiKey = ToString(sec.second, "api_key");
        f.timeoutMs = ToInt(sec.second, "timeout_ms", 30000);
        const std::string kind = ToString(sec.second, "kind", "openai");
        if (kind == "openai") {
            f.kind = ForwarderKind::kOpenAi;
        } else if (kind == "docintelligence") {
            f.kind = ForwarderKind::kDocIntelligence;
        } else {
            LOG_ERROR << "Forwarder " << f.name << " has unknown kind '" << kind << "'";
            return std::nullopt;
        }
        if (f.host.empty() || fport <= 0 || fport > 65535) {
            LOG_ERROR << "Forwarder " << f.name << " needs host and a valid port";
            return std::nullopt;
        }
        f.port = static_cast<uint16_t>(fport);
        cfg.forwarders.push_back(f);
    }

    cfg.defaultMaxTokens = ini.GetInt("generator", "default_max_tokens", 16);
    cfg.latency.chatCompletionsMsPerToken = ini.GetDouble("latency", "chat_completions_ms_per_token", 0.0);
    cfg.latency.completionsMsPerToken = ini.GetDouble("latency", "completions_ms_per_token", 0.0);
    cfg.latency.embeddingsMs = ini.GetDouble("latency", "embeddings_ms", 0.0);
    cfg.latency.docIntelligenceMs = ini.GetDouble("latency", "doc_intelligence_ms", 0.0);

    return cfg;
}

} // namespace common
} // namespace apisim
