#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace apisim {
namespace common {

class Config;

enum class SimulatorMode {
    kGenerate,
    kRecord,
    kReplay
};

std::optional<SimulatorMode> ParseMode(const std::string& name);
const char* ModeName(SimulatorMode mode);

struct OpenAiDeployment {
    std::string name;
    std::string model;
    int tokensPerMinute{0};
};

enum class ForwarderKind {
    kOpenAi,
    kDocIntelligence
};

struct ForwarderConfig {
    std::string name;
    std::string pathPrefix;
    std::string host;
    uint16_t port{80};
    std::string apiKey;
    ForwarderKind kind{ForwarderKind::kOpenAi};
    int timeoutMs{30000};
};

struct RecordingOptions {
    std::string dir{".recording"};
    bool autosave{false};
    bool compress{false};
};

// Milliseconds used to derive the recorded-duration hint for generated responses.
// Zero disables the hint for that operation.
struct LatencyOptions {
    double chatCompletionsMsPerToken{0.0};
    double completionsMsPerToken{0.0};
    double embeddingsMs{0.0};
    double docIntelligenceMs{0.0};
};

// Typed, read-only view of the process configuration. Built once at startup.
struct SimulatorConfig {
    SimulatorMode mode{SimulatorMode::kGenerate};
    std::string apiKey;
    uint16_t listenPort{8000};
    std::string logLevel{"INFO"};
    std::string ioModel{"epoll"};

    std::map<std::string, OpenAiDeployment> deployments;
    int docIntelligenceRps{15};
    RecordingOptions recording;
    std::vector<ForwarderConfig> forwarders;
    int defaultMaxTokens{16};
    LatencyOptions latency;

    const OpenAiDeployment* FindDeployment(const std::string& name) const;

    // Reads the INI store plus SIMULATOR_MODE, SIMULATOR_API_KEY and RECORDING_DIR.
    // Returns nullopt (after logging) on an invalid mode or forwarder definition.
    static std::optional<SimulatorConfig> FromIni(const Config& ini);
};

// 32 hex characters from the OpenSSL CSPRNG. Empty on RNG failure.
std::string GenerateApiKey();

} // namespace common
} // namespace apisim
