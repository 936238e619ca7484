#include "apisim/common/Config.h"
#include "apisim/common/Logger.h"
#include "apisim/common/SimulatorConfig.h"

#include <cassert>
#include <cstdlib>
#include <string>

using namespace apisim::common;

static const char* kIni = R"(
# comment
[global]
mode = record
api_key = sim-key
listen_port = 9100
log_level = DEBUG

[openai_deployment:gpt-35]
model = gpt-3.5-turbo
tokens_per_minute = 10000

[openai_deployment:embedding]
tokens_per_minute = -5

[doc_intelligence]
rps = 0

[recording]
dir = /tmp/recs
autosave = yes
compress = on

[forwarder:openai]
path_prefix = /openai/
host = example.openai.azure.com
port = 443
api_key = upstream
timeout_ms = 5000

[forwarder:doc]
path_prefix = /formrecognizer/
host = doc.example
kind = docintelligence

[generator]
default_max_tokens = 32

[latency]
chat_completions_ms_per_token = 12.5
embeddings_ms = 40
)";

static void clearEnv() {
    ::unsetenv("SIMULATOR_MODE");
    ::unsetenv("SIMULATOR_API_KEY");
    ::unsetenv("RECORDING_DIR");
}

static void testIniParsing() {
    Config& ini = Config::Instance();
    assert(ini.LoadFromString("top = 1\n[a]\n key =  spaced value  \n; note\nbroken line\n[b:x]\nk=v\n[b:y]\n"));
    assert(ini.GetInt("global", "top") == 1);
    assert(ini.GetString("a", "key") == "spaced value");
    assert(ini.GetString("a", "missing", "dflt") == "dflt");
    assert(ini.GetSectionsWithPrefix("b:").size() == 1);
    assert(!ini.HasSection("c"));
}

static void testFullConfig() {
    clearEnv();
    Config& ini = Config::Instance();
    assert(ini.LoadFromString(kIni));
    auto cfg = SimulatorConfig::FromIni(ini);
    assert(cfg);
    assert(cfg->mode == SimulatorMode::kRecord);
    assert(cfg->apiKey == "sim-key");
    assert(cfg->listenPort == 9100);
    assert(cfg->logLevel == "DEBUG");

    assert(cfg->deployments.size() == 2);
    const OpenAiDeployment* gpt = cfg->FindDeployment("gpt-35");
    assert(gpt && gpt->model == "gpt-3.5-turbo" && gpt->tokensPerMinute == 10000);
    const OpenAiDeployment* emb = cfg->FindDeployment("embedding");
    assert(emb && emb->model == "embedding" && emb->tokensPerMinute == 0);
    assert(!cfg->FindDeployment("nope"));

    assert(cfg->docIntelligenceRps == 0);
    assert(cfg->recording.dir == "/tmp/recs");
    assert(cfg->recording.autosave);
    assert(cfg->recording.compress);

    assert(cfg->forwarders.size() == 2);
    const ForwarderConfig* doc = nullptr;
    const ForwarderConfig* openai = nullptr;
    for (const auto& f : cfg->forwarders) {
        if (f.name == "doc") doc = &f;
        if (f.name == "openai") openai = &f;
    }
    assert(openai && openai->port == 443 && openai->apiKey == "upstream" && openai->timeoutMs == 5000);
    assert(openai->kind == ForwarderKind::kOpenAi);
    assert(doc && doc->port == 80 && doc->kind == ForwarderKind::kDocIntelligence);

    assert(cfg->defaultMaxTokens == 32);
    assert(cfg->latency.chatCompletionsMsPerToken == 12.5);
    assert(cfg->latency.embeddingsMs == 40.0);
    assert(cfg->latency.completionsMsPerToken == 0.0);
}

static void testDefaults() {
    clearEnv();
    Config& ini = Config::Instance();
    assert(ini.LoadFromString(""));
    auto cfg = SimulatorConfig::FromIni(ini);
    assert(cfg);
    assert(cfg->mode == SimulatorMode::kGenerate);
    assert(cfg->listenPort == 8000);
    assert(cfg->docIntelligenceRps == 15);
    assert(cfg->recording.dir == ".recording");
    assert(!cfg->recording.autosave);
    assert(cfg->deployments.empty());
    // A key is generated when none is configured.
    assert(cfg->apiKey.size() == 32);
    assert(cfg->apiKey.find_first_not_of("0123456789abcdef") == std::string::npos);
}

static void testEnvironmentOverrides() {
    clearEnv();
    ::setenv("SIMULATOR_MODE", "replay", 1);
    ::setenv("SIMULATOR_API_KEY", "from-env", 1);
    ::setenv("RECORDING_DIR", "/var/tmp/other", 1);
    Config& ini = Config::Instance();
    assert(ini.LoadFromString(kIni));
    auto cfg = SimulatorConfig::FromIni(ini);
    assert(cfg);
    assert(cfg->mode == SimulatorMode::kReplay);
    assert(cfg->apiKey == "from-env");
    assert(cfg->recording.dir == "/var/tmp/other");

    // Empty variables fall back to the file.
    ::setenv("SIMULATOR_MODE", "", 1);
    cfg = SimulatorConfig::FromIni(ini);
    assert(cfg && cfg->mode == SimulatorMode::kRecord);
    clearEnv();
}

static void testInvalidConfig() {
    clearEnv();
    Config& ini = Config::Instance();

    assert(ini.LoadFromString("[global]\nmode = simulate\n"));
    assert(!SimulatorConfig::FromIni(ini));

    assert(ini.LoadFromString("[global]\nlisten_port = 70000\n"));
    assert(!SimulatorConfig::FromIni(ini));

    assert(ini.LoadFromString("[forwarder:x]\nhost = h\nkind = ftp\n"));
    assert(!SimulatorConfig::FromIni(ini));

    assert(ini.LoadFromString("[forwarder:x]\npath_prefix = /openai/\n"));
    assert(!SimulatorConfig::FromIni(ini));
}

static void testModeNames() {
    assert(ParseMode("generate") == SimulatorMode::kGenerate);
    assert(!ParseMode("Generate"));
    assert(std::string(ModeName(SimulatorMode::kReplay)) == "replay");
}

int main() {
    Logger::Instance().SetLevel(LogLevel::FATAL);
    testIniParsing();
    testFullConfig();
    testDefaults();
    testEnvironmentOverrides();
    testInvalidConfig();
    testModeNames();
    return 0;
}
