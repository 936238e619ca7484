#include "apisim/monitor/LimiterRegistry.h"
#include "apisim/RequestContext.h"
#include "apisim/common/Logger.h"
#include "apisim/common/SimulatorConfig.h"
#include "apisim/monitor/DocIntelligenceLimiter.h"
#include "apisim/monitor/OpenAiLimiter.h"

namespace apisim {
namespace monitor {

std::unique_ptr<LimiterRegistry> LimiterRegistry::FromConfig(const apisim::common::SimulatorConfig& cfg) {
    auto registry = std::make_unique<LimiterRegistry>();

    std::map<std::string, int> quotas;
    for (const auto& kv : cfg.deployments) {
        quotas[kv.first] = kv.second.tokensPerMinute;
        LOG_INFO << "OpenAI deployment " << kv.first << ": " << kv.second.tokensPerMinute
                 << " tokens/min, " << OpenAiLimiter::RequestsPerTenSeconds(kv.second.tokensPerMinute)
                 << " requests/10s";
    }
    registry->Register(kOpenAi, std::make_unique<OpenAiLimiter>(quotas));

    if (cfg.docIntelligenceRps > 0) {
        LOG_INFO << "Document intelligence: " << cfg.docIntelligenceRps << " requests/s";
        registry->Register(kDocIntelligence, std::make_unique<DocIntelligenceLimiter>(cfg.docIntelligenceRps));
    } else {
        LOG_WARN << "Document intelligence rps is " << cfg.docIntelligenceRps << ", limiter disabled";
    }
    return registry;
}

void LimiterRegistry::Register(const std::string& key, std::unique_ptr<Limiter> limiter) {
    limiters_[key] = std::move(limiter);
}

Limiter* LimiterRegistry::Find(const std::string& key) const {
    auto it = limiters_.find(key);
    return it == limiters_.end() ? nullptr : it->second.get();
}

std::optional<apisim::protocol::HttpResponse> LimiterRegistry::Apply(const RequestContext& ctx,
                                                                     const apisim::protocol::HttpResponse& response) const {
    Limiter* limiter = ctx.limiterKey ? Find(*ctx.limiterKey) : nullptr;
    if (limiter == nullptr) {
        LOG_DEBUG << "No limiter for " << ctx.request.path()
                  << (ctx.limiterKey ? " (key " + *ctx.limiterKey + ")" : std::string());
        return std::nullopt;
    }
    return limiter->Check(ctx, response);
}

} // namespace monitor
} // namespace apisim
