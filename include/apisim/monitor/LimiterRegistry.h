#pragma once

#include "apisim/common/noncopyable.h"
#include "apisim/monitor/Limiter.h"

#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace apisim {
namespace common {
struct SimulatorConfig;
}

namespace monitor {

// Resource key -> limiter. Populated once at startup, read-only afterwards.
class LimiterRegistry : apisim::common::noncopyable {
public:
    static constexpr const char* kOpenAi = "openai";
    static constexpr const char* kDocIntelligence = "docintelligence";

    LimiterRegistry() = default;

    // Registers "openai" from the deployment quotas and "docintelligence"
    // from the configured rps (skipped when rps <= 0).
    static std::unique_ptr<LimiterRegistry> FromConfig(const apisim::common::SimulatorConfig& cfg);

    void Register(const std::string& key, std::unique_ptr<Limiter> limiter);
    Limiter* Find(const std::string& key) const;
    size_t size() const { return limiters_.size(); }

    // Looks up the limiter named by ctx.limiterKey and runs it. No key or no
    // registered limiter means pass-through.
    std::optional<apisim::protocol::HttpResponse> Apply(const RequestContext& ctx,
                                                        const apisim::protocol::HttpResponse& response) const;

private:
    std::map<std::string, std::unique_ptr<Limiter>> limiters_;
};

} // namespace monitor
} // namespace apisim
