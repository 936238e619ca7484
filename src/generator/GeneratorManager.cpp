#include "apisim/generator/GeneratorManager.h"
#include "apisim/RequestContext.h"
#include "apisim/common/Logger.h"
#include "apisim/generator/DocIntelligenceGenerator.h"
#include "apisim/generator/OpenAiGenerator.h"

namespace apisim {
namespace generator {

std::unique_ptr<GeneratorManager> GeneratorManager::CreateDefault() {
    auto manager = std::make_unique<GeneratorManager>();
    manager->Add(std::make_unique<OpenAiGenerator>());
    manager->Add(std::make_unique<DocIntelligenceGenerator>());
    return manager;
}

void GeneratorManager::Add(std::unique_ptr<Generator> generator) {
    generators_.push_back(std::move(generator));
}

std::optional<apisim::protocol::HttpResponse> GeneratorManager::Generate(RequestContext& ctx) {
    for (auto& g : generators_) {
        auto resp = g->Generate(ctx);
        if (resp) return resp;
    }
    LOG_DEBUG << "No generator matched " << ctx.request.method() << " " << ctx.request.path();
    return std::nullopt;
}

void GeneratorManager::Produce(const std::shared_ptr<RequestContext>& ctx, Callback done) {
    done(Generate(*ctx));
}

} // namespace generator
} // namespace apisim
