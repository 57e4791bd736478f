#include "services/ServiceRegistry.hpp"
#include "services/ai/AiServices.hpp"
#include "services/resources/ResourceServices.hpp"
#include "services/actions/ActionServices.hpp"
#include "core/Errors.hpp"

namespace weft {
namespace services {

std::unique_ptr<NodeService> makeBuiltinService(NodeKind kind) {
    // Exhaustive over NodeKind, no default
    switch (kind) {
        case NodeKind::Job:         return std::make_unique<JobService>();
        case NodeKind::Embed:       return std::make_unique<EmbedService>();
        case NodeKind::Guru:        return std::make_unique<GuruService>();
        case NodeKind::GetApi:      return std::make_unique<GetApiService>();
        case NodeKind::PostApi:     return std::make_unique<PostApiService>();
        case NodeKind::VectorQuery: return std::make_unique<VectorQueryService>();
        case NodeKind::Filter:      return std::make_unique<FilterService>();
        case NodeKind::Map:         return std::make_unique<MapService>();
        case NodeKind::IfElse:      return std::make_unique<IfElseService>();
        case NodeKind::ForEach:     return std::make_unique<ForEachService>();
        case NodeKind::Merge:       return std::make_unique<MergeService>();
        case NodeKind::Split:       return std::make_unique<SplitService>();
        case NodeKind::Advanced:    return std::make_unique<AdvancedService>();
        case NodeKind::Return:      return std::make_unique<ReturnService>();
        case NodeKind::Workflow:    return std::make_unique<WorkflowCallService>();
    }
    throw ConfigurationError("No service available for node type " +
                             std::to_string(static_cast<int>(kind)));
}

ServiceRegistry& ServiceRegistry::instance() {
    static ServiceRegistry registry;
    static bool initialized = [] {
        registry.registerBuiltins();
        return true;
    }();
    (void)initialized;
    return registry;
}

std::unique_ptr<ServiceRegistry> ServiceRegistry::withBuiltins() {
    auto registry = std::make_unique<ServiceRegistry>();
    registry->registerBuiltins();
    return registry;
}

void ServiceRegistry::registerBuiltins() {
    for (NodeKind kind : workflow::allNodeKinds()) {
        registerService(makeBuiltinService(kind));
    }
}

void ServiceRegistry::registerService(std::unique_ptr<NodeService> service) {
    if (!service) {
        throw ConfigurationError("Cannot register a null node service");
    }
    auto slot = static_cast<size_t>(service->kind());
    m_services[slot] = std::move(service);
}

const NodeService& ServiceRegistry::get(NodeKind kind) const {
    const auto& service = m_services[static_cast<size_t>(kind)];
    if (!service) {
        throw ConfigurationError("No service registered for node type: " +
                                 workflow::toString(kind));
    }
    return *service;
}

bool ServiceRegistry::has(NodeKind kind) const {
    return m_services[static_cast<size_t>(kind)] != nullptr;
}

json ServiceRegistry::describe() const {
    json types = json::array();
    for (NodeKind kind : workflow::allNodeKinds()) {
        if (!has(kind)) continue;
        types.push_back({
            {"type", workflow::toString(kind)},
            {"category", workflow::nodeCategory(kind)},
            {"metadata", get(kind).schema().describe()}
        });
    }
    return types;
}

} // namespace services
} // namespace weft
