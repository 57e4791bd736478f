#pragma once

#include "services/NodeService.hpp"
#include <array>
#include <memory>

namespace weft {
namespace services {

/**
 * Create the builtin service of a kind
 */
std::unique_ptr<NodeService> makeBuiltinService(NodeKind kind);

/**
 * Registry of node services, one per NodeKind
 *
 * Supports both singleton access (builtin services) and custom instances
 * for tests, where individual kinds can be replaced.
 *
 * Usage:
 *   const auto& svc = ServiceRegistry::instance().get(NodeKind::Filter);
 *   svc.validate(node.metadata, node.structuredOutput);
 */
class ServiceRegistry {
public:
    /**
     * Empty registry. Call registerBuiltins() or registerService().
     */
    ServiceRegistry() = default;

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /**
     * Global registry holding every builtin service
     */
    static ServiceRegistry& instance();

    /**
     * Registry holding every builtin service
     */
    static std::unique_ptr<ServiceRegistry> withBuiltins();

    // === Registration ===

    void registerBuiltins();

    /**
     * Register a service for its kind, replacing any existing one
     */
    void registerService(std::unique_ptr<NodeService> service);

    // === Lookup ===

    /**
     * Service for `kind`. Throws ConfigurationError if none is registered.
     */
    const NodeService& get(NodeKind kind) const;

    bool has(NodeKind kind) const;

    /**
     * [{"type", "category", "metadata": schema description}] for every
     * registered kind
     */
    json describe() const;

private:
    std::array<std::unique_ptr<NodeService>, workflow::kNodeKindCount> m_services;
};

} // namespace services
} // namespace weft
