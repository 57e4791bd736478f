#include <catch2/catch_test_macros.hpp>
#include "services/ServiceRegistry.hpp"
#include "core/Errors.hpp"

using namespace weft;
using namespace weft::services;
using workflow::NodeKind;

namespace {

/**
 * Replacement advanced service answering a constant
 */
class ConstantService : public NodeService {
public:
    ConstantService()
        : NodeService(NodeKind::Advanced, MetadataSchema().withCommonFields()) {}

    json plan(const json&, const json&, const json&) const override {
        return {{"constant", "number"}};
    }

    json execute(const NodeInput&, const json&, const ExecutionEnv&) const override {
        return {{"constant", 1}};
    }
};

} // anonymous namespace

TEST_CASE("Node kinds round-trip through their wire names", "[ServiceRegistry][Types]") {
    REQUIRE(workflow::allNodeKinds().size() == 15);
    for (NodeKind kind : workflow::allNodeKinds()) {
        REQUIRE(workflow::parseNodeKind(workflow::toString(kind)) == kind);
    }
    REQUIRE(workflow::toString(NodeKind::GetApi) == "get_api");
    REQUIRE(workflow::toString(NodeKind::VectorQuery) == "vector_query");
    REQUIRE_FALSE(workflow::parseNodeKind("webhook").has_value());
}

TEST_CASE("Node kinds belong to a category", "[ServiceRegistry][Types]") {
    REQUIRE(workflow::nodeCategory(NodeKind::Job) == "ai");
    REQUIRE(workflow::nodeCategory(NodeKind::Embed) == "ai");
    REQUIRE(workflow::nodeCategory(NodeKind::Guru) == "resources");
    REQUIRE(workflow::nodeCategory(NodeKind::PostApi) == "resources");
    REQUIRE(workflow::nodeCategory(NodeKind::Merge) == "actions");
    REQUIRE(workflow::nodeCategory(NodeKind::Workflow) == "actions");
}

TEST_CASE("Empty registry has no services", "[ServiceRegistry]") {
    ServiceRegistry registry;

    REQUIRE_FALSE(registry.has(NodeKind::Job));
    REQUIRE(registry.describe().empty());
    REQUIRE_THROWS_AS(registry.get(NodeKind::Job), ConfigurationError);
}

TEST_CASE("Builtin registry covers every kind", "[ServiceRegistry]") {
    auto registry = ServiceRegistry::withBuiltins();

    for (NodeKind kind : workflow::allNodeKinds()) {
        REQUIRE(registry->has(kind));
        REQUIRE(registry->get(kind).kind() == kind);
    }
    REQUIRE(&ServiceRegistry::instance().get(NodeKind::Filter) ==
            &ServiceRegistry::instance().get(NodeKind::Filter));
}

TEST_CASE("Registry describes its services", "[ServiceRegistry]") {
    json described = ServiceRegistry::instance().describe();

    REQUIRE(described.size() == 15);
    REQUIRE(described[0]["type"] == "job");
    REQUIRE(described[0]["category"] == "ai");
    REQUIRE(described[0]["metadata"]["required"] == json::array({"prompt", "model_name"}));
}

TEST_CASE("Services can be replaced per kind", "[ServiceRegistry]") {
    auto registry = ServiceRegistry::withBuiltins();
    registry->registerService(std::make_unique<ConstantService>());

    const auto& service = registry->get(NodeKind::Advanced);
    REQUIRE(service.plan(json::object(), json::object(), json::object()) ==
            json{{"constant", "number"}});
    REQUIRE_NOTHROW(service.validate(json::object(), json::object()));

    REQUIRE_THROWS_AS(registry->registerService(nullptr), ConfigurationError);
}
