#include <catch2/catch_test_macros.hpp>
#include "services/ServiceRegistry.hpp"
#include "services/resources/ResourceServices.hpp"
#include "expr/PromptRenderer.hpp"
#include "core/Errors.hpp"
#include "core/TimeUtil.hpp"
#include "TestSupport.hpp"

using namespace weft;
using namespace weft::services;
using namespace weft::testing;

namespace {

/**
 * Backends wired to fakes, plus an env pointing at them
 */
struct ServiceFixture {
    std::shared_ptr<FakeModelClient> model = std::make_shared<FakeModelClient>();
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<FakeVectorStore> vectors = std::make_shared<FakeVectorStore>();
    std::shared_ptr<FakeGuruClient> guru = std::make_shared<FakeGuruClient>();
    Backends backends{model, http, vectors, guru};
    ExecutionEnv env;

    ServiceFixture() {
        env.base = expr::makeBaseContext(parseIsoTimestamp("2024-05-01T10:30:00.000Z"));
        env.backends = &backends;
    }

    json run(NodeKind kind, const json& metadata, const json& data, int64_t nodeId = 3) {
        NodeInput input;
        input.nodeId = nodeId;
        input.data = data;
        return ServiceRegistry::instance().get(kind).execute(input, metadata, env);
    }
};

class RecordingRunner : public SubWorkflowRunner {
public:
    int64_t workflowId = 0;
    json input;
    bool propagate = false;

    json runWorkflow(int64_t id, const json& callInput, bool propagateIdentity) override {
        workflowId = id;
        input = callInput;
        propagate = propagateIdentity;
        return {{"answer", 42}};
    }
};

json orderItems() {
    return json::parse(R"([
        {"sku": "a", "kind": "tool", "price": 5, "keep": true},
        {"sku": "b", "kind": "book", "price": 12, "keep": false},
        {"sku": "c", "kind": "tool", "price": 30, "keep": true}
    ])");
}

} // anonymous namespace

// =============================================================================
// Actions
// =============================================================================

TEST_CASE("filter keeps matching items and the rest of the input", "[NodeServices][Filter]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Filter, {{"where", "item.keep = true"}},
                     {{"items", orderItems()}, {"customer", "Ada"}});

    REQUIRE(out["customer"] == "Ada");
    REQUIRE(out["items"].size() == 2);
    REQUIRE(out["items"][1]["sku"] == "c");
}

TEST_CASE("filter binds $item and $index", "[NodeServices][Filter]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Filter,
                     {{"where", "$item.price > 10 and $index > 0"},
                      {"items_selector", "input.orders"}},
                     {{"orders", orderItems()}});

    REQUIRE(out["items"].size() == 2);
    REQUIRE(out["items"][0]["sku"] == "b");
}

TEST_CASE("filter rejects non-array selections", "[NodeServices][Filter]") {
    ServiceFixture f;

    REQUIRE(f.run(NodeKind::Filter, filterMeta(), json::object())["items"] == json::array());
    REQUIRE_THROWS_AS(f.run(NodeKind::Filter, filterMeta(), {{"items", "nope"}}),
                      NodeExecutionError);
}

TEST_CASE("map evaluates expressions and keeps literals", "[NodeServices][Map]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Map,
                     mapMeta({{"total", "$sum(input.items.price)"},
                              {"label", "'Order for ' & input.customer"},
                              {"year", "base.year"},
                              {"version", 2},
                              {"draft", false}}),
                     {{"items", orderItems()}, {"customer", "Ada"}});

    REQUIRE(out == json{{"total", 47}, {"label", "Order for Ada"}, {"year", 2024},
                        {"version", 2}, {"draft", false}});
}

TEST_CASE("if_else records the branch taken", "[NodeServices][IfElse]") {
    ServiceFixture f;
    json meta = {{"predicate", "input.score >= 50"}};

    json high = f.run(NodeKind::IfElse, meta, {{"score", 80}});
    REQUIRE(high["condition_result"] == true);
    REQUIRE(high["branch_taken"] == "true");
    REQUIRE(high["score"] == 80);

    json low = f.run(NodeKind::IfElse, meta, {{"score", 10}});
    REQUIRE(low["branch_taken"] == "false");
}

TEST_CASE("for_each selects its items", "[NodeServices][ForEach]") {
    ServiceFixture f;
    json out = f.run(NodeKind::ForEach, {{"items_selector", "input.items[kind = 'tool']"}},
                     {{"items", orderItems()}});

    REQUIRE(out["items"].size() == 2);
}

TEST_CASE("merge strategies", "[NodeServices][Merge]") {
    ServiceFixture f;
    NodeInput input;
    input.nodeId = 9;
    // Edge order differs from topological order
    input.parents = {
        ParentOutput{4, 2, {{"x", "late"}, {"list", {3}}, {"a", nullptr}}},
        ParentOutput{2, 1, {{"x", "early"}, {"list", {1, 2}}, {"a", 1}}}
    };
    const auto& merge = ServiceRegistry::instance().get(NodeKind::Merge);

    SECTION("union follows topological order") {
        json out = merge.execute(input, json::object(), f.env);
        REQUIRE(out["x"] == "late");
        REQUIRE(out["list"] == json::array({3}));
        REQUIRE(out["a"].is_null());
    }

    SECTION("concat appends arrays") {
        json out = merge.execute(input, {{"strategy", "concat"}}, f.env);
        REQUIRE(out["list"] == json::array({1, 2, 3}));
        REQUIRE(out["x"] == "late");
    }

    SECTION("prefer_left keeps the first non-null value in edge order") {
        json out = merge.execute(input, {{"strategy", "prefer_left"}}, f.env);
        REQUIRE(out["x"] == "late");
        REQUIRE(out["a"] == 1);
    }

    SECTION("expected parent count is checked") {
        REQUIRE_THROWS_AS(merge.execute(input, {{"expected_parents", 3}}, f.env),
                          NodeExecutionError);
    }
}

TEST_CASE("split groups by key", "[NodeServices][Split]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Split, {{"by", "item.kind"}}, {{"items", orderItems()}});

    REQUIRE(out["groups"]["tool"].size() == 2);
    REQUIRE(out["groups"]["book"].size() == 1);
}

TEST_CASE("split into chunks", "[NodeServices][Split]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Split, {{"mode", "chunk"}, {"chunk_size", 2}},
                     {{"items", {1, 2, 3, 4, 5}}});

    REQUIRE(out["chunks"] == json::parse("[[1,2],[3,4],[5]]"));
}

TEST_CASE("advanced returns the expression result", "[NodeServices][Advanced]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Advanced, {{"expression", "$max(input.items.price) - 1"}},
                     {{"items", orderItems()}});

    REQUIRE(out == json{{"result", 29}});
}

TEST_CASE("return builds the response envelope", "[NodeServices][Return]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Return, {{"payload_selector", "input.customer"}},
                     {{"customer", "Ada"}});

    REQUIRE(out == json{{"payload", "Ada"}, {"status_code", 200},
                        {"content_type", "application/json"}});

    json custom = f.run(NodeKind::Return, {{"payload_selector", "'created'"},
                                           {"status_code", 201},
                                           {"content_type", "text/plain"}},
                        json::object());
    REQUIRE(custom["status_code"] == 201);
    REQUIRE(custom["content_type"] == "text/plain");
}

TEST_CASE("workflow call delegates to the runner", "[NodeServices][Workflow]") {
    ServiceFixture f;
    json meta = {{"workflow_id", 12}, {"input_mapping", {{"who", "input.customer"}}},
                 {"propagate_identity", false}};

    REQUIRE_THROWS_AS(f.run(NodeKind::Workflow, meta, {{"customer", "Ada"}}), NodeExecutionError);

    RecordingRunner runner;
    f.env.subWorkflows = &runner;
    json out = f.run(NodeKind::Workflow, meta, {{"customer", "Ada"}});

    REQUIRE(out == json{{"result", {{"answer", 42}}}});
    REQUIRE(runner.workflowId == 12);
    REQUIRE(runner.input == json{{"who", "Ada"}});
    REQUIRE_FALSE(runner.propagate);
}

TEST_CASE("workflow call passes the whole input without a mapping", "[NodeServices][Workflow]") {
    ServiceFixture f;
    RecordingRunner runner;
    f.env.subWorkflows = &runner;

    f.run(NodeKind::Workflow, {{"workflow_id", 5}}, {{"a", 1}});

    REQUIRE(runner.input == json{{"a", 1}});
    REQUIRE(runner.propagate);
}

// =============================================================================
// AI
// =============================================================================

TEST_CASE("job renders the prompt and returns text", "[NodeServices][Job]") {
    ServiceFixture f;
    json meta = jobMeta("Summarize {{ input.text }} on {{ base.date }}");
    meta["system"] = "You are {{ input.persona }}";
    meta["temperature"] = 0.2;
    meta["max_tokens"] = 64;

    json out = f.run(NodeKind::Job, meta, {{"text", "the news"}, {"persona", "terse"}});

    REQUIRE(out == json{{"text", "completion for Summarize the news on 2024-05-01"}});
    REQUIRE(f.model->requests.size() == 1);
    const auto& request = f.model->requests[0];
    REQUIRE(request.model == "test-model");
    REQUIRE(request.system == "You are terse");
    REQUIRE(request.temperature == 0.2);
    REQUIRE(request.maxTokens == 64);
    REQUIRE_FALSE(request.jsonOutput);
}

TEST_CASE("job with structured output parses the model reply", "[NodeServices][Job]") {
    ServiceFixture f;
    NodeInput input;
    input.nodeId = 1;
    input.data = {{"text", "t"}};
    input.structuredOutput = {{"summary", "string"}};
    const auto& job = ServiceRegistry::instance().get(NodeKind::Job);

    f.model->completions.push_back(R"({"summary": "short"})");
    REQUIRE(job.execute(input, jobMeta(), f.env) == json{{"summary", "short"}});
    REQUIRE(f.model->requests.back().jsonOutput);

    f.model->completions.push_back("not json at all");
    REQUIRE_THROWS_AS(job.execute(input, jobMeta(), f.env), NodeExecutionError);
}

TEST_CASE("job without a model client fails", "[NodeServices][Job]") {
    ServiceFixture f;
    f.backends.model.reset();

    REQUIRE_THROWS_AS(f.run(NodeKind::Job, jobMeta(), {{"text", "x"}}), NodeExecutionError);

    f.env.backends = nullptr;
    REQUIRE_THROWS_AS(f.run(NodeKind::Job, jobMeta(), {{"text", "x"}}), NodeExecutionError);
}

TEST_CASE("embed upserts one record per item", "[NodeServices][Embed]") {
    ServiceFixture f;
    json meta = {{"vector_store_id", "docs"}, {"input_selector", "input.docs"},
                 {"namespace", "team-1"}, {"metadata_map", {{"position", "$index"}}}};

    json out = f.run(NodeKind::Embed, meta, {{"docs", {"alpha", "beta"}}}, 7);

    REQUIRE(out == json{{"embedded", true}, {"count", 2}});
    REQUIRE(f.model->embedCalls.size() == 1);
    REQUIRE(f.vectors->lastStore == "docs");
    REQUIRE(f.vectors->lastNamespace == "team-1");
    REQUIRE(f.vectors->upserted.size() == 2);
    REQUIRE(f.vectors->upserted[0].id == "7-0");
    REQUIRE(f.vectors->upserted[1].text == "beta");
    REQUIRE(f.vectors->upserted[1].metadata["position"] == 1);
    REQUIRE(f.vectors->upserted[0].embedding.size() == 2);
}

TEST_CASE("embed with nothing selected does not call the backends", "[NodeServices][Embed]") {
    ServiceFixture f;
    json meta = {{"vector_store_id", "docs"}, {"input_selector", "input.missing"}};

    REQUIRE(f.run(NodeKind::Embed, meta, json::object()) == json{{"embedded", false}, {"count", 0}});
    REQUIRE(f.model->embedCalls.empty());
}

TEST_CASE("embed uses the id selector", "[NodeServices][Embed]") {
    ServiceFixture f;
    json meta = {{"vector_store_id", "docs"}, {"input_selector", "input.rows"},
                 {"id_selector", "item.sku"}, {"upsert", false}};

    json out = f.run(NodeKind::Embed, meta, {{"rows", orderItems()}});

    REQUIRE(out["count"] == 3);
    REQUIRE(f.vectors->upserted.empty());
}

// =============================================================================
// Resources
// =============================================================================

TEST_CASE("guru renders its query", "[NodeServices][Guru]") {
    ServiceFixture f;
    json out = f.run(NodeKind::Guru, {{"space", "kb"}, {"query_template", "how to {{ input.q }}"}},
                     {{"q", "deploy"}});

    REQUIRE(f.guru->lastSpace == "kb");
    REQUIRE(f.guru->lastQuery == "how to deploy");
    REQUIRE(f.guru->lastTopK == 5);
    REQUIRE(out["items"].size() == 1);
}

TEST_CASE("get_api renders url, headers and query", "[NodeServices][Http]") {
    ServiceFixture f;
    json meta = {{"url", "http://api.test/users/{{ input.id }}"},
                 {"headers", {{"Authorization", "Bearer {{ input.token }}"}}},
                 {"query_map", {{"expand", "'all'"}, {"skip", "input.none"}}}};

    json out = f.run(NodeKind::GetApi, meta, {{"id", 7}, {"token", "t0k"}});

    REQUIRE(out == json{{"status", 200}, {"body", {{"ok", true}}}});
    REQUIRE(f.http->requests.size() == 1);
    const auto& request = f.http->requests[0];
    REQUIRE(request.method == "GET");
    REQUIRE(request.url == "http://api.test/users/7");
    REQUIRE(request.headers.at("Authorization") == "Bearer t0k");
    REQUIRE(request.query.size() == 1);
    REQUIRE(request.query.at("expand") == "all");
}

TEST_CASE("HTTP errors and plain bodies", "[NodeServices][Http]") {
    ServiceFixture f;
    json meta = {{"url", "http://api.test/health"}};

    f.http->response = HttpResponse{200, "pong"};
    REQUIRE(f.run(NodeKind::GetApi, meta, json::object())["body"] == "pong");

    f.http->response = HttpResponse{503, "down"};
    REQUIRE_THROWS_AS(f.run(NodeKind::GetApi, meta, json::object()), NodeExecutionError);
}

TEST_CASE("post_api builds a JSON body", "[NodeServices][Http]") {
    ServiceFixture f;
    json meta = {{"url", "http://api.test/orders"},
                 {"body_map", {{"customer", "input.customer"},
                               {"totals", {{"sum", "$sum(input.items.price)"}}},
                               {"fixed", 3}}}};

    f.run(NodeKind::PostApi, meta, {{"customer", "Ada"}, {"items", orderItems()}});

    const auto& request = f.http->requests.at(0);
    REQUIRE(request.method == "POST");
    REQUIRE(request.contentType == "application/json");
    REQUIRE(json::parse(request.body) ==
            json{{"customer", "Ada"}, {"totals", {{"sum", 47}}}, {"fixed", 3}});
}

TEST_CASE("post_api form encoding", "[NodeServices][Http]") {
    ServiceFixture f;
    json meta = {{"url", "http://api.test/form"},
                 {"content_type", "application/x-www-form-urlencoded"},
                 {"body_map", {{"q", "'a b&c'"}, {"n", "1"}}}};

    f.run(NodeKind::PostApi, meta, json::object());

    REQUIRE(f.http->requests.at(0).body == "n=1&q=a%20b%26c");
    REQUIRE(urlEncode("x/y z") == "x%2Fy%20z");
}

TEST_CASE("vector_query returns the store results", "[NodeServices][VectorQuery]") {
    ServiceFixture f;
    json meta = {{"vector_store_id", "docs"}, {"query_template", "{{ input.q }}"}, {"top_k", 3}};

    json out = f.run(NodeKind::VectorQuery, meta, {{"q", "refunds"}});

    REQUIRE(f.vectors->lastQuery == "refunds");
    REQUIRE(f.vectors->lastTopK == 3);
    REQUIRE(out["results"][0]["id"] == "doc-1");
}

TEST_CASE("Error policy from metadata", "[NodeServices]") {
    REQUIRE(onErrorPolicy(json::object()) == OnError::Fail);
    REQUIRE(onErrorPolicy({{"on_error", "skip"}}) == OnError::Skip);
    REQUIRE(onErrorPolicy({{"on_error", "continue"}}) == OnError::Continue);
    REQUIRE(toString(OnError::Skip) == "skip");
}
