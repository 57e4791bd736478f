#include <catch2/catch_test_macros.hpp>
#include "runs/RunStream.hpp"
#include <thread>

using namespace weft;
using namespace weft::runs;
using namespace std::chrono_literals;

namespace {

/**
 * Sink recording everything it receives
 */
class RecordingSink : public RunStreamSink {
public:
    std::vector<std::string> received;
    size_t heartbeats = 0;
    size_t stopAfterEvents = 0;
    std::optional<RunSnapshot> done;
    std::string error;

    bool onEvent(const RunEvent& event) override {
        received.push_back(event.message);
        return stopAfterEvents == 0 || received.size() < stopAfterEvents;
    }

    bool onHeartbeat() override {
        ++heartbeats;
        return heartbeats < 100;
    }

    void onDone(const RunSnapshot& snapshot) override {
        done = snapshot;
    }

    void onError(const std::string& message) override {
        error = message;
    }
};

} // anonymous namespace

TEST_CASE("Stream delivers events then done", "[RunStream]") {
    RunRegistry registry;
    std::string id = registry.create("workflow");
    registry.append(id, RunEvent::make(EventLevel::Info, "node_start"));
    registry.append(id, RunEvent::make(EventLevel::Info, "node_output"));
    registry.finish(id, RunStatus::Succeeded, {{"ok", true}});

    RecordingSink sink;
    auto outcome = streamRun(registry, id, sink, 50ms);

    REQUIRE(outcome == StreamOutcome::Completed);
    REQUIRE(sink.received == std::vector<std::string>{"node_start", "node_output"});
    REQUIRE(sink.done.has_value());
    REQUIRE(sink.done->status == RunStatus::Succeeded);
    REQUIRE(sink.error.empty());
}

TEST_CASE("Stream sends heartbeats while the run is idle", "[RunStream]") {
    RunRegistry registry;
    std::string id = registry.create("workflow");

    std::thread producer([&] {
        std::this_thread::sleep_for(60ms);
        registry.append(id, RunEvent::make(EventLevel::Info, "node_start"));
        registry.finish(id, RunStatus::Succeeded);
    });

    RecordingSink sink;
    auto outcome = streamRun(registry, id, sink, 10ms);
    producer.join();

    REQUIRE(outcome == StreamOutcome::Completed);
    REQUIRE(sink.heartbeats >= 1);
    REQUIRE(sink.received == std::vector<std::string>{"node_start"});
}

TEST_CASE("Sink can stop the stream", "[RunStream]") {
    RunRegistry registry;
    std::string id = registry.create("workflow");
    registry.append(id, RunEvent::make(EventLevel::Info, "a"));
    registry.append(id, RunEvent::make(EventLevel::Info, "b"));

    RecordingSink sink;
    sink.stopAfterEvents = 1;
    auto outcome = streamRun(registry, id, sink, 10ms);

    REQUIRE(outcome == StreamOutcome::Stopped);
    REQUIRE(sink.received.size() == 1);
    REQUIRE_FALSE(sink.done.has_value());

    // The undelivered event stays for the next consumer
    REQUIRE(registry.popNext(id, 10ms).event->message == "b");
}

TEST_CASE("Unknown runs produce a single error", "[RunStream]") {
    RunRegistry registry;

    RecordingSink sink;
    auto outcome = streamRun(registry, "run_0000000000000000", sink, 10ms);

    REQUIRE(outcome == StreamOutcome::UnknownRun);
    REQUIRE(sink.error == "Run not found: run_0000000000000000");
    REQUIRE(sink.received.empty());
}
