#pragma once

#include "runs/RunRegistry.hpp"
#include <chrono>
#include <string>

namespace weft {
namespace runs {

/**
 * Receiver of a streamed run. onEvent and onHeartbeat return false to stop
 * the stream (e.g. the client went away); onDone and onError are terminal.
 */
class RunStreamSink {
public:
    virtual ~RunStreamSink() = default;
    virtual bool onEvent(const RunEvent& event) = 0;
    virtual bool onHeartbeat() = 0;
    virtual void onDone(const RunSnapshot& snapshot) = 0;
    virtual void onError(const std::string& message) = 0;
};

enum class StreamOutcome {
    Completed,      // done was delivered
    Stopped,        // the sink asked to stop
    UnknownRun      // error was delivered
};

/**
 * Deliver a run's undelivered events to `sink` in FIFO order
 *
 * A heartbeat is sent whenever no event arrives within `heartbeat`. Once
 * the run is finished and its channel drained, a single done is sent.
 * An unknown (or evicted) run produces a single error.
 */
StreamOutcome streamRun(RunRegistry& registry,
                        const std::string& runId,
                        RunStreamSink& sink,
                        std::chrono::milliseconds heartbeat = std::chrono::seconds(15));

} // namespace runs
} // namespace weft
