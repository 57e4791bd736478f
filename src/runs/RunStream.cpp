#include "runs/RunStream.hpp"
#include "core/Logger.hpp"

namespace weft {
namespace runs {

StreamOutcome streamRun(RunRegistry& registry,
                        const std::string& runId,
                        RunStreamSink& sink,
                        std::chrono::milliseconds heartbeat) {
    while (true) {
        PopResult next = registry.popNext(runId, heartbeat);

        switch (next.status) {
            case PopStatus::Event:
                if (!sink.onEvent(*next.event)) {
                    return StreamOutcome::Stopped;
                }
                break;

            case PopStatus::Timeout:
                if (!sink.onHeartbeat()) {
                    return StreamOutcome::Stopped;
                }
                break;

            case PopStatus::Finished: {
                auto snapshot = registry.get(runId);
                if (!snapshot) {
                    sink.onError("Run not found: " + runId);
                    return StreamOutcome::UnknownRun;
                }
                sink.onDone(*snapshot);
                return StreamOutcome::Completed;
            }

            case PopStatus::UnknownRun:
                LOG_DEBUG("Stream requested for unknown run: " + runId);
                sink.onError("Run not found: " + runId);
                return StreamOutcome::UnknownRun;
        }
    }
}

} // namespace runs
} // namespace weft
