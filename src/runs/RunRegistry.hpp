#pragma once

#include "runs/RunEvent.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace weft {
namespace runs {

enum class RunStatus {
    Created,
    Running,
    Succeeded,
    Failed
};

std::string toString(RunStatus status);

/**
 * Point-in-time copy of a run, safe to hand out of the registry
 */
struct RunSnapshot {
    std::string runId;
    std::string kind;
    RunStatus status = RunStatus::Created;
    TimePoint startedAt;
    std::optional<TimePoint> finishedAt;
    std::vector<RunEvent> events;
    json result;
    bool cancelRequested = false;
    size_t droppedEvents = 0;

    bool finished() const { return finishedAt.has_value(); }

    /// {"run_id", "kind", "status", "started_at", "finished_at", "result", "events": [...]}
    json toJson(bool withEvents = true) const;
};

enum class PopStatus {
    Event,        // an event was taken from the channel
    Timeout,      // nothing arrived before the timeout
    Finished,     // the run is finished and the channel is drained
    UnknownRun
};

struct PopResult {
    PopStatus status = PopStatus::UnknownRun;
    std::optional<RunEvent> event;
};

struct RunRegistryOptions {
    std::chrono::seconds ttl{900};
    size_t channelCapacity = 1024;
};

/**
 * In-memory registry of runs and their event streams. Thread-safe.
 *
 * Each run keeps a complete ordered log plus a bounded channel of
 * undelivered events for a single streaming consumer. When the channel is
 * full the oldest undelivered event is dropped from the channel only.
 * Runs disappear after the TTL, either by explicit evictExpired() calls or
 * by the background eviction thread started with start().
 */
class RunRegistry {
public:
    explicit RunRegistry(RunRegistryOptions options = {});
    ~RunRegistry();

    RunRegistry(const RunRegistry&) = delete;
    RunRegistry& operator=(const RunRegistry&) = delete;

    /**
     * Process-wide registry used by the HTTP server
     */
    static RunRegistry& instance();

    void configure(RunRegistryOptions options);
    const RunRegistryOptions& options() const { return m_options; }

    // === Lifecycle ===

    /**
     * Create a run and return its id ("run_<16 hex chars>")
     */
    std::string create(const std::string& kind);

    /**
     * Mark a run as running. No-op on unknown or finished runs.
     */
    void markRunning(const std::string& runId);

    /**
     * Append an event to the log and the channel. No-op on unknown or
     * finished runs.
     */
    void append(const std::string& runId, const RunEvent& event);

    /**
     * Set the final status and result, and stamp finished_at. No-op on
     * unknown or already finished runs.
     */
    void finish(const std::string& runId, RunStatus status, json result = nullptr);

    // === Queries ===

    std::optional<RunSnapshot> get(const std::string& runId) const;
    bool exists(const std::string& runId) const;
    size_t size() const;

    /**
     * Take the next undelivered event, waiting up to `timeout`
     */
    PopResult popNext(const std::string& runId, std::chrono::milliseconds timeout);

    // === Cancellation ===

    /**
     * Ask a run to stop. Returns false for unknown or finished runs.
     */
    bool cancel(const std::string& runId);
    bool isCancelled(const std::string& runId) const;

    // === Eviction ===

    /**
     * Remove finished runs whose finished_at is older than the TTL and
     * unfinished runs started more than the TTL ago. Returns the count.
     */
    size_t evictExpired(TimePoint now = Clock::now());

    /**
     * Start the background eviction thread (idempotent)
     */
    void start(std::chrono::milliseconds interval = std::chrono::seconds(60));

    /**
     * Stop and join the eviction thread (idempotent)
     */
    void stop();

    bool running() const { return m_running.load(); }

private:
    struct RunState {
        std::string runId;
        std::string kind;
        RunStatus status = RunStatus::Created;
        TimePoint startedAt;
        std::optional<TimePoint> finishedAt;
        std::vector<RunEvent> log;
        std::deque<RunEvent> channel;
        json result;
        bool cancelRequested = false;
        size_t dropped = 0;

        mutable std::mutex mutex;
        std::condition_variable ready;
    };

    std::shared_ptr<RunState> find(const std::string& runId) const;
    std::string generateRunId();
    void evictionLoop(std::chrono::milliseconds interval);

    RunRegistryOptions m_options;
    std::map<std::string, std::shared_ptr<RunState>> m_runs;
    mutable std::mutex m_mutex;

    std::thread m_evictor;
    std::atomic<bool> m_running{false};
    std::mutex m_stopMutex;
    std::condition_variable m_stopSignal;
};

} // namespace runs
} // namespace weft
