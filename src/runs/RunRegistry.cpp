#include "runs/RunRegistry.hpp"
#include "core/Logger.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace weft {
namespace runs {

std::string toString(RunStatus status) {
    switch (status) {
        case RunStatus::Created:   return "created";
        case RunStatus::Running:   return "running";
        case RunStatus::Succeeded: return "succeeded";
        case RunStatus::Failed:    return "failed";
    }
    return "created";
}

json RunSnapshot::toJson(bool withEvents) const {
    json j;
    j["run_id"] = runId;
    j["kind"] = kind;
    j["status"] = toString(status);
    j["started_at"] = formatIsoTimestamp(startedAt);
    j["finished_at"] = finishedAt ? json(formatIsoTimestamp(*finishedAt)) : json(nullptr);
    j["result"] = result;
    j["cancel_requested"] = cancelRequested;
    j["event_count"] = events.size();
    if (withEvents) {
        json list = json::array();
        for (const auto& e : events) {
            list.push_back(e.toJson());
        }
        j["events"] = std::move(list);
    }
    return j;
}

RunRegistry::RunRegistry(RunRegistryOptions options)
    : m_options(options) {}

RunRegistry::~RunRegistry() {
    stop();
}

RunRegistry& RunRegistry::instance() {
    static RunRegistry registry;
    return registry;
}

void RunRegistry::configure(RunRegistryOptions options) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_options = options;
}

std::string RunRegistry::generateRunId() {
    // run_<16 hex chars>
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    std::stringstream ss;
    ss << "run_" << std::hex << std::setfill('0') << std::setw(16) << dis(gen);
    return ss.str();
}

std::shared_ptr<RunRegistry::RunState> RunRegistry::find(const std::string& runId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_runs.find(runId);
    return it != m_runs.end() ? it->second : nullptr;
}

std::string RunRegistry::create(const std::string& kind) {
    auto state = std::make_shared<RunState>();
    state->kind = kind;
    state->startedAt = nowMillis();

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string runId;
    do {
        runId = generateRunId();
    } while (m_runs.count(runId));
    state->runId = runId;
    m_runs[runId] = std::move(state);

    LOG_DEBUG("Created run: " + runId + " (" + kind + ")");
    return runId;
}

void RunRegistry::markRunning(const std::string& runId) {
    auto state = find(runId);
    if (!state) return;

    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->finishedAt) {
        state->status = RunStatus::Running;
    }
}

void RunRegistry::append(const std::string& runId, const RunEvent& event) {
    auto state = find(runId);
    if (!state) {
        LOG_DEBUG("Dropping event for unknown run: " + runId);
        return;
    }

    size_t capacity;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        capacity = m_options.channelCapacity;
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->finishedAt) {
            return;
        }
        state->log.push_back(event);
        state->channel.push_back(event);
        while (capacity > 0 && state->channel.size() > capacity) {
            state->channel.pop_front();
            ++state->dropped;
        }
    }
    state->ready.notify_all();
}

void RunRegistry::finish(const std::string& runId, RunStatus status, json result) {
    auto state = find(runId);
    if (!state) return;

    int64_t durationMs = 0;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->finishedAt) {
            return;
        }
        state->status = status;
        state->result = std::move(result);
        state->finishedAt = nowMillis();
        durationMs = toUnixMillis(*state->finishedAt) - toUnixMillis(state->startedAt);
        if (state->dropped > 0) {
            LOG_WARN("Run " + runId + " dropped " + std::to_string(state->dropped) +
                     " undelivered events");
        }
    }
    state->ready.notify_all();

    LOG_INFO("Run " + runId + " " + toString(status) + " in " + std::to_string(durationMs) + "ms");
}

std::optional<RunSnapshot> RunRegistry::get(const std::string& runId) const {
    auto state = find(runId);
    if (!state) return std::nullopt;

    std::lock_guard<std::mutex> lock(state->mutex);
    RunSnapshot snapshot;
    snapshot.runId = state->runId;
    snapshot.kind = state->kind;
    snapshot.status = state->status;
    snapshot.startedAt = state->startedAt;
    snapshot.finishedAt = state->finishedAt;
    snapshot.events = state->log;
    snapshot.result = state->result;
    snapshot.cancelRequested = state->cancelRequested;
    snapshot.droppedEvents = state->dropped;
    return snapshot;
}

bool RunRegistry::exists(const std::string& runId) const {
    return find(runId) != nullptr;
}

size_t RunRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_runs.size();
}

PopResult RunRegistry::popNext(const std::string& runId, std::chrono::milliseconds timeout) {
    auto state = find(runId);
    if (!state) {
        return PopResult{PopStatus::UnknownRun, std::nullopt};
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->ready.wait_for(lock, timeout, [&] {
        return !state->channel.empty() || state->finishedAt.has_value();
    });

    if (!state->channel.empty()) {
        RunEvent event = std::move(state->channel.front());
        state->channel.pop_front();
        return PopResult{PopStatus::Event, std::move(event)};
    }
    if (state->finishedAt) {
        return PopResult{PopStatus::Finished, std::nullopt};
    }
    return PopResult{PopStatus::Timeout, std::nullopt};
}

bool RunRegistry::cancel(const std::string& runId) {
    auto state = find(runId);
    if (!state) return false;

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->finishedAt) {
        return false;
    }
    state->cancelRequested = true;
    LOG_INFO("Cancellation requested for run " + runId);
    return true;
}

bool RunRegistry::isCancelled(const std::string& runId) const {
    auto state = find(runId);
    if (!state) return false;

    std::lock_guard<std::mutex> lock(state->mutex);
    return state->cancelRequested;
}

size_t RunRegistry::evictExpired(TimePoint now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;

    for (auto it = m_runs.begin(); it != m_runs.end(); ) {
        bool expired;
        {
            std::lock_guard<std::mutex> runLock(it->second->mutex);
            const auto& state = *it->second;
            TimePoint reference = state.finishedAt ? *state.finishedAt : state.startedAt;
            expired = now - reference > m_options.ttl;
        }
        if (expired) {
            LOG_DEBUG("Evicting run: " + it->first);
            it = m_runs.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_INFO("Evicted " + std::to_string(removed) + " expired runs");
    }
    return removed;
}

void RunRegistry::start(std::chrono::milliseconds interval) {
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        return;
    }
    m_evictor = std::thread([this, interval] { evictionLoop(interval); });
    LOG_DEBUG("Run eviction thread started");
}

void RunRegistry::stop() {
    bool expected = true;
    if (!m_running.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
    }
    m_stopSignal.notify_all();
    if (m_evictor.joinable()) {
        m_evictor.join();
    }
    LOG_DEBUG("Run eviction thread stopped");
}

void RunRegistry::evictionLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(m_stopMutex);
    while (m_running.load()) {
        m_stopSignal.wait_for(lock, interval, [this] { return !m_running.load(); });
        if (!m_running.load()) {
            break;
        }
        lock.unlock();
        evictExpired(Clock::now());
        lock.lock();
    }
}

} // namespace runs
} // namespace weft
