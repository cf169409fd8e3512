#ifndef LATMON_MONITOR_MONITOR_SERVICE_H_
#define LATMON_MONITOR_MONITOR_SERVICE_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "latmon/capture/sampler.h"
#include "latmon/core/config.h"
#include "latmon/core/pipeline_counters.h"
#include "latmon/core/result.h"
#include "latmon/ingest/batch_writer.h"
#include "latmon/ingest/ingestion_buffer.h"
#include "latmon/ingest/retention_enforcer.h"
#include "latmon/query/query_service.h"
#include "latmon/storage/event_store.h"

namespace latmon {
namespace monitor {

// Longest bounded session start_session() accepts
constexpr std::chrono::hours kMaxSessionDuration{24 * 365};

/**
 * @brief Identifies one monitoring session
 */
struct SessionHandle {
    uint64_t id = 0;
    std::vector<core::Component> components;   // empty = all components
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/**
 * @brief Owns the whole pipeline and the monitoring session lifecycle
 *
 * Create() opens the store and starts the batch writer and the retention
 * enforcer. Events are only admitted while a session is active; at most one
 * session is active at a time. Ending a session, by stop_session() or by its
 * deadline, closes the admission gate and then flushes the buffer.
 */
class MonitorService {
public:
    /**
     * @brief Build and start the pipeline
     * @return INVALID_ARGUMENT for a config that fails validation,
     * STORAGE_INIT when the store cannot be opened
     */
    static core::Result<std::unique_ptr<MonitorService>> Create(
        const core::MonitorConfig& config,
        capture::ClockSource clock = capture::ClockSource::System(),
        std::shared_ptr<const query::SystemResourceProvider> resources = nullptr);

    ~MonitorService();

    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    /**
     * @brief Start admitting events
     * @param filter Components to admit; empty admits every component
     * @param duration Bounded session length, nullopt = until stop_session()
     * @return INVALID_ARGUMENT while another session is active, after
     * shutdown(), or for a duration that is not in (0, kMaxSessionDuration]
     */
    core::Result<SessionHandle> start_session(const std::vector<core::Component>& filter,
                                              std::optional<std::chrono::milliseconds> duration = std::nullopt);

    /**
     * @brief Close the admission gate and flush
     *
     * The session ends even when the flush does not complete; that case
     * is reported as COMMIT_FAILURE.
     * @return INVALID_ARGUMENT if the handle is not the active session
     */
    core::Result<void> stop_session(const SessionHandle& handle);

    bool session_active() const;
    std::optional<SessionHandle> active_session() const;

    /**
     * @brief Block until no session is active, including its final flush
     * @return false on timeout
     */
    bool wait_for_session_end(std::chrono::milliseconds timeout) const;

    /** @brief Commit everything submitted so far; see BatchWriter::flush */
    bool flush(std::chrono::milliseconds timeout);

    /** @brief Apply the retention policy now and wait for the report */
    core::Result<storage::RetentionReport> enforce_retention(std::chrono::milliseconds timeout);

    /**
     * @brief End any session, stop retention and drain the writer
     *
     * Idempotent; the query side stays readable afterwards.
     */
    void shutdown();

    const std::shared_ptr<capture::Sampler>& sampler() const { return sampler_; }
    std::shared_ptr<const query::QueryService> queries() const { return queries_; }
    std::shared_ptr<const core::PipelineCounters> counters() const { return counters_; }
    const core::MonitorConfig& config() const { return config_; }

private:
    struct ActiveSession {
        SessionHandle handle;
        bool ending = false;
    };

    explicit MonitorService(const core::MonitorConfig& config);

    core::Result<void> end_session(uint64_t id, const char* reason);
    void watch_deadline(uint64_t id, std::chrono::steady_clock::time_point deadline);
    void join_watcher();

    core::MonitorConfig config_;
    std::shared_ptr<storage::EventStore> store_;
    std::shared_ptr<core::PipelineCounters> counters_;
    std::shared_ptr<ingest::IngestionBuffer> buffer_;
    std::shared_ptr<ingest::BatchWriter> writer_;
    std::unique_ptr<ingest::RetentionEnforcer> enforcer_;
    std::shared_ptr<capture::Sampler> sampler_;
    std::shared_ptr<query::QueryService> queries_;

    // Serializes start/stop/shutdown; the deadline watcher never takes it
    std::mutex lifecycle_mutex_;

    mutable std::mutex session_mutex_;
    mutable std::condition_variable session_cv_;
    std::optional<ActiveSession> active_;
    uint64_t next_session_id_;
    bool shut_down_;
    std::thread watcher_;
};

} // namespace monitor
} // namespace latmon

#endif // LATMON_MONITOR_MONITOR_SERVICE_H_
