#ifndef LATMON_CORE_PIPELINE_COUNTERS_H_
#define LATMON_CORE_PIPELINE_COUNTERS_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace latmon {
namespace core {

struct PipelineCountersSnapshot {
    uint64_t events_submitted = 0;
    uint64_t events_dropped = 0;
    uint64_t capture_errors = 0;
    uint64_t durations_clamped = 0;
    uint64_t events_committed = 0;
    uint64_t batches_committed = 0;
    uint64_t commit_failures = 0;
    uint64_t commit_retries = 0;
    uint64_t batches_lost = 0;
    uint64_t events_lost = 0;
    uint64_t consecutive_commit_failures = 0;
    uint64_t retention_runs = 0;
    uint64_t retention_failures = 0;
    uint64_t events_expired = 0;
    bool writer_running = false;
    std::optional<std::chrono::milliseconds> last_commit_age;

    /** @brief Events that survived admission (submitted minus overflow evictions) */
    uint64_t accepted() const { return events_submitted - events_dropped; }
};

/**
 * @brief Thread-safe counter set shared by every pipeline stage
 *
 * Owned by the monitor service and injected into the sampler, the ingestion
 * buffer, the batch writer and the query service. Stages only ever increment;
 * consumers read through snapshot().
 */
class PipelineCounters {
public:
    PipelineCounters() = default;

    PipelineCounters(const PipelineCounters&) = delete;
    PipelineCounters& operator=(const PipelineCounters&) = delete;

    std::atomic<uint64_t> events_submitted{0};
    std::atomic<uint64_t> events_dropped{0};
    std::atomic<uint64_t> capture_errors{0};
    std::atomic<uint64_t> durations_clamped{0};
    std::atomic<uint64_t> events_committed{0};
    std::atomic<uint64_t> batches_committed{0};
    std::atomic<uint64_t> commit_failures{0};
    std::atomic<uint64_t> commit_retries{0};
    std::atomic<uint64_t> batches_lost{0};
    std::atomic<uint64_t> events_lost{0};
    std::atomic<uint64_t> consecutive_commit_failures{0};
    std::atomic<uint64_t> retention_runs{0};
    std::atomic<uint64_t> retention_failures{0};
    std::atomic<uint64_t> events_expired{0};
    std::atomic<bool> writer_running{false};

    /** @brief Record a successful batch commit of the given size */
    void record_commit(uint64_t events);

    /** @brief Monotonic age of the last successful commit, nullopt if none yet */
    std::optional<std::chrono::milliseconds> last_commit_age() const;

    PipelineCountersSnapshot snapshot() const;

private:
    // steady_clock ticks of the last commit; 0 = never
    std::atomic<int64_t> last_commit_ticks_{0};
};

} // namespace core
} // namespace latmon

#endif // LATMON_CORE_PIPELINE_COUNTERS_H_
