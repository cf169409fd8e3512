#include "latmon/core/pipeline_counters.h"

namespace latmon {
namespace core {

void PipelineCounters::record_commit(uint64_t events) {
    events_committed.fetch_add(events, std::memory_order_relaxed);
    batches_committed.fetch_add(1, std::memory_order_relaxed);
    consecutive_commit_failures.store(0, std::memory_order_relaxed);
    int64_t ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    last_commit_ticks_.store(ticks == 0 ? 1 : ticks, std::memory_order_release);
}

std::optional<std::chrono::milliseconds> PipelineCounters::last_commit_age() const {
    int64_t ticks = last_commit_ticks_.load(std::memory_order_acquire);
    if (ticks == 0) {
        return std::nullopt;
    }
    auto last = std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(ticks));
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - last);
}

PipelineCountersSnapshot PipelineCounters::snapshot() const {
    PipelineCountersSnapshot snap;
    // dropped is read before submitted so accepted() never underflows
    snap.events_dropped = events_dropped.load();
    snap.events_submitted = events_submitted.load();
    snap.capture_errors = capture_errors.load();
    snap.durations_clamped = durations_clamped.load();
    snap.events_committed = events_committed.load();
    snap.batches_committed = batches_committed.load();
    snap.commit_failures = commit_failures.load();
    snap.commit_retries = commit_retries.load();
    snap.batches_lost = batches_lost.load();
    snap.events_lost = events_lost.load();
    snap.consecutive_commit_failures = consecutive_commit_failures.load();
    snap.retention_runs = retention_runs.load();
    snap.retention_failures = retention_failures.load();
    snap.events_expired = events_expired.load();
    snap.writer_running = writer_running.load();
    snap.last_commit_age = last_commit_age();
    return snap;
}

} // namespace core
} // namespace latmon
