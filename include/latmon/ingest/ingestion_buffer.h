#ifndef LATMON_INGEST_INGESTION_BUFFER_H_
#define LATMON_INGEST_INGESTION_BUFFER_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "latmon/core/config.h"
#include "latmon/core/pipeline_counters.h"
#include "latmon/core/types.h"

namespace latmon {
namespace ingest {

/**
 * @brief Consistent view of the buffer's accounting
 *
 * accepted() + dropped == submitted holds for every snapshot.
 */
struct BufferStats {
    uint64_t submitted = 0;
    uint64_t dropped = 0;
    uint64_t drained = 0;
    size_t buffered = 0;
    size_t capacity = 0;

    uint64_t accepted() const { return drained + buffered; }
};

/**
 * @brief Bounded multi-producer, single-consumer ring of completed events
 *
 * push() never blocks beyond a short critical section. When the ring is full
 * the oldest buffered event is evicted and counted as dropped.
 */
class IngestionBuffer {
public:
    IngestionBuffer(const core::BufferConfig& config,
                    std::shared_ptr<core::PipelineCounters> counters);

    IngestionBuffer(const IngestionBuffer&) = delete;
    IngestionBuffer& operator=(const IngestionBuffer&) = delete;

    /**
     * @brief Enqueue an event, evicting the oldest one when full
     * @return false if the buffer is closed (the event is not counted)
     */
    bool push(core::LatencyEvent event);

    /**
     * @brief Move up to max_events of the oldest events into out
     * @return Number of events moved
     */
    size_t drain(std::vector<core::LatencyEvent>& out, size_t max_events);

    /**
     * @brief Block until threshold events are buffered, the deadline passes,
     * wake() is called or the buffer is closed
     */
    void wait_for_batch(size_t threshold, std::chrono::steady_clock::time_point deadline);

    /** @brief Release the consumer from wait_for_batch once */
    void wake();

    /** @brief Reject further pushes; buffered events stay drainable */
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return slots_.size(); }

    BufferStats stats() const;

private:
    std::shared_ptr<core::PipelineCounters> counters_;

    mutable std::mutex mutex_;
    std::condition_variable consumer_cv_;
    std::vector<std::optional<core::LatencyEvent>> slots_;
    size_t head_;      // index of the oldest event
    size_t count_;
    uint64_t submitted_;
    uint64_t dropped_;
    uint64_t drained_;
    size_t wait_threshold_;   // 0 when the consumer is not waiting
    bool wake_pending_;
    bool closed_;
    bool overflowing_;
};

} // namespace ingest
} // namespace latmon

#endif // LATMON_INGEST_INGESTION_BUFFER_H_
