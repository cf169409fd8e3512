#ifndef LATMON_INGEST_BATCH_WRITER_H_
#define LATMON_INGEST_BATCH_WRITER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "latmon/core/config.h"
#include "latmon/core/pipeline_counters.h"
#include "latmon/core/result.h"
#include "latmon/core/types.h"
#include "latmon/ingest/ingestion_buffer.h"
#include "latmon/storage/event_sink.h"
#include "latmon/storage/retention.h"

namespace latmon {
namespace ingest {

/**
 * @brief The single consumer of the ingestion buffer and the only store writer
 *
 * A background thread drains the buffer whenever batch_size events are
 * buffered or flush_interval has elapsed, and commits each drained batch as
 * one atomic store write. A failing commit is retried with exponential
 * backoff; once retries are exhausted the batch is parked in a bounded
 * recovery queue and retried on later cycles. New batches are held back while
 * recovery batches are pending so that commit order matches drain order.
 *
 * Retention runs on the same thread, between batches, so the store only ever
 * sees one writer.
 */
class BatchWriter {
public:
    BatchWriter(const core::WriterConfig& config,
                std::shared_ptr<IngestionBuffer> buffer,
                std::unique_ptr<storage::EventSink> sink,
                std::shared_ptr<core::PipelineCounters> counters);

    /** Stops the worker, draining what is buffered */
    ~BatchWriter();

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    /**
     * @brief Start the worker thread
     * @return INVALID_ARGUMENT if already started or stopped
     */
    core::Result<void> start();

    /**
     * @brief Close the buffer, commit everything still buffered or parked and join
     *
     * Batches that still cannot be committed are counted as lost.
     */
    void stop();

    /**
     * @brief Commit everything submitted before this call
     * @return true when every such event was committed within the timeout
     */
    bool flush(std::chrono::milliseconds timeout);

    /**
     * @brief Run retention on the writer thread between batches
     *
     * The future resolves with INVALID_ARGUMENT when the writer is not running.
     */
    std::future<core::Result<storage::RetentionReport>> request_retention(
        const core::RetentionPolicy& policy);

    bool running() const { return running_.load(); }

    /** @brief Batches parked for a later retry */
    size_t recovery_depth() const { return recovery_depth_.load(); }

private:
    struct PendingBatch {
        std::vector<core::LatencyEvent> events;
        uint32_t rounds;
    };

    struct RetentionTask {
        core::RetentionPolicy policy;
        std::promise<core::Result<storage::RetentionReport>> promise;
    };

    void worker_loop();
    void run_cycle(bool final_cycle);
    void run_retention_tasks();
    /** @return false when no batch could be retried to completion */
    bool retry_recovery(bool final_cycle);
    bool commit_with_retry(const std::vector<core::LatencyEvent>& batch);
    void park(std::vector<core::LatencyEvent> batch, bool final_cycle);
    void discard(const std::vector<core::LatencyEvent>& batch, const char* reason);
    void complete_flushes(uint64_t up_to, bool clean);

    core::WriterConfig config_;
    std::shared_ptr<IngestionBuffer> buffer_;
    std::unique_ptr<storage::EventSink> sink_;
    std::shared_ptr<core::PipelineCounters> counters_;

    std::thread worker_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    bool started_;

    // Worker-thread only
    std::deque<PendingBatch> recovery_;
    std::atomic<size_t> recovery_depth_;
    bool lost_in_cycle_;

    std::mutex state_mutex_;
    std::condition_variable flush_cv_;
    uint64_t flush_requested_;
    uint64_t flush_completed_;
    bool last_flush_clean_;
    bool accepting_requests_;
    bool worker_exited_;
    std::deque<RetentionTask> retention_tasks_;
};

} // namespace ingest
} // namespace latmon

#endif // LATMON_INGEST_BATCH_WRITER_H_
