#include "latmon/ingest/batch_writer.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

#include <algorithm>

namespace latmon {
namespace ingest {

namespace {

core::Result<size_t> CommitOnce(storage::EventSink& sink, const std::vector<core::LatencyEvent>& batch) {
    try {
        return sink.commit_batch(batch);
    } catch (const std::exception& e) {
        return core::Result<size_t>::error(std::string("commit threw: ") + e.what(),
                                           core::Error::Code::COMMIT_FAILURE);
    }
}

} // namespace

BatchWriter::BatchWriter(const core::WriterConfig& config,
                         std::shared_ptr<IngestionBuffer> buffer,
                         std::unique_ptr<storage::EventSink> sink,
                         std::shared_ptr<core::PipelineCounters> counters)
    : config_(config),
      buffer_(std::move(buffer)),
      sink_(std::move(sink)),
      counters_(std::move(counters)),
      running_(false),
      stop_requested_(false),
      started_(false),
      recovery_depth_(0),
      lost_in_cycle_(false),
      flush_requested_(0),
      flush_completed_(0),
      last_flush_clean_(true),
      accepting_requests_(false),
      worker_exited_(false) {
    if (!buffer_ || !sink_ || !counters_) {
        throw core::InvalidArgumentError("Batch writer needs a buffer, a sink and counters");
    }
    if (config_.batch_size == 0) {
        throw core::InvalidArgumentError("Batch size must be positive");
    }
}

BatchWriter::~BatchWriter() {
    stop();
}

core::Result<void> BatchWriter::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (started_) {
        return core::Result<void>::error("Batch writer already started",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    started_ = true;
    accepting_requests_ = true;
    running_ = true;
    counters_->writer_running = true;
    worker_ = std::thread(&BatchWriter::worker_loop, this);
    LATMON_INFO("Batch writer started (batch size {}, flush interval {}ms)",
                config_.batch_size, config_.flush_interval.count());
    return core::Result<void>();
}

void BatchWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        accepting_requests_ = false;
    }
    stop_requested_ = true;
    buffer_->close();
    if (worker_.joinable()) {
        worker_.join();
        LATMON_INFO("Batch writer stopped");
    }
}

bool BatchWriter::flush(std::chrono::milliseconds timeout) {
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!accepting_requests_) {
            return false;
        }
        seq = ++flush_requested_;
    }
    buffer_->wake();

    std::unique_lock<std::mutex> lock(state_mutex_);
    flush_cv_.wait_for(lock, timeout, [this, seq] {
        return flush_completed_ >= seq || worker_exited_;
    });
    return flush_completed_ >= seq && last_flush_clean_;
}

std::future<core::Result<storage::RetentionReport>> BatchWriter::request_retention(
    const core::RetentionPolicy& policy) {
    RetentionTask task;
    task.policy = policy;
    auto future = task.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!accepting_requests_) {
            task.promise.set_value(core::Result<storage::RetentionReport>::error(
                "Batch writer is not running", core::Error::Code::INVALID_ARGUMENT));
            return future;
        }
        retention_tasks_.push_back(std::move(task));
    }
    buffer_->wake();
    return future;
}

void BatchWriter::worker_loop() {
    while (!stop_requested_) {
        auto deadline = std::chrono::steady_clock::now() + config_.flush_interval;
        buffer_->wait_for_batch(config_.batch_size, deadline);
        if (stop_requested_) {
            break;
        }
        try {
            run_cycle(false);
        } catch (const std::exception& e) {
            LATMON_ERROR("Batch writer cycle failed: {}", e.what());
        }
    }

    try {
        run_cycle(true);
    } catch (const std::exception& e) {
        LATMON_ERROR("Final batch writer cycle failed: {}", e.what());
    }

    counters_->writer_running = false;
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        worker_exited_ = true;
    }
    flush_cv_.notify_all();
}

void BatchWriter::run_cycle(bool final_cycle) {
    uint64_t flush_seq;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        flush_seq = flush_requested_;
    }
    lost_in_cycle_ = false;

    run_retention_tasks();

    if (!retry_recovery(final_cycle)) {
        // The store is still failing; new events stay buffered behind the parked ones
        complete_flushes(flush_seq, false);
        return;
    }

    std::vector<core::LatencyEvent> batch;
    batch.reserve(config_.batch_size);
    while (buffer_->drain(batch, config_.batch_size) > 0) {
        if (!commit_with_retry(batch)) {
            park(std::move(batch), final_cycle);
            batch = std::vector<core::LatencyEvent>();
            if (!final_cycle) {
                break;
            }
        }
        batch.clear();
    }

    complete_flushes(flush_seq, recovery_.empty() && !lost_in_cycle_);
}

void BatchWriter::run_retention_tasks() {
    std::deque<RetentionTask> tasks;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        tasks.swap(retention_tasks_);
    }

    for (auto& task : tasks) {
        core::Result<storage::RetentionReport> result =
            core::Result<storage::RetentionReport>::error("retention not run", core::Error::Code::INTERNAL);
        try {
            result = storage::ApplyRetention(*sink_, task.policy, core::WallNowUs());
        } catch (const std::exception& e) {
            result = core::Result<storage::RetentionReport>::error(
                std::string("Retention threw: ") + e.what(), core::Error::Code::RETENTION_FAILURE);
        }

        counters_->retention_runs++;
        if (result.ok()) {
            counters_->events_expired += result.value().total_removed();
        } else {
            counters_->retention_failures++;
            LATMON_ERROR("Retention failed: {}", result.error());
        }
        task.promise.set_value(std::move(result));
    }
}

bool BatchWriter::retry_recovery(bool final_cycle) {
    while (!recovery_.empty()) {
        PendingBatch& pending = recovery_.front();
        if (commit_with_retry(pending.events)) {
            LATMON_INFO("Recovered batch of {} events after {} rounds",
                        pending.events.size(), pending.rounds + 1);
            recovery_.pop_front();
            recovery_depth_ = recovery_.size();
            continue;
        }

        pending.rounds++;
        if (!final_cycle && pending.rounds < config_.max_recovery_rounds) {
            return false;
        }
        discard(pending.events, final_cycle ? "writer stopping" : "recovery rounds exhausted");
        recovery_.pop_front();
        recovery_depth_ = recovery_.size();
    }
    return true;
}

bool BatchWriter::commit_with_retry(const std::vector<core::LatencyEvent>& batch) {
    auto backoff = config_.initial_backoff;
    for (uint32_t attempt = 0;; ++attempt) {
        auto result = CommitOnce(*sink_, batch);
        if (result.ok()) {
            counters_->record_commit(result.value());
            LATMON_DEBUG("Committed batch of {} events", result.value());
            return true;
        }

        counters_->commit_failures++;
        counters_->consecutive_commit_failures++;
        if (attempt >= config_.max_commit_retries) {
            LATMON_ERROR("Commit of {} events failed after {} attempts: {}",
                         batch.size(), attempt + 1, result.error());
            return false;
        }

        LATMON_WARN("Commit of {} events failed (attempt {}), retrying in {}ms: {}",
                    batch.size(), attempt + 1, backoff.count(), result.error());
        counters_->commit_retries++;
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, config_.max_backoff);
    }
}

void BatchWriter::park(std::vector<core::LatencyEvent> batch, bool final_cycle) {
    if (final_cycle) {
        discard(batch, "writer stopping");
        return;
    }
    if (recovery_.size() >= config_.recovery_capacity) {
        discard(batch, "recovery queue full");
        return;
    }
    recovery_.push_back(PendingBatch{std::move(batch), 0});
    recovery_depth_ = recovery_.size();
    LATMON_WARN("Parked failed batch for retry ({} pending)", recovery_.size());
}

void BatchWriter::discard(const std::vector<core::LatencyEvent>& batch, const char* reason) {
    counters_->batches_lost++;
    counters_->events_lost += batch.size();
    lost_in_cycle_ = true;
    LATMON_ERROR("Discarding batch of {} events: {}", batch.size(), reason);
}

void BatchWriter::complete_flushes(uint64_t up_to, bool clean) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (up_to <= flush_completed_) {
            return;
        }
        flush_completed_ = up_to;
        last_flush_clean_ = clean;
    }
    flush_cv_.notify_all();
}

} // namespace ingest
} // namespace latmon
