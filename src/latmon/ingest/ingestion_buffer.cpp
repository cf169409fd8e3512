#include "latmon/ingest/ingestion_buffer.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

namespace latmon {
namespace ingest {

IngestionBuffer::IngestionBuffer(const core::BufferConfig& config,
                                 std::shared_ptr<core::PipelineCounters> counters)
    : counters_(std::move(counters)),
      slots_(config.capacity),
      head_(0),
      count_(0),
      submitted_(0),
      dropped_(0),
      drained_(0),
      wait_threshold_(0),
      wake_pending_(false),
      closed_(false),
      overflowing_(false) {
    if (config.capacity == 0) {
        throw core::InvalidArgumentError("Ingestion buffer capacity must be positive");
    }
    if (!counters_) {
        throw core::InvalidArgumentError("Ingestion buffer needs pipeline counters");
    }
}

bool IngestionBuffer::push(core::LatencyEvent event) {
    bool notify = false;
    bool started_overflowing = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        submitted_++;
        counters_->events_submitted.fetch_add(1);

        if (count_ == slots_.size()) {
            // Drop-oldest: the slot at head_ is reused for the new event
            slots_[head_].reset();
            head_ = (head_ + 1) % slots_.size();
            count_--;
            dropped_++;
            counters_->events_dropped.fetch_add(1);
            if (!overflowing_) {
                overflowing_ = true;
                started_overflowing = true;
            }
        }

        slots_[(head_ + count_) % slots_.size()] = std::move(event);
        count_++;

        notify = wait_threshold_ > 0 && count_ >= wait_threshold_;
    }

    if (started_overflowing) {
        LATMON_WARN("Ingestion buffer full ({} events), dropping oldest events", slots_.size());
    }
    if (notify) {
        consumer_cv_.notify_one();
    }
    return true;
}

size_t IngestionBuffer::drain(std::vector<core::LatencyEvent>& out, size_t max_events) {
    uint64_t dropped_in_burst = 0;
    size_t moved = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (moved < max_events && count_ > 0) {
            out.push_back(std::move(*slots_[head_]));
            slots_[head_].reset();
            head_ = (head_ + 1) % slots_.size();
            count_--;
            moved++;
        }
        drained_ += moved;
        if (overflowing_ && moved > 0) {
            overflowing_ = false;
            dropped_in_burst = dropped_;
        }
    }
    if (dropped_in_burst > 0) {
        LATMON_INFO("Ingestion buffer drained after overflow, {} events dropped so far", dropped_in_burst);
    }
    return moved;
}

void IngestionBuffer::wait_for_batch(size_t threshold, std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    wait_threshold_ = threshold == 0 ? 1 : threshold;
    consumer_cv_.wait_until(lock, deadline, [this] {
        return count_ >= wait_threshold_ || wake_pending_ || closed_;
    });
    wait_threshold_ = 0;
    wake_pending_ = false;
}

void IngestionBuffer::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_pending_ = true;
    }
    consumer_cv_.notify_all();
}

void IngestionBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    consumer_cv_.notify_all();
}

bool IngestionBuffer::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t IngestionBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

BufferStats IngestionBuffer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BufferStats stats;
    stats.submitted = submitted_;
    stats.dropped = dropped_;
    stats.drained = drained_;
    stats.buffered = count_;
    stats.capacity = slots_.size();
    return stats;
}

} // namespace ingest
} // namespace latmon
