#include "latmon/storage/event_store.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

#include <algorithm>
#include <limits>

namespace latmon {
namespace storage {
namespace {

constexpr core::EventID kMinId = std::numeric_limits<core::EventID>::min();
constexpr core::EventID kMaxId = std::numeric_limits<core::EventID>::max();
constexpr core::Timestamp kMaxTimestamp = std::numeric_limits<core::Timestamp>::max();

// Walks index keys from `start` while in_range holds, re-acquiring the shared
// lock every `chunk` keys and resuming strictly after the last visited key.
template<typename Index, typename InRange, typename Visit>
void ScanChunks(std::shared_mutex& mutex,
                const Index& index,
                const typename Index::key_type& start,
                size_t chunk,
                InRange in_range,
                Visit visit,
                const std::function<void()>& after_chunk) {
    auto cursor = start;
    bool first = true;
    bool done = false;
    while (!done) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex);
            auto it = first ? index.lower_bound(cursor) : index.upper_bound(cursor);
            for (size_t n = 0; n < chunk; ++it, ++n) {
                if (it == index.end() || !in_range(*it)) {
                    done = true;
                    break;
                }
                cursor = *it;
                if (!visit(*it)) {
                    done = true;
                    break;
                }
            }
        }
        first = false;
        after_chunk();
    }
}

} // namespace

// StoreWriter implementation
StoreWriter::StoreWriter(std::shared_ptr<EventStore> store) : store_(std::move(store)) {}

StoreWriter::StoreWriter(StoreWriter&& other) noexcept : store_(std::move(other.store_)) {}

StoreWriter& StoreWriter::operator=(StoreWriter&& other) noexcept {
    if (this != &other) {
        release();
        store_ = std::move(other.store_);
    }
    return *this;
}

StoreWriter::~StoreWriter() {
    release();
}

void StoreWriter::release() {
    if (store_) {
        store_->writer_acquired_.store(false);
        store_.reset();
    }
}

core::Result<size_t> StoreWriter::commit_batch(const std::vector<core::LatencyEvent>& events) {
    if (!store_) {
        return core::Result<size_t>::error("Store writer has been released",
                                           core::Error::Code::COMMIT_FAILURE);
    }
    return store_->commit(events);
}

core::Result<uint64_t> StoreWriter::delete_older_than(core::Timestamp cutoff) {
    if (!store_) {
        return core::Result<uint64_t>::error("Store writer has been released",
                                             core::Error::Code::RETENTION_FAILURE);
    }
    return store_->delete_older_than(cutoff);
}

core::Result<uint64_t> StoreWriter::evict_to_count(size_t max_count) {
    if (!store_) {
        return core::Result<uint64_t>::error("Store writer has been released",
                                             core::Error::Code::RETENTION_FAILURE);
    }
    return store_->evict_to_count(max_count);
}

core::Result<bool> StoreWriter::maybe_compact() {
    if (!store_) {
        return core::Result<bool>::error("Store writer has been released",
                                         core::Error::Code::RETENTION_FAILURE);
    }
    return store_->maybe_compact();
}

core::Result<void> StoreWriter::compact() {
    if (!store_) {
        return core::Result<void>::error("Store writer has been released",
                                         core::Error::Code::RETENTION_FAILURE);
    }
    return store_->compact();
}

// StoreReader implementation
StoreReader::StoreReader(std::shared_ptr<const EventStore> store) : store_(std::move(store)) {}

std::vector<core::LatencyEvent> StoreReader::recent(size_t limit,
                                                    std::optional<core::Component> component) const {
    std::vector<core::LatencyEvent> out;
    if (limit == 0) {
        return out;
    }
    out.reserve(std::min<size_t>(limit, 1024));

    std::shared_lock<std::shared_mutex> lock(store_->index_mutex_);
    if (component) {
        const uint8_t tag = static_cast<uint8_t>(*component);
        const auto& index = store_->component_index_;
        auto it = index.upper_bound(EventStore::ComponentKey{tag, kMaxTimestamp, kMaxId});
        while (out.size() < limit && it != index.begin()) {
            --it;
            if (std::get<0>(*it) != tag) {
                break;
            }
            out.push_back(store_->rows_.at(std::get<2>(*it)));
        }
    } else {
        const auto& index = store_->time_index_;
        for (auto it = index.rbegin(); it != index.rend() && out.size() < limit; ++it) {
            out.push_back(store_->rows_.at(it->second));
        }
    }
    return out;
}

std::vector<core::LatencyEvent> StoreReader::range(const core::TimeWindow& window,
                                                   std::optional<core::Component> component,
                                                   size_t limit) const {
    std::vector<core::LatencyEvent> out;
    if (limit == 0) {
        return out;
    }
    store_->scan_window(window, component,
                        [&](const core::LatencyEvent& event) {
                            out.push_back(event);
                            return out.size() < limit;
                        },
                        [] {});
    return out;
}

uint64_t StoreReader::count(const core::TimeWindow& window,
                            std::optional<core::Component> component) const {
    uint64_t n = 0;
    store_->scan_window(window, component,
                        [&](const core::LatencyEvent&) {
                            ++n;
                            return true;
                        },
                        [] {});
    return n;
}

uint64_t StoreReader::scan_durations(
    const core::TimeWindow& window,
    std::optional<core::Component> component,
    const std::function<void(const std::vector<DurationSample>&)>& on_chunk) const {
    uint64_t delivered = 0;
    std::vector<DurationSample> chunk;
    chunk.reserve(store_->config_.scan_chunk_size);
    store_->scan_window(window, component,
                        [&](const core::LatencyEvent& event) {
                            chunk.push_back(DurationSample{event.duration_us(), event.success()});
                            return true;
                        },
                        [&] {
                            if (!chunk.empty()) {
                                delivered += chunk.size();
                                on_chunk(chunk);
                                chunk.clear();
                            }
                        });
    return delivered;
}

uint64_t StoreReader::total_count() const {
    std::shared_lock<std::shared_mutex> lock(store_->index_mutex_);
    return store_->rows_.size();
}

std::optional<core::Timestamp> StoreReader::newest_timestamp() const {
    std::shared_lock<std::shared_mutex> lock(store_->index_mutex_);
    if (store_->time_index_.empty()) {
        return std::nullopt;
    }
    return store_->time_index_.rbegin()->first;
}

StoreStats StoreReader::stats() const {
    return store_->stats();
}

// EventStore implementation
EventStore::EventStore(const core::StorageConfig& config)
    : config_(config), next_id_(1), deleted_rows_(0), compactions_(0) {}

core::Result<std::shared_ptr<EventStore>> EventStore::Open(const core::StorageConfig& config) {
    using ResultType = core::Result<std::shared_ptr<EventStore>>;
    if (config.path.empty()) {
        return ResultType::error("Event store path is empty", core::Error::Code::STORAGE_INIT);
    }

    std::shared_ptr<EventStore> store(new EventStore(config));
    auto log = EventLog::Open(config.path, config.sync_on_commit,
                              [&store](DecodedFrame&& frame) { store->apply_frame(std::move(frame)); });
    if (!log.ok()) {
        return ResultType::error(log.error(), core::Error::Code::STORAGE_INIT);
    }
    store->log_ = log.take_value();
    store->file_bytes_.store(store->log_->size_bytes());

    LATMON_INFO("Opened event store {}: {} events, next id {}, {} deleted rows",
                config.path, store->rows_.size(), store->next_id_, store->deleted_rows_);
    return ResultType(std::move(store));
}

core::Result<StoreWriter> EventStore::acquire_writer() {
    bool expected = false;
    if (!writer_acquired_.compare_exchange_strong(expected, true)) {
        return core::Result<StoreWriter>::error("Event store writer is already held",
                                                core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<StoreWriter>(StoreWriter(shared_from_this()));
}

StoreReader EventStore::reader() const {
    return StoreReader(shared_from_this());
}

StoreStats EventStore::stats() const {
    StoreStats stats;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        stats.live_events = rows_.size();
        stats.deleted_rows = deleted_rows_;
        stats.next_id = next_id_;
        stats.compactions = compactions_;
    }
    stats.file_bytes = file_bytes_.load();
    return stats;
}

void EventStore::scan_window(const core::TimeWindow& window,
                             std::optional<core::Component> component,
                             const std::function<bool(const core::LatencyEvent&)>& visit,
                             const std::function<void()>& after_chunk) const {
    if (!window.valid()) {
        return;
    }
    const size_t chunk = std::max<size_t>(1, config_.scan_chunk_size);
    if (component) {
        const uint8_t tag = static_cast<uint8_t>(*component);
        ScanChunks(index_mutex_, component_index_, ComponentKey{tag, window.start, kMinId}, chunk,
                   [&](const ComponentKey& key) {
                       return std::get<0>(key) == tag && std::get<1>(key) < window.end;
                   },
                   [&](const ComponentKey& key) { return visit(rows_.at(std::get<2>(key))); },
                   after_chunk);
    } else {
        ScanChunks(index_mutex_, time_index_, TimeKey{window.start, kMinId}, chunk,
                   [&](const TimeKey& key) { return key.first < window.end; },
                   [&](const TimeKey& key) { return visit(rows_.at(key.second)); },
                   after_chunk);
    }
}

void EventStore::apply_frame(DecodedFrame&& frame) {
    switch (frame.type) {
        case FrameType::BATCH:
            for (auto& event : frame.events) {
                next_id_ = std::max(next_id_, event.id() + 1);
                if (rows_.count(event.id()) == 0) {
                    insert_locked(event);
                }
            }
            break;
        case FrameType::DELETE:
            for (core::EventID id : frame.ids) {
                if (erase_locked(id)) {
                    deleted_rows_++;
                }
            }
            break;
        case FrameType::CHECKPOINT:
            next_id_ = std::max(next_id_, frame.next_id);
            break;
    }
}

void EventStore::insert_locked(const core::LatencyEvent& event) {
    time_index_.emplace(event.wall_timestamp(), event.id());
    component_index_.emplace(static_cast<uint8_t>(event.component()), event.wall_timestamp(), event.id());
    rows_.emplace(event.id(), event);
}

bool EventStore::erase_locked(core::EventID id) {
    auto it = rows_.find(id);
    if (it == rows_.end()) {
        return false;
    }
    const auto& event = it->second;
    time_index_.erase(TimeKey{event.wall_timestamp(), id});
    component_index_.erase(ComponentKey{static_cast<uint8_t>(event.component()), event.wall_timestamp(), id});
    rows_.erase(it);
    return true;
}

core::Result<size_t> EventStore::commit(const std::vector<core::LatencyEvent>& events) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    if (events.empty()) {
        return core::Result<size_t>(0);
    }

    // next_id_ only changes under write_mutex_, so reading it here is safe
    std::vector<core::LatencyEvent> committed;
    committed.reserve(events.size());
    for (size_t i = 0; i < events.size(); ++i) {
        committed.push_back(events[i].with_id(next_id_ + static_cast<core::EventID>(i)));
    }

    auto appended = log_->append(EncodeBatchPayload(committed));
    if (!appended.ok()) {
        return core::Result<size_t>::error(appended.error(), core::Error::Code::COMMIT_FAILURE);
    }
    file_bytes_.store(log_->size_bytes());

    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        for (const auto& event : committed) {
            insert_locked(event);
        }
        next_id_ += static_cast<core::EventID>(committed.size());
    }
    LATMON_DEBUG("Committed batch of {} events, ids {}..{}",
                 committed.size(), committed.front().id(), committed.back().id());
    return core::Result<size_t>(committed.size());
}

core::Result<uint64_t> EventStore::delete_ids_locked(const std::vector<core::EventID>& ids) {
    if (ids.empty()) {
        return core::Result<uint64_t>(0);
    }

    auto appended = log_->append(EncodeDeletePayload(ids));
    if (!appended.ok()) {
        return core::Result<uint64_t>::error(appended.error(), core::Error::Code::RETENTION_FAILURE);
    }
    file_bytes_.store(log_->size_bytes());

    uint64_t erased = 0;
    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        for (core::EventID id : ids) {
            if (erase_locked(id)) {
                erased++;
            }
        }
        deleted_rows_ += erased;
    }
    return core::Result<uint64_t>(erased);
}

core::Result<uint64_t> EventStore::delete_older_than(core::Timestamp cutoff) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::vector<core::EventID> ids;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        for (const auto& key : time_index_) {
            if (key.first >= cutoff) {
                break;
            }
            ids.push_back(key.second);
        }
    }
    return delete_ids_locked(ids);
}

core::Result<uint64_t> EventStore::evict_to_count(size_t max_count) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::vector<core::EventID> ids;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        if (rows_.size() <= max_count) {
            return core::Result<uint64_t>(0);
        }
        size_t excess = rows_.size() - max_count;
        ids.reserve(excess);
        for (auto it = time_index_.begin(); it != time_index_.end() && ids.size() < excess; ++it) {
            ids.push_back(it->second);
        }
    }
    return delete_ids_locked(ids);
}

core::Result<bool> EventStore::maybe_compact() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    uint64_t dead = 0;
    uint64_t live = 0;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        dead = deleted_rows_;
        live = rows_.size();
    }
    if (dead == 0 || static_cast<double>(dead) <= config_.compaction_garbage_ratio * static_cast<double>(live)) {
        return core::Result<bool>(false);
    }
    auto compacted = compact_locked();
    if (!compacted.ok()) {
        return core::Result<bool>::error(compacted.error(), compacted.error_code());
    }
    return core::Result<bool>(true);
}

core::Result<void> EventStore::compact() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    return compact_locked();
}

core::Result<void> EventStore::compact_locked() {
    const size_t chunk = std::max<size_t>(1, config_.scan_chunk_size);
    std::vector<std::vector<uint8_t>> payloads;
    uint64_t live = 0;
    uint64_t dead = 0;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        // The checkpoint keeps ids monotonic even if every row is gone
        payloads.push_back(EncodeCheckpointPayload(next_id_));
        std::vector<core::LatencyEvent> batch;
        batch.reserve(std::min(chunk, rows_.size()));
        for (const auto& key : time_index_) {
            batch.push_back(rows_.at(key.second));
            if (batch.size() == chunk) {
                payloads.push_back(EncodeBatchPayload(batch));
                batch.clear();
            }
        }
        if (!batch.empty()) {
            payloads.push_back(EncodeBatchPayload(batch));
        }
        live = rows_.size();
        dead = deleted_rows_;
    }

    auto rewritten = log_->rewrite(payloads);
    if (!rewritten.ok()) {
        return rewritten;
    }
    file_bytes_.store(log_->size_bytes());

    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        deleted_rows_ = 0;
        compactions_++;
    }
    LATMON_INFO("Compacted event store {}: kept {} events, dropped {} deleted rows, {} bytes",
                config_.path, live, dead, log_->size_bytes());
    return core::Result<void>();
}

} // namespace storage
} // namespace latmon
