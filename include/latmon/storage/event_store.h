#ifndef LATMON_STORAGE_EVENT_STORE_H_
#define LATMON_STORAGE_EVENT_STORE_H_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "latmon/core/config.h"
#include "latmon/core/result.h"
#include "latmon/core/types.h"
#include "latmon/storage/event_log.h"
#include "latmon/storage/event_sink.h"

namespace latmon {
namespace storage {

class EventStore;

/**
 * @brief Duration and outcome of one stored event, as streamed to aggregation
 */
struct DurationSample {
    core::DurationUs duration_us;
    bool success;
};

struct StoreStats {
    uint64_t live_events = 0;
    uint64_t deleted_rows = 0;      // tombstoned rows still present in the file
    core::EventID next_id = 1;
    uint64_t file_bytes = 0;
    uint64_t compactions = 0;
};

/**
 * @brief The single write handle of an EventStore
 *
 * Move-only. Destroying it releases the store's writer slot.
 */
class StoreWriter : public EventSink {
public:
    StoreWriter(StoreWriter&& other) noexcept;
    StoreWriter& operator=(StoreWriter&& other) noexcept;
    StoreWriter(const StoreWriter&) = delete;
    StoreWriter& operator=(const StoreWriter&) = delete;
    ~StoreWriter() override;

    core::Result<size_t> commit_batch(const std::vector<core::LatencyEvent>& events) override;
    core::Result<uint64_t> delete_older_than(core::Timestamp cutoff) override;
    core::Result<uint64_t> evict_to_count(size_t max_count) override;
    core::Result<bool> maybe_compact() override;

    /** @brief Unconditional rewrite without deleted rows */
    core::Result<void> compact();

private:
    friend class EventStore;
    explicit StoreWriter(std::shared_ptr<EventStore> store);

    void release();

    std::shared_ptr<EventStore> store_;
};

/**
 * @brief Read handle over committed events
 *
 * Copyable and cheap. Scans take the store's shared lock for at most
 * scan_chunk_size rows at a time.
 */
class StoreReader {
public:
    explicit StoreReader(std::shared_ptr<const EventStore> store);

    /** @brief Most recent events first, at most limit */
    std::vector<core::LatencyEvent> recent(size_t limit,
                                           std::optional<core::Component> component = std::nullopt) const;

    /** @brief Events in the window in ascending (timestamp, id) order, at most limit */
    std::vector<core::LatencyEvent> range(const core::TimeWindow& window,
                                          std::optional<core::Component> component,
                                          size_t limit) const;

    uint64_t count(const core::TimeWindow& window,
                   std::optional<core::Component> component = std::nullopt) const;

    /**
     * @brief Stream durations in the window chunk by chunk
     * @return Number of rows delivered
     */
    uint64_t scan_durations(const core::TimeWindow& window,
                            std::optional<core::Component> component,
                            const std::function<void(const std::vector<DurationSample>&)>& on_chunk) const;

    uint64_t total_count() const;
    std::optional<core::Timestamp> newest_timestamp() const;
    StoreStats stats() const;

private:
    std::shared_ptr<const EventStore> store_;
};

/**
 * @brief Durable, indexed store of committed latency events
 *
 * Backed by one EventLog file. The in-memory index is rebuilt on open by
 * replaying the log. Mutations go through the single StoreWriter; reads go
 * through any number of StoreReaders.
 */
class EventStore : public std::enable_shared_from_this<EventStore> {
public:
    /**
     * @brief Open or create the store; the only fatal pipeline error
     */
    static core::Result<std::shared_ptr<EventStore>> Open(const core::StorageConfig& config);

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    /**
     * @brief Hand out the write handle; fails while another writer is alive
     */
    core::Result<StoreWriter> acquire_writer();

    StoreReader reader() const;

    StoreStats stats() const;
    const core::StorageConfig& config() const { return config_; }

private:
    friend class StoreWriter;
    friend class StoreReader;

    using TimeKey = std::pair<core::Timestamp, core::EventID>;
    using ComponentKey = std::tuple<uint8_t, core::Timestamp, core::EventID>;

    explicit EventStore(const core::StorageConfig& config);

    void apply_frame(DecodedFrame&& frame);
    void insert_locked(const core::LatencyEvent& event);
    bool erase_locked(core::EventID id);

    core::Result<size_t> commit(const std::vector<core::LatencyEvent>& events);
    core::Result<uint64_t> delete_older_than(core::Timestamp cutoff);
    core::Result<uint64_t> evict_to_count(size_t max_count);
    core::Result<bool> maybe_compact();
    core::Result<void> compact();

    // Callers hold write_mutex_
    core::Result<uint64_t> delete_ids_locked(const std::vector<core::EventID>& ids);
    core::Result<void> compact_locked();

    /**
     * @brief Visit events of the window in (timestamp, id) order under the shared lock
     *
     * The lock is dropped every scan_chunk_size rows and after_chunk runs
     * unlocked. visit returns false to stop.
     */
    void scan_window(const core::TimeWindow& window,
                     std::optional<core::Component> component,
                     const std::function<bool(const core::LatencyEvent&)>& visit,
                     const std::function<void()>& after_chunk) const;

    core::StorageConfig config_;
    std::unique_ptr<EventLog> log_;
    std::atomic<bool> writer_acquired_{false};
    std::atomic<uint64_t> file_bytes_{0};

    // Serializes log mutations; readers never take it
    std::mutex write_mutex_;

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<core::EventID, core::LatencyEvent> rows_;
    std::set<TimeKey> time_index_;
    std::set<ComponentKey> component_index_;
    core::EventID next_id_;
    uint64_t deleted_rows_;
    uint64_t compactions_;
};

} // namespace storage
} // namespace latmon

#endif // LATMON_STORAGE_EVENT_STORE_H_
