#ifndef LATMON_STORAGE_EVENT_SINK_H_
#define LATMON_STORAGE_EVENT_SINK_H_

#include <cstdint>
#include <vector>

#include "latmon/core/result.h"
#include "latmon/core/types.h"

namespace latmon {
namespace storage {

/**
 * @brief Write side of the event store as seen by the batch writer
 *
 * Every mutation is durable before it returns successfully and is
 * all-or-nothing: a failed call leaves the committed state unchanged.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    /**
     * @brief Commit events as one atomic batch, assigning increasing ids in order
     * @return Number of events committed
     */
    virtual core::Result<size_t> commit_batch(const std::vector<core::LatencyEvent>& events) = 0;

    /**
     * @brief Delete every committed event with wall_timestamp < cutoff
     * @return Number of events deleted
     */
    virtual core::Result<uint64_t> delete_older_than(core::Timestamp cutoff) = 0;

    /**
     * @brief Evict the oldest events (by timestamp, then id) until at most max_count remain
     * @return Number of events evicted
     */
    virtual core::Result<uint64_t> evict_to_count(size_t max_count) = 0;

    /**
     * @brief Rewrite the store without deleted rows when they exceed the garbage ratio
     * @return true if a rewrite happened
     */
    virtual core::Result<bool> maybe_compact() = 0;
};

} // namespace storage
} // namespace latmon

#endif // LATMON_STORAGE_EVENT_SINK_H_
