#ifndef LATMON_STORAGE_RETENTION_H_
#define LATMON_STORAGE_RETENTION_H_

#include <cstdint>

#include "latmon/core/config.h"
#include "latmon/core/result.h"
#include "latmon/core/types.h"
#include "latmon/storage/event_sink.h"

namespace latmon {
namespace storage {

struct RetentionReport {
    uint64_t expired_by_age = 0;
    uint64_t evicted_by_count = 0;
    bool compacted = false;

    uint64_t total_removed() const { return expired_by_age + evicted_by_count; }
};

/**
 * @brief Oldest wall timestamp that survives the age rule at `now`
 *
 * An event is expired when now - wall_timestamp >= max_age, so everything
 * strictly below the returned cutoff goes. A max_age of zero expires every
 * row, including rows stamped after `now`. A max_age reaching before the
 * earliest representable timestamp expires nothing.
 */
core::Timestamp AgeCutoff(core::Timestamp now, std::chrono::seconds max_age);

/**
 * @brief Apply the age rule, then the count rule, then compact if worthwhile
 *
 * Fails with RETENTION_FAILURE on the first failing step; steps that already
 * succeeded stay applied.
 */
core::Result<RetentionReport> ApplyRetention(EventSink& sink,
                                             const core::RetentionPolicy& policy,
                                             core::Timestamp now);

} // namespace storage
} // namespace latmon

#endif // LATMON_STORAGE_RETENTION_H_
