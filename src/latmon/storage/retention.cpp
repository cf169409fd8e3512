#include "latmon/storage/retention.h"
#include "latmon/common/logger.h"

#include <limits>

namespace latmon {
namespace storage {

core::Timestamp AgeCutoff(core::Timestamp now, std::chrono::seconds max_age) {
    constexpr int64_t kUsPerSecond = 1000000;
    if (max_age.count() <= 0) {
        return std::numeric_limits<core::Timestamp>::max();
    }
    if (max_age.count() > std::numeric_limits<int64_t>::max() / kUsPerSecond) {
        return std::numeric_limits<core::Timestamp>::min();
    }
    int64_t max_age_us = max_age.count() * kUsPerSecond;
    if (now < std::numeric_limits<core::Timestamp>::min() + max_age_us) {
        return std::numeric_limits<core::Timestamp>::min();
    }
    return now - max_age_us + 1;
}

core::Result<RetentionReport> ApplyRetention(EventSink& sink,
                                             const core::RetentionPolicy& policy,
                                             core::Timestamp now) {
    RetentionReport report;

    if (policy.max_age) {
        auto deleted = sink.delete_older_than(AgeCutoff(now, *policy.max_age));
        if (!deleted.ok()) {
            return core::Result<RetentionReport>::error("Age retention failed: " + deleted.error(),
                                                        core::Error::Code::RETENTION_FAILURE);
        }
        report.expired_by_age = deleted.value();
    }

    if (policy.max_count) {
        auto evicted = sink.evict_to_count(*policy.max_count);
        if (!evicted.ok()) {
            return core::Result<RetentionReport>::error("Count retention failed: " + evicted.error(),
                                                        core::Error::Code::RETENTION_FAILURE);
        }
        report.evicted_by_count = evicted.value();
    }

    auto compacted = sink.maybe_compact();
    if (!compacted.ok()) {
        return core::Result<RetentionReport>::error("Compaction failed: " + compacted.error(),
                                                    core::Error::Code::RETENTION_FAILURE);
    }
    report.compacted = compacted.value();

    if (report.total_removed() > 0) {
        LATMON_INFO("Retention removed {} events ({} by age, {} by count){}",
                    report.total_removed(), report.expired_by_age, report.evicted_by_count,
                    report.compacted ? ", store compacted" : "");
    }
    return core::Result<RetentionReport>(report);
}

} // namespace storage
} // namespace latmon
