#ifndef LATMON_QUERY_QUERY_SERVICE_H_
#define LATMON_QUERY_QUERY_SERVICE_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "latmon/aggregation/aggregator.h"
#include "latmon/core/config.h"
#include "latmon/core/pipeline_counters.h"
#include "latmon/core/result.h"
#include "latmon/core/types.h"
#include "latmon/query/system_resources.h"
#include "latmon/storage/event_store.h"

namespace latmon {
namespace query {

struct HealthReport {
    bool ok = false;
    std::optional<std::chrono::milliseconds> last_commit_age;
    bool writer_running = false;
    uint64_t consecutive_commit_failures = 0;
    uint64_t batches_lost = 0;
};

struct StatusReport {
    uint64_t total_events = 0;
    std::optional<core::Timestamp> newest_event;
    std::chrono::seconds uptime{0};
    storage::StoreStats store;
    core::PipelineCountersSnapshot counters;
    std::vector<core::AggregateSnapshot> last_hour;   // one per component
};

/**
 * @brief Read-only view of the pipeline for operators and tooling
 *
 * Every call reads committed state only and never takes the writer's commit
 * lock. Invalid arguments come back as QUERY_FAILURE results without partial
 * data.
 */
class QueryService {
public:
    QueryService(storage::StoreReader reader,
                 std::shared_ptr<const core::PipelineCounters> counters,
                 const core::AggregationConfig& aggregation,
                 const core::ServerConfig& limits,
                 std::shared_ptr<const SystemResourceProvider> resources = nullptr);

    /**
     * @brief Most recent committed events first
     * @param limit 1..max_raw_events
     */
    core::Result<std::vector<core::LatencyEvent>> raw_events(size_t limit,
                                                             std::optional<core::Component> component = std::nullopt) const;

    core::Result<core::AggregateSnapshot> summary(const core::TimeWindow& window,
                                                  std::optional<core::Component> component = std::nullopt) const;

    core::Result<std::vector<core::AggregateSnapshot>> summary_by_component(const core::TimeWindow& window) const;

    /** @brief Events evicted from the ingestion buffer since startup */
    uint64_t dropped_count() const;

    core::PipelineCountersSnapshot counters() const;

    HealthReport health() const;

    /**
     * @brief Events of the window in ascending order
     *
     * Fails instead of truncating when the window holds more than
     * max_export_events rows.
     */
    core::Result<std::vector<core::LatencyEvent>> export_range(const core::TimeWindow& window,
                                                               std::optional<core::Component> component = std::nullopt) const;

    core::Result<StatusReport> status() const;

    core::Result<SystemResources> system_resources() const;

    /** @brief Parse a component wire name, QUERY_FAILURE when unknown */
    static core::Result<core::Component> ParseComponentName(const std::string& name);

    const core::ServerConfig& limits() const { return limits_; }

private:
    core::Result<void> check_window(const core::TimeWindow& window) const;

    storage::StoreReader reader_;
    std::shared_ptr<const core::PipelineCounters> counters_;
    aggregation::Aggregator aggregator_;
    core::ServerConfig limits_;
    std::shared_ptr<const SystemResourceProvider> resources_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace query
} // namespace latmon

#endif // LATMON_QUERY_QUERY_SERVICE_H_
