#include "latmon/query/query_service.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

namespace latmon {
namespace query {

namespace {

constexpr auto kStatusWindow = std::chrono::hours(1);

template <typename T>
core::Result<T> QueryFailure(const std::string& message) {
    return core::Result<T>::error(message, core::Error::Code::QUERY_FAILURE);
}

} // namespace

QueryService::QueryService(storage::StoreReader reader,
                           std::shared_ptr<const core::PipelineCounters> counters,
                           const core::AggregationConfig& aggregation,
                           const core::ServerConfig& limits,
                           std::shared_ptr<const SystemResourceProvider> resources)
    : reader_(reader),
      counters_(std::move(counters)),
      aggregator_(reader, aggregation),
      limits_(limits),
      resources_(std::move(resources)),
      started_at_(std::chrono::steady_clock::now()) {
    if (!counters_) {
        throw core::InvalidArgumentError("Query service needs pipeline counters");
    }
}

core::Result<core::Component> QueryService::ParseComponentName(const std::string& name) {
    auto component = core::ParseComponent(name);
    if (!component) {
        return QueryFailure<core::Component>("Unknown component '" + name + "'");
    }
    return core::Result<core::Component>(*component);
}

core::Result<void> QueryService::check_window(const core::TimeWindow& window) const {
    if (!window.valid()) {
        return core::Result<void>::error("Invalid window [" + std::to_string(window.start) + ", " +
                                         std::to_string(window.end) + "): start must be >= 0 and before end",
                                         core::Error::Code::QUERY_FAILURE);
    }
    return core::Result<void>();
}

core::Result<std::vector<core::LatencyEvent>> QueryService::raw_events(size_t limit,
                                                                       std::optional<core::Component> component) const {
    if (limit < 1 || limit > limits_.max_raw_events) {
        return QueryFailure<std::vector<core::LatencyEvent>>(
            "limit must be between 1 and " + std::to_string(limits_.max_raw_events) +
            ", got " + std::to_string(limit));
    }
    return core::Result<std::vector<core::LatencyEvent>>(reader_.recent(limit, component));
}

core::Result<core::AggregateSnapshot> QueryService::summary(const core::TimeWindow& window,
                                                            std::optional<core::Component> component) const {
    auto valid = check_window(window);
    if (!valid.ok()) {
        return QueryFailure<core::AggregateSnapshot>(valid.error());
    }
    try {
        return core::Result<core::AggregateSnapshot>(aggregator_.summarize(window, component));
    } catch (const std::exception& e) {
        LATMON_ERROR("Summary failed: {}", e.what());
        return core::Result<core::AggregateSnapshot>::error(std::string("Summary failed: ") + e.what(),
                                                            core::Error::Code::INTERNAL);
    }
}

core::Result<std::vector<core::AggregateSnapshot>> QueryService::summary_by_component(
    const core::TimeWindow& window) const {
    auto valid = check_window(window);
    if (!valid.ok()) {
        return QueryFailure<std::vector<core::AggregateSnapshot>>(valid.error());
    }
    try {
        return core::Result<std::vector<core::AggregateSnapshot>>(aggregator_.summarize_by_component(window));
    } catch (const std::exception& e) {
        LATMON_ERROR("Per-component summary failed: {}", e.what());
        return core::Result<std::vector<core::AggregateSnapshot>>::error(
            std::string("Per-component summary failed: ") + e.what(), core::Error::Code::INTERNAL);
    }
}

uint64_t QueryService::dropped_count() const {
    return counters_->events_dropped.load();
}

core::PipelineCountersSnapshot QueryService::counters() const {
    return counters_->snapshot();
}

HealthReport QueryService::health() const {
    auto snap = counters_->snapshot();
    HealthReport report;
    report.writer_running = snap.writer_running;
    report.consecutive_commit_failures = snap.consecutive_commit_failures;
    report.batches_lost = snap.batches_lost;
    report.last_commit_age = snap.last_commit_age;
    report.ok = snap.writer_running && snap.consecutive_commit_failures == 0;
    return report;
}

core::Result<std::vector<core::LatencyEvent>> QueryService::export_range(
    const core::TimeWindow& window, std::optional<core::Component> component) const {
    auto valid = check_window(window);
    if (!valid.ok()) {
        return QueryFailure<std::vector<core::LatencyEvent>>(valid.error());
    }

    // One extra row tells a full window apart from an oversized one
    auto events = reader_.range(window, component, limits_.max_export_events + 1);
    if (events.size() > limits_.max_export_events) {
        return QueryFailure<std::vector<core::LatencyEvent>>(
            "Window holds more than " + std::to_string(limits_.max_export_events) +
            " events, narrow it");
    }
    return core::Result<std::vector<core::LatencyEvent>>(std::move(events));
}

core::Result<StatusReport> QueryService::status() const {
    StatusReport report;
    report.total_events = reader_.total_count();
    report.newest_event = reader_.newest_timestamp();
    report.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);
    report.store = reader_.stats();
    report.counters = counters_->snapshot();

    auto last_hour = summary_by_component(core::TimeWindow::Last(kStatusWindow));
    if (!last_hour.ok()) {
        return core::Result<StatusReport>::error(last_hour.error(), last_hour.error_code());
    }
    report.last_hour = last_hour.take_value();
    return core::Result<StatusReport>(std::move(report));
}

core::Result<SystemResources> QueryService::system_resources() const {
    if (!resources_) {
        return QueryFailure<SystemResources>("No system resource provider configured");
    }
    return resources_->sample();
}

} // namespace query
} // namespace latmon
