#ifndef LATMON_SERVER_JSON_CODEC_H_
#define LATMON_SERVER_JSON_CODEC_H_

#include <optional>
#include <string>
#include <vector>

#include "latmon/core/types.h"
#include "latmon/query/query_service.h"
#include "latmon/query/system_resources.h"

namespace latmon {
namespace server {

/**
 * @brief JSON bodies of the HTTP surface
 *
 * Every success body carries "status":"ok" and a "timestamp_us" stamp;
 * error bodies are {"status":"error","error":message}.
 */
namespace json {

std::string EncodeError(const std::string& message);

/**
 * @brief {"status":"ok","count":n,<key>:[event...]}
 */
std::string EncodeEvents(const std::vector<core::LatencyEvent>& events, const std::string& key);

/**
 * @brief A single window summary, plus an optional per-component breakdown
 */
std::string EncodeSummary(const core::AggregateSnapshot& summary,
                          const std::vector<core::AggregateSnapshot>& by_component);

std::string EncodeHealth(const query::HealthReport& health);

std::string EncodeStatus(const query::StatusReport& status);

std::string EncodeSystemResources(const query::SystemResources& resources);

/**
 * @brief Everything a dashboard polls, gathered into one document
 */
struct TelemetrySnapshot {
    query::StatusReport status;
    std::vector<core::LatencyEvent> recent_events;
    core::AggregateSnapshot summary;
    std::optional<query::SystemResources> resources;  // Absent when the host cannot be sampled
};

std::string EncodeTelemetry(const TelemetrySnapshot& telemetry);

/**
 * @brief Export envelope with the window and filter echoed back
 */
std::string EncodeExport(const core::TimeWindow& window,
                         std::optional<core::Component> component,
                         const std::vector<core::LatencyEvent>& events);

} // namespace json
} // namespace server
} // namespace latmon

#endif // LATMON_SERVER_JSON_CODEC_H_
