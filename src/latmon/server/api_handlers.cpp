#include "latmon/server/api_handlers.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"
#include "latmon/server/json_codec.h"

#include <algorithm>
#include <charconv>
#include <limits>

namespace latmon {
namespace server {

namespace {

constexpr int64_t kDefaultWindowSeconds = 3600;
constexpr size_t kDefaultRawMetricsLimit = 1000;
constexpr size_t kTelemetryRecentEvents = 100;
constexpr int64_t kMicrosPerSecond = 1000000;

void Fail(Response& response, const std::string& message, core::Error::Code code) {
    response.status = code == core::Error::Code::QUERY_FAILURE ? 400 : 500;
    response.body = json::EncodeError(message);
    if (response.status == 500) {
        LATMON_WARN("Query failed: {}", message);
    }
}

template <typename T>
bool Failed(const core::Result<T>& result, Response& response) {
    if (result.ok()) {
        return false;
    }
    Fail(response, result.error(), result.error_code());
    return true;
}

core::Result<std::optional<int64_t>> ParseIntParam(const Request& request, const std::string& key) {
    if (!request.HasParam(key)) {
        return core::Result<std::optional<int64_t>>(std::nullopt);
    }
    std::string text = request.GetParam(key);
    int64_t value = 0;
    auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || parsed.ec != std::errc() || parsed.ptr != text.data() + text.size()) {
        return core::Result<std::optional<int64_t>>::error(
            "Parameter '" + key + "' must be an integer, got '" + text + "'",
            core::Error::Code::QUERY_FAILURE);
    }
    return core::Result<std::optional<int64_t>>(std::optional<int64_t>(value));
}

core::Result<std::optional<core::Component>> ParseComponentParam(const Request& request) {
    std::string name = request.GetParam("component");
    if (name.empty() || name == "all") {
        return core::Result<std::optional<core::Component>>(std::nullopt);
    }
    auto component = query::QueryService::ParseComponentName(name);
    if (!component.ok()) {
        return core::Result<std::optional<core::Component>>::error(component.error(), component.error_code());
    }
    return core::Result<std::optional<core::Component>>(std::optional<core::Component>(component.value()));
}

core::Result<size_t> ParseLimit(const Request& request, size_t default_limit) {
    auto limit = ParseIntParam(request, "limit");
    if (!limit.ok()) {
        return core::Result<size_t>::error(limit.error(), limit.error_code());
    }
    if (!limit.value()) {
        return core::Result<size_t>(default_limit);
    }
    if (*limit.value() < 1) {
        return core::Result<size_t>::error("limit must be positive, got " + std::to_string(*limit.value()),
                                           core::Error::Code::QUERY_FAILURE);
    }
    return core::Result<size_t>(static_cast<size_t>(*limit.value()));
}

/**
 * start/end (microseconds) take precedence; otherwise the last window_seconds.
 */
core::Result<core::TimeWindow> ParseWindow(const Request& request) {
    auto start = ParseIntParam(request, "start");
    if (!start.ok()) {
        return core::Result<core::TimeWindow>::error(start.error(), start.error_code());
    }
    auto end = ParseIntParam(request, "end");
    if (!end.ok()) {
        return core::Result<core::TimeWindow>::error(end.error(), end.error_code());
    }
    if (start.value() || end.value()) {
        core::Timestamp from = start.value().value_or(0);
        core::Timestamp to = end.value() ? *end.value() : core::WallNowUs() + 1;
        return core::Result<core::TimeWindow>(core::TimeWindow(from, to));
    }

    auto seconds = ParseIntParam(request, "window_seconds");
    if (!seconds.ok()) {
        return core::Result<core::TimeWindow>::error(seconds.error(), seconds.error_code());
    }
    int64_t length = seconds.value().value_or(kDefaultWindowSeconds);
    if (length <= 0 || length > std::numeric_limits<int64_t>::max() / kMicrosPerSecond) {
        return core::Result<core::TimeWindow>::error(
            "window_seconds must be positive, got " + std::to_string(length),
            core::Error::Code::QUERY_FAILURE);
    }
    return core::Result<core::TimeWindow>(
        core::TimeWindow::Last(std::chrono::microseconds(length * kMicrosPerSecond)));
}

} // namespace

ApiHandlers::ApiHandlers(std::shared_ptr<const query::QueryService> queries)
    : queries_(std::move(queries)) {
    if (!queries_) {
        throw core::InvalidArgumentError("API handlers need a query service");
    }
}

void ApiHandlers::Register(HttpServer& server) const {
    auto bind = [this](void (ApiHandlers::*method)(const Request&, Response&) const) {
        return [this, method](const Request& request, Response& response) {
            (this->*method)(request, response);
        };
    };
    server.RegisterHandler("/health", bind(&ApiHandlers::HandleHealth));
    server.RegisterHandler("/api/events", bind(&ApiHandlers::HandleEvents));
    server.RegisterHandler("/api/metrics/raw", bind(&ApiHandlers::HandleRawMetrics));
    server.RegisterHandler("/api/metrics/summary", bind(&ApiHandlers::HandleSummary));
    server.RegisterHandler("/api/system/resources", bind(&ApiHandlers::HandleSystemResources));
    server.RegisterHandler("/api/monitoring/status", bind(&ApiHandlers::HandleStatus));
    server.RegisterHandler("/api/export", bind(&ApiHandlers::HandleExport));
    server.RegisterHandler("/api/telemetry", bind(&ApiHandlers::HandleTelemetry));
}

void ApiHandlers::HandleHealth(const Request&, Response& response) const {
    auto health = queries_->health();
    response.status = health.ok ? 200 : 503;
    response.body = json::EncodeHealth(health);
}

void ApiHandlers::HandleEvents(const Request& request, Response& response) const {
    auto limit = ParseLimit(request, queries_->limits().default_raw_limit);
    if (Failed(limit, response)) {
        return;
    }
    auto component = ParseComponentParam(request);
    if (Failed(component, response)) {
        return;
    }
    auto events = queries_->raw_events(limit.value(), component.value());
    if (Failed(events, response)) {
        return;
    }
    response.body = json::EncodeEvents(events.value(), "events");
}

void ApiHandlers::HandleRawMetrics(const Request& request, Response& response) const {
    size_t default_limit = std::min(kDefaultRawMetricsLimit, queries_->limits().max_raw_events);
    auto limit = ParseLimit(request, default_limit);
    if (Failed(limit, response)) {
        return;
    }
    auto events = queries_->raw_events(limit.value());
    if (Failed(events, response)) {
        return;
    }
    response.body = json::EncodeEvents(events.value(), "raw_metrics");
}

void ApiHandlers::HandleSummary(const Request& request, Response& response) const {
    auto window = ParseWindow(request);
    if (Failed(window, response)) {
        return;
    }
    auto component = ParseComponentParam(request);
    if (Failed(component, response)) {
        return;
    }

    auto summary = queries_->summary(window.value(), component.value());
    if (Failed(summary, response)) {
        return;
    }

    std::vector<core::AggregateSnapshot> breakdown;
    if (!component.value()) {
        auto by_component = queries_->summary_by_component(window.value());
        if (Failed(by_component, response)) {
            return;
        }
        breakdown = by_component.take_value();
    }
    response.body = json::EncodeSummary(summary.value(), breakdown);
}

void ApiHandlers::HandleSystemResources(const Request&, Response& response) const {
    auto resources = queries_->system_resources();
    if (Failed(resources, response)) {
        return;
    }
    response.body = json::EncodeSystemResources(resources.value());
}

void ApiHandlers::HandleStatus(const Request&, Response& response) const {
    auto status = queries_->status();
    if (Failed(status, response)) {
        return;
    }
    response.body = json::EncodeStatus(status.value());
}

void ApiHandlers::HandleTelemetry(const Request&, Response& response) const {
    json::TelemetrySnapshot telemetry;

    auto status = queries_->status();
    if (Failed(status, response)) {
        return;
    }
    telemetry.status = status.take_value();

    auto recent = queries_->raw_events(std::min(kTelemetryRecentEvents, queries_->limits().max_raw_events));
    if (Failed(recent, response)) {
        return;
    }
    telemetry.recent_events = recent.take_value();

    auto summary = queries_->summary(
        core::TimeWindow::Last(std::chrono::microseconds(kDefaultWindowSeconds * kMicrosPerSecond)));
    if (Failed(summary, response)) {
        return;
    }
    telemetry.summary = summary.take_value();

    // Host sampling is optional here; its own route reports the failure
    auto resources = queries_->system_resources();
    if (resources.ok()) {
        telemetry.resources = resources.take_value();
    } else {
        LATMON_DEBUG("Telemetry without system resources: {}", resources.error());
    }

    response.body = json::EncodeTelemetry(telemetry);
}

void ApiHandlers::HandleExport(const Request& request, Response& response) const {
    auto start = ParseIntParam(request, "start");
    if (Failed(start, response)) {
        return;
    }
    auto end = ParseIntParam(request, "end");
    if (Failed(end, response)) {
        return;
    }
    auto component = ParseComponentParam(request);
    if (Failed(component, response)) {
        return;
    }

    core::TimeWindow window(start.value().value_or(0),
                            end.value() ? *end.value() : core::WallNowUs() + 1);
    auto events = queries_->export_range(window, component.value());
    if (Failed(events, response)) {
        return;
    }
    response.body = json::EncodeExport(window, component.value(), events.value());
}

} // namespace server
} // namespace latmon
