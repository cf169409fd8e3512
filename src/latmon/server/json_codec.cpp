#include "latmon/server/json_codec.h"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace latmon {
namespace server {
namespace json {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteString(JsonWriter& writer, const char* key, const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void WriteOk(JsonWriter& writer) {
    WriteString(writer, "status", "ok");
    writer.Key("timestamp_us");
    writer.Int64(core::WallNowUs());
}

void WriteComponent(JsonWriter& writer, std::optional<core::Component> component) {
    WriteString(writer, "component", component ? core::ComponentName(*component) : "all");
}

void WriteEvent(JsonWriter& writer, const core::LatencyEvent& event) {
    writer.StartObject();
    writer.Key("id");
    writer.Int64(event.id());
    writer.Key("wall_timestamp_us");
    writer.Int64(event.wall_timestamp());
    WriteComponent(writer, event.component());
    WriteString(writer, "component_name", core::ComponentDisplayName(event.component()));
    WriteString(writer, "source_label", event.source_label());
    writer.Key("duration_us");
    writer.Int64(event.duration_us());
    writer.Key("duration_ms");
    writer.Double(static_cast<double>(event.duration_us()) / 1000.0);
    writer.Key("success");
    writer.Bool(event.success());
    writer.Key("metadata");
    writer.StartObject();
    for (const auto& [key, value] : event.metadata()) {
        writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
    }
    writer.EndObject();
    writer.EndObject();
}

void WriteSnapshot(JsonWriter& writer, const core::AggregateSnapshot& snapshot) {
    writer.StartObject();
    WriteComponent(writer, snapshot.component);
    writer.Key("window_start_us");
    writer.Int64(snapshot.window_start);
    writer.Key("window_end_us");
    writer.Int64(snapshot.window_end);
    writer.Key("count");
    writer.Uint64(snapshot.count);
    WriteString(writer, "strategy", core::StrategyName(snapshot.strategy));
    if (snapshot.valid()) {
        writer.Key("mean_us");
        writer.Double(snapshot.mean_us);
        writer.Key("p50_us");
        writer.Int64(snapshot.p50_us);
        writer.Key("p95_us");
        writer.Int64(snapshot.p95_us);
        writer.Key("p99_us");
        writer.Int64(snapshot.p99_us);
        writer.Key("min_us");
        writer.Int64(snapshot.min_us);
        writer.Key("max_us");
        writer.Int64(snapshot.max_us);
        writer.Key("success_count");
        writer.Uint64(snapshot.success_count);
        writer.Key("error_rate");
        writer.Double(snapshot.error_rate);
        writer.Key("events_per_second");
        writer.Double(snapshot.events_per_second);
    }
    writer.EndObject();
}

void WriteCounters(JsonWriter& writer, const core::PipelineCountersSnapshot& counters) {
    writer.StartObject();
    writer.Key("events_submitted");
    writer.Uint64(counters.events_submitted);
    writer.Key("events_accepted");
    writer.Uint64(counters.accepted());
    writer.Key("events_dropped");
    writer.Uint64(counters.events_dropped);
    writer.Key("events_committed");
    writer.Uint64(counters.events_committed);
    writer.Key("batches_committed");
    writer.Uint64(counters.batches_committed);
    writer.Key("capture_errors");
    writer.Uint64(counters.capture_errors);
    writer.Key("durations_clamped");
    writer.Uint64(counters.durations_clamped);
    writer.Key("commit_failures");
    writer.Uint64(counters.commit_failures);
    writer.Key("commit_retries");
    writer.Uint64(counters.commit_retries);
    writer.Key("batches_lost");
    writer.Uint64(counters.batches_lost);
    writer.Key("events_lost");
    writer.Uint64(counters.events_lost);
    writer.Key("retention_runs");
    writer.Uint64(counters.retention_runs);
    writer.Key("retention_failures");
    writer.Uint64(counters.retention_failures);
    writer.Key("events_expired");
    writer.Uint64(counters.events_expired);
    writer.EndObject();
}

void WriteOptionalMillis(JsonWriter& writer, const char* key,
                         const std::optional<std::chrono::milliseconds>& value) {
    writer.Key(key);
    if (value) {
        writer.Int64(value->count());
    } else {
        writer.Null();
    }
}

// Status body members, shared by the status and telemetry documents
void WriteStatusFields(JsonWriter& writer, const query::StatusReport& status) {
    writer.Key("total_events");
    writer.Uint64(status.total_events);
    writer.Key("newest_event_us");
    if (status.newest_event) {
        writer.Int64(*status.newest_event);
    } else {
        writer.Null();
    }
    writer.Key("uptime_seconds");
    writer.Int64(status.uptime.count());

    writer.Key("store");
    writer.StartObject();
    writer.Key("live_events");
    writer.Uint64(status.store.live_events);
    writer.Key("deleted_rows");
    writer.Uint64(status.store.deleted_rows);
    writer.Key("next_id");
    writer.Int64(status.store.next_id);
    writer.Key("file_bytes");
    writer.Uint64(status.store.file_bytes);
    writer.Key("compactions");
    writer.Uint64(status.store.compactions);
    writer.EndObject();

    writer.Key("counters");
    WriteCounters(writer, status.counters);
    writer.Key("writer_running");
    writer.Bool(status.counters.writer_running);
    WriteOptionalMillis(writer, "last_commit_age_ms", status.counters.last_commit_age);

    writer.Key("last_hour");
    writer.StartArray();
    for (const auto& snapshot : status.last_hour) {
        WriteSnapshot(writer, snapshot);
    }
    writer.EndArray();
}

void WriteResources(JsonWriter& writer, const query::SystemResources& resources) {
    writer.StartObject();

    writer.Key("memory");
    writer.StartObject();
    writer.Key("total");
    writer.Uint64(resources.memory_total_bytes);
    writer.Key("used");
    writer.Uint64(resources.memory_used_bytes);
    writer.Key("available");
    writer.Uint64(resources.memory_available_bytes);
    writer.EndObject();

    writer.Key("cpu");
    writer.StartObject();
    writer.Key("cpu_count");
    writer.Uint(resources.cpu_count);
    writer.EndObject();

    writer.Key("load_average");
    writer.StartObject();
    writer.Key("one_minute");
    writer.Double(resources.load_one);
    writer.Key("five_minutes");
    writer.Double(resources.load_five);
    writer.Key("fifteen_minutes");
    writer.Double(resources.load_fifteen);
    writer.EndObject();

    writer.Key("processes");
    writer.Uint64(resources.processes);
    writer.Key("uptime");
    writer.Uint64(resources.uptime_seconds);
    writer.Key("sampled_at_us");
    writer.Int64(resources.sampled_at);

    writer.EndObject();
}

} // namespace

std::string EncodeError(const std::string& message) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteString(writer, "status", "error");
    WriteString(writer, "error", message);
    writer.EndObject();
    return buffer.GetString();
}

std::string EncodeEvents(const std::vector<core::LatencyEvent>& events, const std::string& key) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteOk(writer);
    writer.Key("count");
    writer.Uint64(events.size());
    writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
    writer.StartArray();
    for (const auto& event : events) {
        WriteEvent(writer, event);
    }
    writer.EndArray();
    writer.EndObject();
    return buffer.GetString();
}

std::string EncodeSummary(const core::AggregateSnapshot& summary,
                          const std::vector<core::AggregateSnapshot>& by_component) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteOk(writer);
    writer.Key("summary");
    WriteSnapshot(writer, summary);
    if (!by_component.empty()) {
        writer.Key("components");
        writer.StartArray();
        for (const auto& snapshot : by_component) {
            WriteSnapshot(writer, snapshot);
        }
        writer.EndArray();
    }
    writer.EndObject();
    return buffer.GetString();
}

std::string EncodeHealth(const query::HealthReport& health) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteString(writer, "status", health.ok ? "healthy" : "degraded");
    writer.Key("ok");
    writer.Bool(health.ok);
    writer.Key("writer_running");
    writer.Bool(health.writer_running);
    writer.Key("consecutive_commit_failures");
    writer.Uint64(health.consecutive_commit_failures);
    writer.Key("batches_lost");
    writer.Uint64(health.batches_lost);
    WriteOptionalMillis(writer, "last_commit_age_ms", health.last_commit_age);
    writer.Key("timestamp_us");
    writer.Int64(core::WallNowUs());
    writer.EndObject();
    return buffer.GetString();
}

std::string EncodeStatus(const query::StatusReport& status) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteOk(writer);
    WriteStatusFields(writer, status);
    writer.EndObject();
    return buffer.GetString();
}

std::string EncodeSystemResources(const query::SystemResources& resources) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteOk(writer);
    writer.Key("system_resources");
    WriteResources(writer, resources);
    writer.EndObject();
    return buffer.GetString();
}

std::string EncodeTelemetry(const TelemetrySnapshot& telemetry) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteOk(writer);
    WriteString(writer, "service", "latmon");

    writer.Key("system_status");
    writer.StartObject();
    WriteStatusFields(writer, telemetry.status);
    writer.EndObject();

    writer.Key("recent_events");
    writer.StartArray();
    for (const auto& event : telemetry.recent_events) {
        WriteEvent(writer, event);
    }
    writer.EndArray();

    writer.Key("performance_metrics");
    WriteSnapshot(writer, telemetry.summary);

    writer.Key("system_resources");
    if (telemetry.resources) {
        WriteResources(writer, *telemetry.resources);
    } else {
        writer.Null();
    }
    writer.EndObject();
    return buffer.GetString();
}

std::string EncodeExport(const core::TimeWindow& window,
                         std::optional<core::Component> component,
                         const std::vector<core::LatencyEvent>& events) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteOk(writer);
    writer.Key("window_start_us");
    writer.Int64(window.start);
    writer.Key("window_end_us");
    writer.Int64(window.end);
    WriteComponent(writer, component);
    writer.Key("count");
    writer.Uint64(events.size());
    writer.Key("events");
    writer.StartArray();
    for (const auto& event : events) {
        WriteEvent(writer, event);
    }
    writer.EndArray();
    writer.EndObject();
    return buffer.GetString();
}

} // namespace json
} // namespace server
} // namespace latmon
