#include "latmon/core/config.h"
#include "latmon/common/logger.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace latmon {
namespace core {

namespace {

// Reads an optional member into `out`. Returns false on a type mismatch.
bool ReadUint(const rapidjson::Value& obj, const char* key, uint64_t& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsUint64()) return false;
    out = it->value.GetUint64();
    return true;
}

bool ReadDouble(const rapidjson::Value& obj, const char* key, double& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsNumber()) return false;
    out = it->value.GetDouble();
    return true;
}

bool ReadBool(const rapidjson::Value& obj, const char* key, bool& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsBool()) return false;
    out = it->value.GetBool();
    return true;
}

bool ReadString(const rapidjson::Value& obj, const char* key, std::string& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsString()) return false;
    out = it->value.GetString();
    return true;
}

template<typename Duration>
bool ReadDuration(const rapidjson::Value& obj, const char* key, Duration& out) {
    uint64_t raw = static_cast<uint64_t>(out.count());
    if (!ReadUint(obj, key, raw)) return false;
    out = Duration(static_cast<typename Duration::rep>(raw));
    return true;
}

// null clears the optional, a missing key leaves it alone
template<typename T>
bool ReadOptionalUint(const rapidjson::Value& obj, const char* key, std::optional<T>& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (it->value.IsNull()) {
        out.reset();
        return true;
    }
    if (!it->value.IsUint64()) return false;
    out = T(it->value.GetUint64());
    return true;
}

Result<MonitorConfig> FieldError(const std::string& section, const char* key) {
    return Result<MonitorConfig>::error(
        "Invalid type for config field '" + section + "." + key + "'",
        Error::Code::INVALID_ARGUMENT);
}

const rapidjson::Value* Section(const rapidjson::Document& doc, const char* name) {
    auto it = doc.FindMember(name);
    if (it == doc.MemberEnd() || !it->value.IsObject()) {
        return nullptr;
    }
    return &it->value;
}

} // namespace

Result<MonitorConfig> MonitorConfig::FromJson(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
        return Result<MonitorConfig>::error(
            std::string("Config parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
            ": " + rapidjson::GetParseError_En(doc.GetParseError()),
            Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return Result<MonitorConfig>::error("Config root must be a JSON object",
                                            Error::Code::INVALID_ARGUMENT);
    }

    MonitorConfig config = MonitorConfig::Default();

    if (!ReadString(doc, "log_level", config.log_level)) return FieldError("", "log_level");

    if (const auto* s = Section(doc, "storage")) {
        uint64_t chunk = config.storage.scan_chunk_size;
        if (!ReadString(*s, "path", config.storage.path)) return FieldError("storage", "path");
        if (!ReadBool(*s, "sync_on_commit", config.storage.sync_on_commit)) return FieldError("storage", "sync_on_commit");
        if (!ReadDouble(*s, "compaction_garbage_ratio", config.storage.compaction_garbage_ratio)) {
            return FieldError("storage", "compaction_garbage_ratio");
        }
        if (!ReadUint(*s, "scan_chunk_size", chunk)) return FieldError("storage", "scan_chunk_size");
        config.storage.scan_chunk_size = static_cast<size_t>(chunk);
    }

    if (const auto* s = Section(doc, "buffer")) {
        uint64_t capacity = config.buffer.capacity;
        if (!ReadUint(*s, "capacity", capacity)) return FieldError("buffer", "capacity");
        config.buffer.capacity = static_cast<size_t>(capacity);
    }

    if (const auto* s = Section(doc, "writer")) {
        auto& w = config.writer;
        uint64_t batch_size = w.batch_size;
        uint64_t retries = w.max_commit_retries;
        uint64_t recovery_capacity = w.recovery_capacity;
        uint64_t recovery_rounds = w.max_recovery_rounds;
        if (!ReadUint(*s, "batch_size", batch_size)) return FieldError("writer", "batch_size");
        if (!ReadDuration(*s, "flush_interval_ms", w.flush_interval)) return FieldError("writer", "flush_interval_ms");
        if (!ReadUint(*s, "max_commit_retries", retries)) return FieldError("writer", "max_commit_retries");
        if (!ReadDuration(*s, "initial_backoff_ms", w.initial_backoff)) return FieldError("writer", "initial_backoff_ms");
        if (!ReadDuration(*s, "max_backoff_ms", w.max_backoff)) return FieldError("writer", "max_backoff_ms");
        if (!ReadUint(*s, "recovery_capacity", recovery_capacity)) return FieldError("writer", "recovery_capacity");
        if (!ReadUint(*s, "max_recovery_rounds", recovery_rounds)) return FieldError("writer", "max_recovery_rounds");
        w.batch_size = static_cast<size_t>(batch_size);
        w.max_commit_retries = static_cast<uint32_t>(retries);
        w.recovery_capacity = static_cast<size_t>(recovery_capacity);
        w.max_recovery_rounds = static_cast<uint32_t>(recovery_rounds);
    }

    if (const auto* s = Section(doc, "retention")) {
        auto& r = config.retention;
        if (!ReadOptionalUint(*s, "max_age_seconds", r.max_age)) return FieldError("retention", "max_age_seconds");
        if (!ReadOptionalUint(*s, "max_count", r.max_count)) return FieldError("retention", "max_count");
        if (!ReadDuration(*s, "interval_ms", r.interval)) return FieldError("retention", "interval_ms");
    }

    if (const auto* s = Section(doc, "aggregation")) {
        auto& a = config.aggregation;
        uint64_t max_us = static_cast<uint64_t>(a.histogram_max_us);
        if (!ReadUint(*s, "exact_threshold", a.exact_threshold)) return FieldError("aggregation", "exact_threshold");
        if (!ReadDouble(*s, "histogram_growth_factor", a.histogram_growth_factor)) {
            return FieldError("aggregation", "histogram_growth_factor");
        }
        if (!ReadUint(*s, "histogram_max_us", max_us)) return FieldError("aggregation", "histogram_max_us");
        a.histogram_max_us = static_cast<DurationUs>(max_us);
    }

    if (const auto* s = Section(doc, "server")) {
        auto& srv = config.server;
        uint64_t port = srv.port;
        uint64_t timeout = static_cast<uint64_t>(srv.timeout_seconds);
        uint64_t max_connections = srv.max_connections;
        uint64_t default_raw_limit = srv.default_raw_limit;
        uint64_t max_raw = srv.max_raw_events;
        uint64_t max_export = srv.max_export_events;
        if (!ReadBool(*s, "enabled", srv.enabled)) return FieldError("server", "enabled");
        if (!ReadString(*s, "listen_address", srv.listen_address)) return FieldError("server", "listen_address");
        if (!ReadUint(*s, "port", port) || port > 65535) return FieldError("server", "port");
        if (!ReadUint(*s, "timeout_seconds", timeout)) return FieldError("server", "timeout_seconds");
        if (!ReadUint(*s, "max_connections", max_connections)) return FieldError("server", "max_connections");
        if (!ReadUint(*s, "default_raw_limit", default_raw_limit)) return FieldError("server", "default_raw_limit");
        if (!ReadUint(*s, "max_raw_events", max_raw)) return FieldError("server", "max_raw_events");
        if (!ReadUint(*s, "max_export_events", max_export)) return FieldError("server", "max_export_events");
        srv.port = static_cast<uint16_t>(port);
        srv.timeout_seconds = static_cast<int>(timeout);
        srv.max_connections = static_cast<size_t>(max_connections);
        srv.default_raw_limit = static_cast<size_t>(default_raw_limit);
        srv.max_raw_events = static_cast<size_t>(max_raw);
        srv.max_export_events = static_cast<size_t>(max_export);
    }

    return Result<MonitorConfig>(std::move(config));
}

std::string MonitorConfig::ToJson() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> json(buffer);

    json.StartObject();
    json.Key("log_level");
    json.String(log_level.c_str());

    json.Key("storage");
    json.StartObject();
    json.Key("path"); json.String(storage.path.c_str());
    json.Key("sync_on_commit"); json.Bool(storage.sync_on_commit);
    json.Key("compaction_garbage_ratio"); json.Double(storage.compaction_garbage_ratio);
    json.Key("scan_chunk_size"); json.Uint64(storage.scan_chunk_size);
    json.EndObject();

    json.Key("buffer");
    json.StartObject();
    json.Key("capacity"); json.Uint64(buffer.capacity);
    json.EndObject();

    json.Key("writer");
    json.StartObject();
    json.Key("batch_size"); json.Uint64(writer.batch_size);
    json.Key("flush_interval_ms"); json.Int64(writer.flush_interval.count());
    json.Key("max_commit_retries"); json.Uint(writer.max_commit_retries);
    json.Key("initial_backoff_ms"); json.Int64(writer.initial_backoff.count());
    json.Key("max_backoff_ms"); json.Int64(writer.max_backoff.count());
    json.Key("recovery_capacity"); json.Uint64(writer.recovery_capacity);
    json.Key("max_recovery_rounds"); json.Uint(writer.max_recovery_rounds);
    json.EndObject();

    json.Key("retention");
    json.StartObject();
    json.Key("max_age_seconds");
    if (retention.max_age) {
        json.Int64(retention.max_age->count());
    } else {
        json.Null();
    }
    json.Key("max_count");
    if (retention.max_count) {
        json.Uint64(*retention.max_count);
    } else {
        json.Null();
    }
    json.Key("interval_ms"); json.Int64(retention.interval.count());
    json.EndObject();

    json.Key("aggregation");
    json.StartObject();
    json.Key("exact_threshold"); json.Uint64(aggregation.exact_threshold);
    json.Key("histogram_growth_factor"); json.Double(aggregation.histogram_growth_factor);
    json.Key("histogram_max_us"); json.Int64(aggregation.histogram_max_us);
    json.EndObject();

    json.Key("server");
    json.StartObject();
    json.Key("enabled"); json.Bool(server.enabled);
    json.Key("listen_address"); json.String(server.listen_address.c_str());
    json.Key("port"); json.Uint(server.port);
    json.Key("timeout_seconds"); json.Int(server.timeout_seconds);
    json.Key("max_connections"); json.Uint64(server.max_connections);
    json.Key("default_raw_limit"); json.Uint64(server.default_raw_limit);
    json.Key("max_raw_events"); json.Uint64(server.max_raw_events);
    json.Key("max_export_events"); json.Uint64(server.max_export_events);
    json.EndObject();

    json.EndObject();
    return buffer.GetString();
}

Result<MonitorConfig> MonitorConfig::LoadFromFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LATMON_INFO("Config file {} not found, writing defaults", path);
        MonitorConfig config = MonitorConfig::Default();
        auto saved = config.SaveToFile(path);
        if (!saved.ok()) {
            LATMON_WARN("Could not write default config: {}", saved.error());
        }
        return Result<MonitorConfig>(std::move(config));
    }

    std::ifstream in(path);
    if (!in) {
        return Result<MonitorConfig>::error("Cannot open config file " + path,
                                            Error::Code::INVALID_ARGUMENT);
    }
    std::stringstream contents;
    contents << in.rdbuf();
    return FromJson(contents.str());
}

Result<void> MonitorConfig::SaveToFile(const std::string& path) const {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result<void>::error("Cannot create config directory " + parent.string() +
                                       ": " + ec.message(), Error::Code::INVALID_ARGUMENT);
        }
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<void>::error("Cannot write config file " + path,
                                   Error::Code::INVALID_ARGUMENT);
    }
    out << ToJson() << '\n';
    if (!out) {
        return Result<void>::error("Short write to config file " + path,
                                   Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

Result<void> MonitorConfig::Validate() const {
    auto invalid = [](const std::string& message) {
        return Result<void>::error(message, Error::Code::INVALID_ARGUMENT);
    };

    if (storage.path.empty()) return invalid("storage.path must not be empty");
    if (storage.scan_chunk_size == 0) return invalid("storage.scan_chunk_size must be positive");
    if (storage.compaction_garbage_ratio <= 0.0) return invalid("storage.compaction_garbage_ratio must be positive");
    if (buffer.capacity == 0) return invalid("buffer.capacity must be positive");
    if (writer.batch_size == 0) return invalid("writer.batch_size must be positive");
    if (writer.batch_size > buffer.capacity) return invalid("writer.batch_size must not exceed buffer.capacity");
    if (writer.flush_interval.count() <= 0) return invalid("writer.flush_interval_ms must be positive");
    if (writer.initial_backoff.count() <= 0) return invalid("writer.initial_backoff_ms must be positive");
    if (writer.max_backoff < writer.initial_backoff) return invalid("writer.max_backoff_ms must be >= initial_backoff_ms");
    if (retention.interval.count() <= 0) return invalid("retention.interval_ms must be positive");
    if (!retention.enabled()) return invalid("retention needs max_age_seconds or max_count");
    if (retention.max_age && (retention.max_age->count() < 0 ||
                              retention.max_age->count() > std::numeric_limits<int64_t>::max() / 1000000)) {
        return invalid("retention.max_age_seconds out of range");
    }
    if (aggregation.histogram_growth_factor <= 1.0) return invalid("aggregation.histogram_growth_factor must be > 1");
    if (aggregation.histogram_max_us <= 0) return invalid("aggregation.histogram_max_us must be positive");
    if (server.enabled && server.port < 1024) return invalid("server.port must be >= 1024");
    if (server.max_raw_events == 0) return invalid("server.max_raw_events must be positive");
    if (server.default_raw_limit == 0 || server.default_raw_limit > server.max_raw_events) {
        return invalid("server.default_raw_limit must be in [1, max_raw_events]");
    }
    if (server.max_export_events == 0) return invalid("server.max_export_events must be positive");
    return Result<void>();
}

} // namespace core
} // namespace latmon
