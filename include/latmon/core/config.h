#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "latmon/config.h"
#include "latmon/core/result.h"
#include "latmon/core/types.h"

namespace latmon {
namespace core {

/**
 * @brief Configuration for the bounded ingestion buffer
 */
struct BufferConfig {
    size_t capacity;        // Maximum buffered-but-uncommitted events

    BufferConfig() : capacity(10000) {}

    static BufferConfig Default() {
        BufferConfig config;
        config.capacity = 10000;
        return config;
    }
};

/**
 * @brief Configuration for the batch writer
 */
struct WriterConfig {
    size_t batch_size;                           // Drain as soon as this many events are buffered
    std::chrono::milliseconds flush_interval;    // ...or when this much time has passed
    uint32_t max_commit_retries;                 // Retries per batch before it goes to recovery
    std::chrono::milliseconds initial_backoff;   // First retry delay, doubled per attempt
    std::chrono::milliseconds max_backoff;       // Backoff ceiling
    size_t recovery_capacity;                    // Failed batches kept for later cycles
    uint32_t max_recovery_rounds;                // Cycles a failed batch may be retried before it is discarded

    WriterConfig() : batch_size(500),
                     flush_interval(std::chrono::milliseconds(250)),
                     max_commit_retries(3),
                     initial_backoff(std::chrono::milliseconds(10)),
                     max_backoff(std::chrono::milliseconds(1000)),
                     recovery_capacity(8),
                     max_recovery_rounds(3) {}

    static WriterConfig Default() {
        return WriterConfig();
    }
};

/**
 * @brief Age and/or count bound on stored events
 */
struct RetentionPolicy {
    std::optional<std::chrono::seconds> max_age;   // Events at least this old are deleted
    std::optional<size_t> max_count;               // Oldest rows evicted beyond this count
    std::chrono::milliseconds interval;            // Enforcement period

    RetentionPolicy() : interval(std::chrono::milliseconds(60000)) {}

    bool enabled() const { return max_age.has_value() || max_count.has_value(); }

    static RetentionPolicy Default() {
        RetentionPolicy policy;
        policy.max_age = std::chrono::hours(24 * 30);   // 30 days
        policy.interval = std::chrono::milliseconds(60000);
        return policy;
    }
};

/**
 * @brief Configuration for the durable event store
 */
struct StorageConfig {
    std::string path;                  // Store file
    bool sync_on_commit;               // fsync after every frame
    double compaction_garbage_ratio;   // Rewrite when deleted rows exceed this share of live rows
    size_t scan_chunk_size;            // Rows copied per shared-lock acquisition

    StorageConfig() : sync_on_commit(true), compaction_garbage_ratio(0.5), scan_chunk_size(4096) {}

    static StorageConfig Default() {
        StorageConfig config;
        config.path = "data/latency_events.lmlog";
        config.sync_on_commit = true;
        config.compaction_garbage_ratio = 0.5;
        config.scan_chunk_size = 4096;
        return config;
    }
};

/**
 * @brief Configuration for windowed aggregation
 */
struct AggregationConfig {
    uint64_t exact_threshold;          // Rows above this use the histogram strategy
    double histogram_growth_factor;    // Ratio between consecutive histogram bounds
    DurationUs histogram_max_us;       // Largest finite histogram bound

    AggregationConfig() : exact_threshold(1000000), histogram_growth_factor(1.05),
                          histogram_max_us(kMaxDurationUs) {}

    static AggregationConfig Default() {
        return AggregationConfig();
    }
};

/**
 * @brief Configuration for the read-only HTTP surface
 */
struct ServerConfig {
    bool enabled;
    std::string listen_address;
    uint16_t port;
    int timeout_seconds;
    size_t max_connections;
    size_t default_raw_limit;     // limit used when a request gives none
    size_t max_raw_events;        // upper bound on raw_events limit
    size_t max_export_events;     // upper bound on one export

    ServerConfig() : enabled(true), listen_address("0.0.0.0"), port(LATMON_DEFAULT_HTTP_PORT), timeout_seconds(30),
                     max_connections(1000), default_raw_limit(50), max_raw_events(10000),
                     max_export_events(1000000) {}

    static ServerConfig Default() {
        return ServerConfig();
    }
};

/**
 * @brief Top-level configuration of the monitoring pipeline
 */
struct MonitorConfig {
    StorageConfig storage;
    BufferConfig buffer;
    WriterConfig writer;
    RetentionPolicy retention;
    AggregationConfig aggregation;
    ServerConfig server;
    std::string log_level;

    MonitorConfig() : storage(StorageConfig::Default()),
                      buffer(BufferConfig::Default()),
                      writer(WriterConfig::Default()),
                      retention(RetentionPolicy::Default()),
                      aggregation(AggregationConfig::Default()),
                      server(ServerConfig::Default()),
                      log_level("info") {}

    static MonitorConfig Default() {
        return MonitorConfig();
    }

    /**
     * @brief Load a JSON config file; a missing file yields defaults and is written out
     */
    static Result<MonitorConfig> LoadFromFile(const std::string& path);

    /**
     * @brief Parse a JSON document, missing keys keep their defaults
     */
    static Result<MonitorConfig> FromJson(const std::string& json);

    std::string ToJson() const;
    Result<void> SaveToFile(const std::string& path) const;
    Result<void> Validate() const;
};

} // namespace core
} // namespace latmon
