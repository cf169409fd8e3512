#ifndef LATMON_CORE_TYPES_H_
#define LATMON_CORE_TYPES_H_

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace latmon {
namespace core {

/**
 * @brief Wall-clock timestamp in microseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Duration in microseconds, always measured on the monotonic clock
 */
using DurationUs = int64_t;

/**
 * @brief Identifier assigned to an event when it is committed (0 = uncommitted)
 */
using EventID = int64_t;

/**
 * @brief Free-form key/value annotations attached to an event
 */
using Metadata = std::map<std::string, std::string>;

// Durations above one year are clamped to this ceiling and flagged.
constexpr DurationUs kMaxDurationUs = 365LL * 24 * 3600 * 1000000;

constexpr const char* kDurationClampedKey = "duration_clamped";

/**
 * @brief Measured subsystem
 */
enum class Component : uint8_t {
    EDITOR = 0,
    EDITOR_EXTENSION = 1,
    MODEL = 2,
    TERMINAL = 3,
    FILE_SYSTEM = 4,
    NETWORK = 5,
    SYSTEM = 6
};

constexpr size_t kComponentCount = 7;

/** @brief Stable lower-case name used on the wire and in config files */
const char* ComponentName(Component component);
/** @brief Human readable name, e.g. "Editor Extension" */
const char* ComponentDisplayName(Component component);
std::optional<Component> ParseComponent(const std::string& name);
std::optional<Component> ComponentFromIndex(uint8_t index);
const std::vector<Component>& AllComponents();

/**
 * @brief Immutable record of one timed operation
 */
class LatencyEvent {
public:
    /**
     * @throws InvalidArgumentError if duration_us is negative
     */
    LatencyEvent(Timestamp wall_timestamp,
                 Component component,
                 std::string source_label,
                 DurationUs duration_us,
                 bool success,
                 Metadata metadata = {});

    EventID id() const { return id_; }
    bool committed() const { return id_ > 0; }
    Timestamp wall_timestamp() const { return wall_timestamp_; }
    Component component() const { return component_; }
    const std::string& source_label() const { return source_label_; }
    DurationUs duration_us() const { return duration_us_; }
    bool success() const { return success_; }
    const Metadata& metadata() const { return metadata_; }

    /** @brief Copy of this event carrying the committed id */
    LatencyEvent with_id(EventID id) const;

    bool operator==(const LatencyEvent& other) const;
    bool operator!=(const LatencyEvent& other) const { return !(*this == other); }

private:
    EventID id_;
    Timestamp wall_timestamp_;
    Component component_;
    std::string source_label_;
    DurationUs duration_us_;
    bool success_;
    Metadata metadata_;
};

/**
 * @brief Half-open wall-clock window [start, end) in microseconds
 */
struct TimeWindow {
    Timestamp start;
    Timestamp end;

    TimeWindow(Timestamp s, Timestamp e) : start(s), end(e) {}

    bool contains(Timestamp ts) const { return ts >= start && ts < end; }
    bool valid() const { return start >= 0 && start < end; }
    DurationUs length() const { return end - start; }

    /** @brief Window of the given length ending now */
    static TimeWindow Last(std::chrono::microseconds length);
    /** @brief Window covering all representable timestamps */
    static TimeWindow All();
};

enum class PercentileStrategy : uint8_t {
    EXACT,
    HISTOGRAM
};

const char* StrategyName(PercentileStrategy strategy);

/**
 * @brief Windowed statistics; every field except count is undefined when count == 0
 */
struct AggregateSnapshot {
    std::optional<Component> component;  // nullopt = all components
    Timestamp window_start = 0;
    Timestamp window_end = 0;
    uint64_t count = 0;
    double mean_us = 0.0;
    DurationUs p50_us = 0;
    DurationUs p95_us = 0;
    DurationUs p99_us = 0;
    DurationUs min_us = 0;
    DurationUs max_us = 0;
    uint64_t success_count = 0;
    double error_rate = 0.0;
    double events_per_second = 0.0;
    PercentileStrategy strategy = PercentileStrategy::EXACT;

    bool valid() const { return count > 0; }

    bool operator==(const AggregateSnapshot& other) const;
};

Timestamp WallNowUs();

/**
 * @brief Zero-based nearest-rank index of quantile q in n ascending samples
 *
 * ceil(q * n) - 1 clamped to [0, n - 1]; requires n > 0.
 */
size_t NearestRankIndex(double q, size_t n);

} // namespace core
} // namespace latmon

#endif // LATMON_CORE_TYPES_H_
