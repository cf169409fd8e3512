#include "latmon/core/types.h"
#include "latmon/core/error.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace latmon {
namespace core {

const char* ComponentName(Component component) {
    switch (component) {
        case Component::EDITOR: return "editor";
        case Component::EDITOR_EXTENSION: return "editor_extension";
        case Component::MODEL: return "model";
        case Component::TERMINAL: return "terminal";
        case Component::FILE_SYSTEM: return "file_system";
        case Component::NETWORK: return "network";
        case Component::SYSTEM: return "system";
    }
    return "unknown";
}

const char* ComponentDisplayName(Component component) {
    switch (component) {
        case Component::EDITOR: return "Editor";
        case Component::EDITOR_EXTENSION: return "Editor Extension";
        case Component::MODEL: return "Model";
        case Component::TERMINAL: return "Terminal";
        case Component::FILE_SYSTEM: return "File System";
        case Component::NETWORK: return "Network";
        case Component::SYSTEM: return "System";
    }
    return "Unknown";
}

std::optional<Component> ParseComponent(const std::string& name) {
    for (Component c : AllComponents()) {
        if (name == ComponentName(c)) {
            return c;
        }
    }
    return std::nullopt;
}

std::optional<Component> ComponentFromIndex(uint8_t index) {
    if (index >= kComponentCount) {
        return std::nullopt;
    }
    return static_cast<Component>(index);
}

const std::vector<Component>& AllComponents() {
    static const std::vector<Component> all = {
        Component::EDITOR,
        Component::EDITOR_EXTENSION,
        Component::MODEL,
        Component::TERMINAL,
        Component::FILE_SYSTEM,
        Component::NETWORK,
        Component::SYSTEM
    };
    return all;
}

LatencyEvent::LatencyEvent(Timestamp wall_timestamp,
                           Component component,
                           std::string source_label,
                           DurationUs duration_us,
                           bool success,
                           Metadata metadata)
    : id_(0),
      wall_timestamp_(wall_timestamp),
      component_(component),
      source_label_(std::move(source_label)),
      duration_us_(duration_us),
      success_(success),
      metadata_(std::move(metadata)) {
    if (duration_us_ < 0) {
        throw InvalidArgumentError("Event duration must be non-negative, got " +
                                   std::to_string(duration_us_));
    }
}

LatencyEvent LatencyEvent::with_id(EventID id) const {
    LatencyEvent copy(*this);
    copy.id_ = id;
    return copy;
}

bool LatencyEvent::operator==(const LatencyEvent& other) const {
    return id_ == other.id_ &&
           wall_timestamp_ == other.wall_timestamp_ &&
           component_ == other.component_ &&
           source_label_ == other.source_label_ &&
           duration_us_ == other.duration_us_ &&
           success_ == other.success_ &&
           metadata_ == other.metadata_;
}

TimeWindow TimeWindow::Last(std::chrono::microseconds length) {
    Timestamp now = WallNowUs();
    // +1 so that an event stamped exactly now is inside the half-open window
    return TimeWindow(std::max<Timestamp>(0, now - length.count()), now + 1);
}

TimeWindow TimeWindow::All() {
    return TimeWindow(0, std::numeric_limits<Timestamp>::max());
}

const char* StrategyName(PercentileStrategy strategy) {
    switch (strategy) {
        case PercentileStrategy::EXACT: return "exact";
        case PercentileStrategy::HISTOGRAM: return "histogram";
    }
    return "unknown";
}

bool AggregateSnapshot::operator==(const AggregateSnapshot& other) const {
    return component == other.component &&
           window_start == other.window_start &&
           window_end == other.window_end &&
           count == other.count &&
           mean_us == other.mean_us &&
           p50_us == other.p50_us &&
           p95_us == other.p95_us &&
           p99_us == other.p99_us &&
           min_us == other.min_us &&
           max_us == other.max_us &&
           success_count == other.success_count &&
           error_rate == other.error_rate &&
           events_per_second == other.events_per_second &&
           strategy == other.strategy;
}

Timestamp WallNowUs() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

size_t NearestRankIndex(double q, size_t n) {
    // epsilon keeps 0.95 * 100 at rank 95 despite binary rounding
    double rank = std::ceil(q * static_cast<double>(n) - 1e-9);
    if (rank < 1.0) {
        return 0;
    }
    if (rank >= static_cast<double>(n)) {
        return n - 1;
    }
    return static_cast<size_t>(rank) - 1;
}

} // namespace core
} // namespace latmon
