#include "latmon/capture/sampler.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

#include <chrono>

namespace latmon {
namespace capture {

namespace {

constexpr uint32_t kAllComponentsMask = (1u << core::kComponentCount) - 1;

uint32_t ComponentBit(core::Component component) {
    return 1u << static_cast<uint8_t>(component);
}

} // namespace

ClockSource ClockSource::System() {
    ClockSource clock;
    clock.monotonic_us = [] {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    };
    clock.wall_us = [] { return core::WallNowUs(); };
    return clock;
}

std::pair<core::DurationUs, bool> ClampDuration(uint64_t duration_us) {
    if (duration_us > static_cast<uint64_t>(core::kMaxDurationUs)) {
        return {core::kMaxDurationUs, true};
    }
    return {static_cast<core::DurationUs>(duration_us), false};
}

// SampleHandle

SampleHandle::SampleHandle()
    : sampler_(nullptr), component_(core::Component::SYSTEM), start_us_(0) {}

SampleHandle::SampleHandle(Sampler* sampler, core::Component component, std::string label, int64_t start_us)
    : sampler_(sampler), component_(component), label_(std::move(label)), start_us_(start_us) {}

SampleHandle::SampleHandle(SampleHandle&& other) noexcept
    : sampler_(other.sampler_),
      component_(other.component_),
      label_(std::move(other.label_)),
      start_us_(other.start_us_),
      metadata_(std::move(other.metadata_)) {
    other.sampler_ = nullptr;
}

SampleHandle& SampleHandle::operator=(SampleHandle&& other) noexcept {
    if (this != &other) {
        sampler_ = other.sampler_;
        component_ = other.component_;
        label_ = std::move(other.label_);
        start_us_ = other.start_us_;
        metadata_ = std::move(other.metadata_);
        other.sampler_ = nullptr;
    }
    return *this;
}

SampleHandle& SampleHandle::annotate(const std::string& key, const std::string& value) {
    if (sampler_) {
        metadata_[key] = value;
    }
    return *this;
}

std::optional<core::LatencyEvent> SampleHandle::end(bool success) {
    if (!sampler_) {
        return std::nullopt;
    }
    Sampler* sampler = sampler_;
    sampler_ = nullptr;
    return sampler->complete(component_, std::move(label_), start_us_, success, std::move(metadata_));
}

// Sampler

Sampler::Sampler(std::shared_ptr<ingest::IngestionBuffer> buffer,
                 std::shared_ptr<core::PipelineCounters> counters,
                 ClockSource clock)
    : buffer_(std::move(buffer)),
      counters_(std::move(counters)),
      clock_(std::move(clock)),
      admission_mask_(0) {
    if (!buffer_ || !counters_) {
        throw core::InvalidArgumentError("Sampler needs an ingestion buffer and counters");
    }
    if (!clock_.monotonic_us || !clock_.wall_us) {
        throw core::InvalidArgumentError("Sampler clock source is incomplete");
    }
}

SampleHandle Sampler::begin(core::Component component, std::string source_label) {
    if (!admits(component)) {
        return SampleHandle();
    }
    int64_t start_us;
    try {
        start_us = clock_.monotonic_us();
    } catch (const std::exception& e) {
        counters_->capture_errors++;
        LATMON_DEBUG("Monotonic clock failed at begin: {}", e.what());
        return SampleHandle();
    }
    return SampleHandle(this, component, std::move(source_label), start_us);
}

std::optional<core::LatencyEvent> Sampler::record(core::Component component,
                                                  std::string source_label,
                                                  uint64_t duration_us,
                                                  bool success,
                                                  core::Metadata metadata) {
    if (!admits(component)) {
        return std::nullopt;
    }
    return submit(component, std::move(source_label), duration_us, success, std::move(metadata));
}

void Sampler::open(const std::vector<core::Component>& filter) {
    uint32_t mask = 0;
    for (core::Component component : filter) {
        mask |= ComponentBit(component);
    }
    admission_mask_ = filter.empty() ? kAllComponentsMask : mask;
}

void Sampler::close() {
    admission_mask_ = 0;
}

bool Sampler::admits(core::Component component) const {
    return (admission_mask_.load(std::memory_order_relaxed) & ComponentBit(component)) != 0;
}

std::optional<core::LatencyEvent> Sampler::complete(core::Component component,
                                                    std::string label,
                                                    int64_t start_us,
                                                    bool success,
                                                    core::Metadata metadata) {
    int64_t end_us;
    try {
        end_us = clock_.monotonic_us();
    } catch (const std::exception& e) {
        counters_->capture_errors++;
        LATMON_DEBUG("Monotonic clock failed at end: {}", e.what());
        return std::nullopt;
    }

    if (end_us < start_us) {
        counters_->capture_errors++;
        LATMON_DEBUG("Monotonic clock went backwards for {} ({}us)", label, end_us - start_us);
        return std::nullopt;
    }
    return submit(component, std::move(label), static_cast<uint64_t>(end_us - start_us),
                  success, std::move(metadata));
}

std::optional<core::LatencyEvent> Sampler::submit(core::Component component,
                                                  std::string label,
                                                  uint64_t duration_us,
                                                  bool success,
                                                  core::Metadata metadata) {
    core::Timestamp wall;
    try {
        wall = clock_.wall_us();
    } catch (const std::exception& e) {
        counters_->capture_errors++;
        LATMON_DEBUG("Wall clock failed: {}", e.what());
        return std::nullopt;
    }

    auto clamped = ClampDuration(duration_us);
    if (clamped.second) {
        counters_->durations_clamped++;
        metadata[core::kDurationClampedKey] = "true";
        LATMON_WARN("Duration {}us for {} clamped to {}us", duration_us, label, core::kMaxDurationUs);
    }

    core::LatencyEvent event(wall, component, std::move(label), clamped.first, success, std::move(metadata));
    if (!buffer_->push(event)) {
        return std::nullopt;
    }
    return event;
}

} // namespace capture
} // namespace latmon
