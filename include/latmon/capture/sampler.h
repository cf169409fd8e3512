#ifndef LATMON_CAPTURE_SAMPLER_H_
#define LATMON_CAPTURE_SAMPLER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "latmon/core/pipeline_counters.h"
#include "latmon/core/types.h"
#include "latmon/ingest/ingestion_buffer.h"

namespace latmon {
namespace capture {

/**
 * @brief Time sources used by the sampler
 *
 * monotonic_us feeds duration arithmetic only; wall_us only stamps the
 * completion time. Both may throw, which is reported as a capture failure.
 */
struct ClockSource {
    std::function<int64_t()> monotonic_us;
    std::function<core::Timestamp()> wall_us;

    /** @brief steady_clock and system_clock */
    static ClockSource System();
};

/**
 * @brief Clamp an externally measured duration to kMaxDurationUs
 * @return The stored duration and whether clamping happened
 */
std::pair<core::DurationUs, bool> ClampDuration(uint64_t duration_us);

class Sampler;

/**
 * @brief An in-flight measurement started by Sampler::begin
 *
 * Move-only. A handle that is destroyed without end() records nothing.
 * Must not outlive the sampler that created it.
 */
class SampleHandle {
public:
    /** @brief Inactive handle */
    SampleHandle();

    SampleHandle(SampleHandle&& other) noexcept;
    SampleHandle& operator=(SampleHandle&& other) noexcept;
    SampleHandle(const SampleHandle&) = delete;
    SampleHandle& operator=(const SampleHandle&) = delete;

    /** @brief false when admission was refused or end() already ran */
    bool active() const { return sampler_ != nullptr; }

    /** @brief Attach a metadata entry to the event; no-op on inactive handles */
    SampleHandle& annotate(const std::string& key, const std::string& value);

    /**
     * @brief Complete the measurement and hand the event to the ingestion buffer
     * @return The recorded event, or nullopt when inactive, on a capture
     * failure or when the buffer no longer accepts events
     */
    std::optional<core::LatencyEvent> end(bool success);

private:
    friend class Sampler;
    SampleHandle(Sampler* sampler, core::Component component, std::string label, int64_t start_us);

    Sampler* sampler_;
    core::Component component_;
    std::string label_;
    int64_t start_us_;
    core::Metadata metadata_;
};

/**
 * @brief Producer-side entry point of the pipeline
 *
 * Thread-safe; any number of threads may measure concurrently. The sampler
 * never waits on persistence: completed events go to the ingestion buffer.
 *
 * Usage:
 * ```
 * auto handle = sampler->begin(core::Component::MODEL, "completion");
 * ...
 * handle.annotate("model", "large").end(true);
 * ```
 */
class Sampler {
public:
    using Handle = SampleHandle;

    Sampler(std::shared_ptr<ingest::IngestionBuffer> buffer,
            std::shared_ptr<core::PipelineCounters> counters,
            ClockSource clock = ClockSource::System());

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    /**
     * @brief Start timing an operation
     * @return An inactive handle when the component is not being admitted
     * or the monotonic clock failed
     */
    Handle begin(core::Component component, std::string source_label);

    /**
     * @brief Record an externally measured duration
     *
     * Durations above kMaxDurationUs are clamped and flagged with the
     * duration_clamped metadata key.
     */
    std::optional<core::LatencyEvent> record(core::Component component,
                                             std::string source_label,
                                             uint64_t duration_us,
                                             bool success,
                                             core::Metadata metadata = {});

    /**
     * @brief Time a callable; an exception is recorded as a failure and rethrown
     */
    template <typename Fn>
    auto time(core::Component component, std::string source_label, Fn&& fn)
        -> decltype(std::forward<Fn>(fn)());

    /**
     * @brief Start admitting the given components (empty = all)
     */
    void open(const std::vector<core::Component>& filter);

    /** @brief Stop admitting; in-flight handles still complete */
    void close();

    bool admitting() const { return admission_mask_.load() != 0; }
    bool admits(core::Component component) const;

private:
    friend class SampleHandle;

    std::optional<core::LatencyEvent> complete(core::Component component,
                                               std::string label,
                                               int64_t start_us,
                                               bool success,
                                               core::Metadata metadata);
    std::optional<core::LatencyEvent> submit(core::Component component,
                                             std::string label,
                                             uint64_t duration_us,
                                             bool success,
                                             core::Metadata metadata);

    std::shared_ptr<ingest::IngestionBuffer> buffer_;
    std::shared_ptr<core::PipelineCounters> counters_;
    ClockSource clock_;
    // bit i set = component with index i is admitted
    std::atomic<uint32_t> admission_mask_;
};

template <typename Fn>
auto Sampler::time(core::Component component, std::string source_label, Fn&& fn)
    -> decltype(std::forward<Fn>(fn)()) {
    Handle handle = begin(component, std::move(source_label));
    try {
        if constexpr (std::is_void_v<decltype(std::forward<Fn>(fn)())>) {
            std::forward<Fn>(fn)();
            handle.end(true);
        } else {
            auto result = std::forward<Fn>(fn)();
            handle.end(true);
            return result;
        }
    } catch (...) {
        handle.end(false);
        throw;
    }
}

} // namespace capture
} // namespace latmon

#endif // LATMON_CAPTURE_SAMPLER_H_
