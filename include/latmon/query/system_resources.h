#ifndef LATMON_QUERY_SYSTEM_RESOURCES_H_
#define LATMON_QUERY_SYSTEM_RESOURCES_H_

#include <cstdint>
#include <string>

#include "latmon/core/result.h"
#include "latmon/core/types.h"

namespace latmon {
namespace query {

/**
 * @brief Host resource snapshot served next to the latency data
 */
struct SystemResources {
    uint64_t memory_total_bytes = 0;
    uint64_t memory_used_bytes = 0;
    uint64_t memory_available_bytes = 0;
    uint32_t cpu_count = 0;
    double load_one = 0.0;
    double load_five = 0.0;
    double load_fifteen = 0.0;
    uint64_t processes = 0;
    uint64_t uptime_seconds = 0;
    core::Timestamp sampled_at = 0;
};

/**
 * @brief Source of host resource snapshots
 */
class SystemResourceProvider {
public:
    virtual ~SystemResourceProvider() = default;

    virtual core::Result<SystemResources> sample() const = 0;
};

/**
 * @brief Reads /proc/meminfo, /proc/stat, /proc/loadavg and /proc/uptime
 */
class ProcfsResourceProvider : public SystemResourceProvider {
public:
    /**
     * @param proc_root Directory laid out like /proc
     */
    explicit ProcfsResourceProvider(std::string proc_root = "/proc");

    core::Result<SystemResources> sample() const override;

private:
    std::string proc_root_;
};

} // namespace query
} // namespace latmon

#endif // LATMON_QUERY_SYSTEM_RESOURCES_H_
