#include "latmon/query/system_resources.h"
#include "latmon/common/logger.h"

#include <fstream>
#include <sstream>

namespace latmon {
namespace query {

namespace {

constexpr uint64_t kBytesPerKiB = 1024;

core::Result<SystemResources> Failed(const std::string& message) {
    return core::Result<SystemResources>::error(message, core::Error::Code::INTERNAL);
}

} // namespace

ProcfsResourceProvider::ProcfsResourceProvider(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

core::Result<SystemResources> ProcfsResourceProvider::sample() const {
    SystemResources resources;
    resources.sampled_at = core::WallNowUs();

    std::ifstream meminfo(proc_root_ + "/meminfo");
    if (!meminfo) {
        return Failed("Cannot read " + proc_root_ + "/meminfo");
    }
    std::string line;
    bool have_total = false;
    bool have_available = false;
    while (std::getline(meminfo, line)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t kib = 0;
        if (!(fields >> key >> kib)) {
            continue;
        }
        if (key == "MemTotal:") {
            resources.memory_total_bytes = kib * kBytesPerKiB;
            have_total = true;
        } else if (key == "MemAvailable:") {
            resources.memory_available_bytes = kib * kBytesPerKiB;
            have_available = true;
        }
    }
    if (!have_total || !have_available) {
        return Failed("meminfo lacks MemTotal or MemAvailable");
    }
    if (resources.memory_available_bytes <= resources.memory_total_bytes) {
        resources.memory_used_bytes = resources.memory_total_bytes - resources.memory_available_bytes;
    }

    std::ifstream stat(proc_root_ + "/stat");
    if (!stat) {
        return Failed("Cannot read " + proc_root_ + "/stat");
    }
    while (std::getline(stat, line)) {
        // per-cpu lines are "cpuN ...", the aggregate line is "cpu ..."
        if (line.compare(0, 3, "cpu") == 0 && line.size() > 3 && line[3] != ' ') {
            resources.cpu_count++;
        }
    }

    std::ifstream loadavg(proc_root_ + "/loadavg");
    std::string running_total;
    if (!(loadavg >> resources.load_one >> resources.load_five >> resources.load_fifteen >> running_total)) {
        return Failed("Cannot parse " + proc_root_ + "/loadavg");
    }
    auto slash = running_total.find('/');
    if (slash != std::string::npos) {
        std::istringstream total(running_total.substr(slash + 1));
        total >> resources.processes;
    }

    std::ifstream uptime(proc_root_ + "/uptime");
    double uptime_seconds = 0;
    if (uptime >> uptime_seconds) {
        resources.uptime_seconds = static_cast<uint64_t>(uptime_seconds);
    } else {
        LATMON_DEBUG("No uptime available under {}", proc_root_);
    }

    return core::Result<SystemResources>(resources);
}

} // namespace query
} // namespace latmon
