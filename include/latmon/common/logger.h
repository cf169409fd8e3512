#ifndef LATMON_COMMON_LOGGER_H_
#define LATMON_COMMON_LOGGER_H_

#include <string>
#include <optional>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace latmon {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Map a level name (trace, debug, info, warn, error, off) to spdlog
     */
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace latmon

// Macros for convenient logging
#define LATMON_TRACE(...) spdlog::trace(__VA_ARGS__)
#define LATMON_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define LATMON_INFO(...)  spdlog::info(__VA_ARGS__)
#define LATMON_WARN(...)  spdlog::warn(__VA_ARGS__)
#define LATMON_ERROR(...) spdlog::error(__VA_ARGS__)
#define LATMON_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // LATMON_COMMON_LOGGER_H_
