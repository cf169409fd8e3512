#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "latmon/common/logger.h"
#include "latmon/config.h"
#include "latmon/core/config.h"
#include "latmon/monitor/monitor_service.h"
#include "latmon/server/api_handlers.h"
#include "latmon/server/http_server.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace latmon {
namespace {

struct Options {
    std::string config_path = LATMON_DEFAULT_CONFIG_PATH;
    std::optional<std::string> store_path;
    std::optional<int64_t> http_port;
    std::vector<core::Component> components;   // empty = all
    std::optional<int64_t> duration_seconds;
    std::optional<std::string> log_level;
    std::optional<int64_t> self_test_iterations;
};

std::optional<int64_t> ParseNumber(const std::string& text) {
    int64_t value = 0;
    auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || parsed.ec != std::errc() || parsed.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config PATH            JSON config file (default: " << LATMON_DEFAULT_CONFIG_PATH
              << ", written with defaults if missing)" << std::endl;
    std::cout << "  --store PATH             Event store file, overrides the config" << std::endl;
    std::cout << "  --http-port PORT         HTTP query port, 0 disables the HTTP surface" << std::endl;
    std::cout << "  --component NAME         Component to monitor, repeatable; 'all' (default) for every one" << std::endl;
    std::cout << "  --duration-seconds N     End the session and exit after N seconds" << std::endl;
    std::cout << "  --log-level LEVEL        Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  --self-test N            Time N synthetic operations per component, print summaries, exit" << std::endl;
    std::cout << "  --version                Print the version" << std::endl;
    std::cout << "  --help, -h               Show this help message" << std::endl;
}

/**
 * @return exit code when the process should stop right away
 */
std::optional<int> ParseOptions(int argc, char* argv[], Options& options) {
    bool all_components = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        auto number = [&](const std::string& flag, std::optional<int64_t>& out) -> bool {
            auto value = ParseNumber(argv[++i]);
            if (!value || *value < 0) {
                std::cerr << flag << " needs a non-negative integer, got '" << argv[i] << "'" << std::endl;
                return false;
            }
            out = value;
            return true;
        };

        if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--store" && has_value) {
            options.store_path = argv[++i];
        } else if (arg == "--http-port" && has_value) {
            if (!number(arg, options.http_port)) return 1;
        } else if (arg == "--component" && has_value) {
            std::string name = argv[++i];
            if (name == "all") {
                all_components = true;
                continue;
            }
            auto component = core::ParseComponent(name);
            if (!component) {
                std::cerr << "Unknown component: " << name << std::endl;
                return 1;
            }
            options.components.push_back(*component);
        } else if (arg == "--duration-seconds" && has_value) {
            if (!number(arg, options.duration_seconds)) return 1;
            if (*options.duration_seconds == 0) {
                std::cerr << "--duration-seconds must be positive" << std::endl;
                return 1;
            }
            const int64_t max_seconds =
                std::chrono::duration_cast<std::chrono::seconds>(monitor::kMaxSessionDuration).count();
            if (*options.duration_seconds > max_seconds) {
                std::cerr << "--duration-seconds must be at most " << max_seconds << std::endl;
                return 1;
            }
        } else if (arg == "--log-level" && has_value) {
            options.log_level = argv[++i];
        } else if (arg == "--self-test" && has_value) {
            if (!number(arg, options.self_test_iterations)) return 1;
        } else if (arg == "--version") {
            std::cout << "latmon " << LATMON_VERSION << std::endl;
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }
    if (all_components) {
        options.components.clear();
    }
    return std::nullopt;
}

void PrintSummary(const core::AggregateSnapshot& snapshot) {
    std::cout << std::left << std::setw(18)
              << (snapshot.component ? core::ComponentName(*snapshot.component) : "all");
    if (!snapshot.valid()) {
        std::cout << "no events" << std::endl;
        return;
    }
    std::cout << "count=" << snapshot.count
              << " mean=" << std::fixed << std::setprecision(1) << snapshot.mean_us << "us"
              << " p50=" << snapshot.p50_us << "us"
              << " p95=" << snapshot.p95_us << "us"
              << " p99=" << snapshot.p99_us << "us"
              << " max=" << snapshot.max_us << "us"
              << " errors=" << std::setprecision(3) << snapshot.error_rate
              << " (" << core::StrategyName(snapshot.strategy) << ")" << std::endl;
}

int RunSelfTest(monitor::MonitorService& monitor, int64_t iterations, const std::vector<core::Component>& filter) {
    auto window_start = core::WallNowUs();
    auto session = monitor.start_session(filter);
    if (!session.ok()) {
        LATMON_ERROR("Cannot start self-test session: {}", session.error());
        return 1;
    }

    auto& sampler = *monitor.sampler();
    for (auto component : core::AllComponents()) {
        for (int64_t i = 0; i < iterations; ++i) {
            sampler.time(component, "self-test", [i]() {
                std::this_thread::sleep_for(std::chrono::microseconds(50 + (i % 10) * 10));
            });
        }
    }

    auto stopped = monitor.stop_session(session.value());
    if (!stopped.ok()) {
        LATMON_ERROR("Self-test session did not flush: {}", stopped.error());
        return 1;
    }

    core::TimeWindow window(window_start, core::WallNowUs() + 1);
    auto overall = monitor.queries()->summary(window);
    auto by_component = monitor.queries()->summary_by_component(window);
    if (!overall.ok() || !by_component.ok()) {
        LATMON_ERROR("Self-test summary failed: {}", overall.ok() ? by_component.error() : overall.error());
        return 1;
    }

    std::cout << "Self-test: " << iterations << " operations per component" << std::endl;
    for (const auto& snapshot : by_component.value()) {
        PrintSummary(snapshot);
    }
    PrintSummary(overall.value());
    return 0;
}

int Run(const Options& options) {
    auto loaded = core::MonitorConfig::LoadFromFile(options.config_path);
    if (!loaded.ok()) {
        LATMON_CRITICAL("Cannot load config {}: {}", options.config_path, loaded.error());
        return 1;
    }
    core::MonitorConfig config = loaded.take_value();

    std::string level_name = options.log_level.value_or(config.log_level);
    auto level = common::Logger::ParseLevel(level_name);
    if (!level) {
        LATMON_WARN("Unknown log level: {}. Using default (info).", level_name);
    } else {
        common::Logger::SetLevel(*level);
    }

    if (options.store_path) {
        config.storage.path = *options.store_path;
    }
    if (options.http_port) {
        if (*options.http_port == 0) {
            config.server.enabled = false;
        } else if (*options.http_port > 65535) {
            LATMON_CRITICAL("--http-port {} is out of range", *options.http_port);
            return 1;
        } else {
            config.server.enabled = true;
            config.server.port = static_cast<uint16_t>(*options.http_port);
        }
    }
    if (options.self_test_iterations) {
        config.server.enabled = false;
    }

    auto created = monitor::MonitorService::Create(config);
    if (!created.ok()) {
        LATMON_CRITICAL("Cannot start monitor: {}", created.error());
        return 1;
    }
    auto monitor = created.take_value();

    if (options.self_test_iterations) {
        int code = RunSelfTest(*monitor, *options.self_test_iterations, options.components);
        monitor->shutdown();
        return code;
    }

    std::unique_ptr<server::HttpServer> http_server;
    std::unique_ptr<server::ApiHandlers> handlers;
    if (config.server.enabled) {
        handlers = std::make_unique<server::ApiHandlers>(monitor->queries());
        http_server = std::make_unique<server::HttpServer>(config.server);
        handlers->Register(*http_server);
        try {
            http_server->Start();
        } catch (const server::ServerError& e) {
            LATMON_CRITICAL("Cannot start HTTP server: {}", e.what());
            monitor->shutdown();
            return 1;
        }
    }

    std::optional<std::chrono::milliseconds> duration;
    if (options.duration_seconds) {
        duration = std::chrono::seconds(*options.duration_seconds);
    }
    auto session = monitor->start_session(options.components, duration);
    if (!session.ok()) {
        LATMON_CRITICAL("Cannot start session: {}", session.error());
        monitor->shutdown();
        return 1;
    }

    LATMON_INFO("latmon {} running. Press Ctrl+C to stop.", LATMON_VERSION);
    while (g_running.load()) {
        if (duration && monitor->wait_for_session_end(std::chrono::milliseconds(100))) {
            LATMON_INFO("Session finished");
            break;
        }
        if (!duration) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    if (monitor->session_active()) {
        auto stopped = monitor->stop_session(session.value());
        if (!stopped.ok()) {
            LATMON_WARN("Stopping session: {}", stopped.error());
        }
    }
    if (http_server) {
        http_server->Stop();
    }
    monitor->shutdown();
    return 0;
}

} // namespace
} // namespace latmon

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    latmon::common::Logger::Init();

    latmon::Options options;
    if (auto code = latmon::ParseOptions(argc, argv, options)) {
        return *code;
    }

    try {
        return latmon::Run(options);
    } catch (const std::exception& e) {
        LATMON_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
