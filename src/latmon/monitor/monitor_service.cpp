#include "latmon/monitor/monitor_service.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"
#include "latmon/query/system_resources.h"

namespace latmon {
namespace monitor {

namespace {

constexpr std::chrono::seconds kSessionFlushTimeout(30);

std::string DescribeFilter(const std::vector<core::Component>& filter) {
    if (filter.empty()) {
        return "all components";
    }
    std::string names;
    for (auto component : filter) {
        if (!names.empty()) {
            names += ",";
        }
        names += core::ComponentName(component);
    }
    return names;
}

} // namespace

MonitorService::MonitorService(const core::MonitorConfig& config)
    : config_(config), next_session_id_(1), shut_down_(false) {}

core::Result<std::unique_ptr<MonitorService>> MonitorService::Create(
    const core::MonitorConfig& config,
    capture::ClockSource clock,
    std::shared_ptr<const query::SystemResourceProvider> resources) {
    using ResultType = core::Result<std::unique_ptr<MonitorService>>;

    auto valid = config.Validate();
    if (!valid.ok()) {
        return ResultType::error("Invalid configuration: " + valid.error(), valid.error_code());
    }

    std::unique_ptr<MonitorService> service(new MonitorService(config));

    auto store = storage::EventStore::Open(config.storage);
    if (!store.ok()) {
        LATMON_CRITICAL("Cannot open event store {}: {}", config.storage.path, store.error());
        return ResultType::error(store.error(), core::Error::Code::STORAGE_INIT);
    }
    service->store_ = store.take_value();

    auto store_writer = service->store_->acquire_writer();
    if (!store_writer.ok()) {
        return ResultType::error(store_writer.error(), core::Error::Code::STORAGE_INIT);
    }

    service->counters_ = std::make_shared<core::PipelineCounters>();
    service->buffer_ = std::make_shared<ingest::IngestionBuffer>(config.buffer, service->counters_);
    service->writer_ = std::make_shared<ingest::BatchWriter>(
        config.writer, service->buffer_,
        std::make_unique<storage::StoreWriter>(store_writer.take_value()),
        service->counters_);

    auto started = service->writer_->start();
    if (!started.ok()) {
        return ResultType::error(started.error(), started.error_code());
    }

    service->enforcer_ = std::make_unique<ingest::RetentionEnforcer>(config.retention, service->writer_);
    auto enforcing = service->enforcer_->start();
    if (!enforcing.ok()) {
        return ResultType::error(enforcing.error(), enforcing.error_code());
    }

    service->sampler_ = std::make_shared<capture::Sampler>(service->buffer_, service->counters_, std::move(clock));

    if (!resources) {
        resources = std::make_shared<query::ProcfsResourceProvider>();
    }
    service->queries_ = std::make_shared<query::QueryService>(service->store_->reader(), service->counters_,
                                                              config.aggregation, config.server,
                                                              std::move(resources));

    LATMON_INFO("Monitor ready: store {}, buffer capacity {}, batch size {}",
                config.storage.path, config.buffer.capacity, config.writer.batch_size);
    return ResultType(std::move(service));
}

MonitorService::~MonitorService() {
    shutdown();
}

core::Result<SessionHandle> MonitorService::start_session(const std::vector<core::Component>& filter,
                                                          std::optional<std::chrono::milliseconds> duration) {
    if (duration && duration->count() <= 0) {
        return core::Result<SessionHandle>::error("Session duration must be positive",
                                                  core::Error::Code::INVALID_ARGUMENT);
    }
    if (duration && *duration > kMaxSessionDuration) {
        return core::Result<SessionHandle>::error("Session duration must not exceed one year",
                                                  core::Error::Code::INVALID_ARGUMENT);
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (shut_down_) {
            return core::Result<SessionHandle>::error("Monitor is shut down",
                                                      core::Error::Code::INVALID_ARGUMENT);
        }
        if (active_) {
            return core::Result<SessionHandle>::error(
                "Session " + std::to_string(active_->handle.id) + " is already active",
                core::Error::Code::INVALID_ARGUMENT);
        }
    }

    // A watcher left over from a deadline-ended session has nothing left to do
    join_watcher();

    SessionHandle handle;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        handle.id = next_session_id_++;
        handle.components = filter;
        if (duration) {
            handle.deadline = std::chrono::steady_clock::now() + *duration;
        }
        ActiveSession session;
        session.handle = handle;
        active_ = session;
        sampler_->open(filter);
    }

    if (handle.deadline) {
        watcher_ = std::thread(&MonitorService::watch_deadline, this, handle.id, *handle.deadline);
    }

    if (duration) {
        LATMON_INFO("Session {} started for {} ({} ms)", handle.id, DescribeFilter(filter), duration->count());
    } else {
        LATMON_INFO("Session {} started for {}", handle.id, DescribeFilter(filter));
    }
    return core::Result<SessionHandle>(std::move(handle));
}

core::Result<void> MonitorService::stop_session(const SessionHandle& handle) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    auto result = end_session(handle.id, "stopped");
    join_watcher();
    return result;
}

core::Result<void> MonitorService::end_session(uint64_t id, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!active_ || active_->handle.id != id) {
            return core::Result<void>::error("Session " + std::to_string(id) + " is not active",
                                             core::Error::Code::INVALID_ARGUMENT);
        }
        if (active_->ending) {
            return core::Result<void>::error("Session " + std::to_string(id) + " is already ending",
                                             core::Error::Code::INVALID_ARGUMENT);
        }
        active_->ending = true;
        sampler_->close();
    }
    session_cv_.notify_all();

    bool flushed = writer_->flush(std::chrono::duration_cast<std::chrono::milliseconds>(kSessionFlushTimeout));

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        active_.reset();
    }
    session_cv_.notify_all();

    auto counters = counters_->snapshot();
    LATMON_INFO("Session {} {}: {} accepted, {} dropped, {} committed",
                id, reason, counters.accepted(), counters.events_dropped, counters.events_committed);
    if (!flushed) {
        return core::Result<void>::error(
            "Session " + std::to_string(id) + " ended but buffered events were not all committed",
            core::Error::Code::COMMIT_FAILURE);
    }
    return core::Result<void>();
}

void MonitorService::watch_deadline(uint64_t id, std::chrono::steady_clock::time_point deadline) {
    {
        std::unique_lock<std::mutex> lock(session_mutex_);
        bool cancelled = session_cv_.wait_until(lock, deadline, [this, id]() {
            return !active_ || active_->handle.id != id || active_->ending;
        });
        if (cancelled) {
            return;
        }
    }

    auto result = end_session(id, "reached its deadline");
    if (!result.ok()) {
        LATMON_WARN("Ending session {} at its deadline: {}", id, result.error());
    }
}

void MonitorService::join_watcher() {
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

bool MonitorService::session_active() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return active_.has_value();
}

std::optional<SessionHandle> MonitorService::active_session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!active_) {
        return std::nullopt;
    }
    return active_->handle;
}

bool MonitorService::wait_for_session_end(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(session_mutex_);
    return session_cv_.wait_for(lock, timeout, [this]() { return !active_.has_value(); });
}

bool MonitorService::flush(std::chrono::milliseconds timeout) {
    return writer_->flush(timeout);
}

core::Result<storage::RetentionReport> MonitorService::enforce_retention(std::chrono::milliseconds timeout) {
    return enforcer_->run_once(timeout);
}

void MonitorService::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::optional<uint64_t> active_id;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        if (active_ && !active_->ending) {
            active_id = active_->handle.id;
        }
    }

    if (active_id) {
        auto ended = end_session(*active_id, "ended by shutdown");
        if (!ended.ok()) {
            LATMON_WARN("Ending session {} on shutdown: {}", *active_id, ended.error());
        }
    }
    join_watcher();

    if (enforcer_) {
        enforcer_->stop();
    }
    if (!writer_) {
        return;  // Create() failed before the pipeline existed
    }
    writer_->stop();

    auto counters = counters_->snapshot();
    LATMON_INFO("Monitor stopped: {} committed, {} dropped, {} lost, {} capture errors",
                counters.events_committed, counters.events_dropped, counters.events_lost,
                counters.capture_errors);
}

} // namespace monitor
} // namespace latmon
