#include "latmon/ingest/retention_enforcer.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

namespace latmon {
namespace ingest {

namespace {
constexpr auto kStopPollInterval = std::chrono::milliseconds(50);
}

RetentionEnforcer::RetentionEnforcer(const core::RetentionPolicy& policy,
                                     std::shared_ptr<BatchWriter> writer)
    : policy_(policy), writer_(std::move(writer)), stop_requested_(false) {
    if (!writer_) {
        throw core::InvalidArgumentError("Retention enforcer needs a batch writer");
    }
}

RetentionEnforcer::~RetentionEnforcer() {
    stop();
}

core::Result<void> RetentionEnforcer::start() {
    if (thread_.joinable()) {
        return core::Result<void>::error("Retention enforcer already started",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    if (!policy_.enabled()) {
        LATMON_INFO("Retention disabled, no age or count limit configured");
        return core::Result<void>();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&RetentionEnforcer::loop, this);
    LATMON_INFO("Retention enforcer started (interval {}ms)", policy_.interval.count());
    return core::Result<void>();
}

void RetentionEnforcer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

core::Result<storage::RetentionReport> RetentionEnforcer::run_once(std::chrono::milliseconds timeout) {
    auto future = writer_->request_retention(policy_);
    if (future.wait_for(timeout) != std::future_status::ready) {
        return core::Result<storage::RetentionReport>::error(
            "Retention did not complete within " + std::to_string(timeout.count()) + "ms",
            core::Error::Code::RETENTION_FAILURE);
    }
    return future.get();
}

void RetentionEnforcer::loop() {
    while (true) {
        auto future = writer_->request_retention(policy_);

        // Wait for the writer, but stay responsive to stop()
        bool stopping = false;
        while (future.wait_for(kStopPollInterval) != std::future_status::ready) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                stopping = true;
                break;
            }
        }
        if (stopping) {
            return;
        }

        auto result = future.get();
        if (!result.ok()) {
            LATMON_WARN("Scheduled retention failed, retrying in {}ms: {}",
                        policy_.interval.count(), result.error());
        } else if (result.value().total_removed() == 0) {
            LATMON_DEBUG("Scheduled retention found nothing to remove");
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, policy_.interval, [this] { return stop_requested_; })) {
            return;
        }
    }
}

} // namespace ingest
} // namespace latmon
