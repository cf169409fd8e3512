#ifndef LATMON_INGEST_RETENTION_ENFORCER_H_
#define LATMON_INGEST_RETENTION_ENFORCER_H_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "latmon/core/config.h"
#include "latmon/core/result.h"
#include "latmon/ingest/batch_writer.h"
#include "latmon/storage/retention.h"

namespace latmon {
namespace ingest {

/**
 * @brief Periodically asks the batch writer to apply the retention policy
 *
 * The first run happens right after start(); later runs follow every
 * policy.interval. Failures are logged and retried on the next period.
 */
class RetentionEnforcer {
public:
    RetentionEnforcer(const core::RetentionPolicy& policy, std::shared_ptr<BatchWriter> writer);
    ~RetentionEnforcer();

    RetentionEnforcer(const RetentionEnforcer&) = delete;
    RetentionEnforcer& operator=(const RetentionEnforcer&) = delete;

    /** @brief Start the periodic thread; a policy with no rule is accepted and never runs */
    core::Result<void> start();
    void stop();

    /** @brief Enforce once, outside the schedule, and wait for the outcome */
    core::Result<storage::RetentionReport> run_once(std::chrono::milliseconds timeout);

    const core::RetentionPolicy& policy() const { return policy_; }

private:
    void loop();

    core::RetentionPolicy policy_;
    std::shared_ptr<BatchWriter> writer_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_;
};

} // namespace ingest
} // namespace latmon

#endif // LATMON_INGEST_RETENTION_ENFORCER_H_
