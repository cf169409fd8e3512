#ifndef LATMON_STORAGE_EVENT_LOG_H_
#define LATMON_STORAGE_EVENT_LOG_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "latmon/core/result.h"
#include "latmon/storage/event_codec.h"

namespace latmon {
namespace storage {

/**
 * @brief Append-only framed log backing the event store
 *
 * Frames are appended with a single positioned write followed by fsync when
 * sync is enabled. A partially written or corrupt frame at the end of the
 * file is a torn tail: open() discards it and truncates the file back to the
 * last good frame. Not thread-safe; the store serializes access.
 */
class EventLog {
public:
    struct ReplayStats {
        uint64_t frames = 0;
        uint64_t truncated_bytes = 0;
    };

    using FrameCallback = std::function<void(DecodedFrame&&)>;

    /**
     * @brief Open or create the log, replaying every intact frame into the callback
     *
     * Fails with STORAGE_INIT when the directory or file cannot be created or
     * the file header is not a latmon header.
     */
    static core::Result<std::unique_ptr<EventLog>> Open(const std::string& path,
                                                        bool sync,
                                                        const FrameCallback& on_frame);

    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    /**
     * @brief Append one framed payload; on failure the file is cut back to its previous length
     */
    core::Result<void> append(const std::vector<uint8_t>& payload);

    /**
     * @brief Atomically replace the log with the given payloads (temp file + rename)
     */
    core::Result<void> rewrite(const std::vector<std::vector<uint8_t>>& payloads);

    uint64_t size_bytes() const { return size_; }
    const std::string& path() const { return path_; }
    const ReplayStats& replay_stats() const { return replay_stats_; }

private:
    EventLog(std::string path, int fd, bool sync);

    core::Result<void> replay(const FrameCallback& on_frame);

    std::string path_;
    int fd_;
    bool sync_;
    uint64_t size_;
    ReplayStats replay_stats_;
};

} // namespace storage
} // namespace latmon

#endif // LATMON_STORAGE_EVENT_LOG_H_
