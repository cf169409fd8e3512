#include "latmon/storage/event_log.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace latmon {
namespace storage {
namespace {

std::string ErrnoMessage(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

bool PreadFull(int fd, uint8_t* buf, size_t len, uint64_t offset) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) {
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

bool PwriteFull(int fd, const uint8_t* buf, size_t len, uint64_t offset) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

uint32_t ReadU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void SyncParentDirectory(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    int dir_fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
        LATMON_WARN("Cannot open {} to sync rename: {}", parent.string(), std::strerror(errno));
        return;
    }
    if (::fsync(dir_fd) != 0) {
        LATMON_WARN("fsync of directory {} failed: {}", parent.string(), std::strerror(errno));
    }
    ::close(dir_fd);
}

} // namespace

EventLog::EventLog(std::string path, int fd, bool sync)
    : path_(std::move(path)), fd_(fd), sync_(sync), size_(0) {}

EventLog::~EventLog() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

core::Result<std::unique_ptr<EventLog>> EventLog::Open(const std::string& path,
                                                       bool sync,
                                                       const FrameCallback& on_frame) {
    using ResultType = core::Result<std::unique_ptr<EventLog>>;

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return ResultType::error("Cannot create store directory " + parent.string() + ": " +
                                     ec.message(), core::Error::Code::STORAGE_INIT);
        }
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return ResultType::error(ErrnoMessage("Cannot open store file " + path, errno),
                                 core::Error::Code::STORAGE_INIT);
    }
    std::unique_ptr<EventLog> log(new EventLog(path, fd, sync));

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        return ResultType::error(ErrnoMessage("Cannot stat store file " + path, errno),
                                 core::Error::Code::STORAGE_INIT);
    }

    if (st.st_size == 0) {
        auto header = EncodeFileHeader();
        if (!PwriteFull(fd, header.data(), header.size(), 0) || ::fsync(fd) != 0) {
            return ResultType::error(ErrnoMessage("Cannot write store header to " + path, errno),
                                     core::Error::Code::STORAGE_INIT);
        }
        log->size_ = header.size();
        LATMON_INFO("Created event store {}", path);
        return ResultType(std::move(log));
    }

    log->size_ = static_cast<uint64_t>(st.st_size);
    auto replayed = log->replay(on_frame);
    if (!replayed.ok()) {
        return ResultType::error(replayed.error(), replayed.error_code());
    }
    return ResultType(std::move(log));
}

core::Result<void> EventLog::replay(const FrameCallback& on_frame) {
    uint8_t header[kFileHeaderSize];
    if (size_ < kFileHeaderSize || !PreadFull(fd_, header, sizeof(header), 0) ||
        !CheckFileHeader(header, sizeof(header))) {
        return core::Result<void>::error(path_ + " is not a latmon event store",
                                         core::Error::Code::STORAGE_INIT);
    }

    uint64_t pos = kFileHeaderSize;
    std::vector<uint8_t> payload;
    std::string torn_reason;

    while (pos < size_) {
        uint8_t frame_header[kFrameHeaderSize];
        if (pos + kFrameHeaderSize > size_) {
            torn_reason = "partial frame header";
            break;
        }
        if (!PreadFull(fd_, frame_header, kFrameHeaderSize, pos)) {
            return core::Result<void>::error(ErrnoMessage("Read failed on " + path_, errno),
                                             core::Error::Code::STORAGE_INIT);
        }
        uint32_t length = ReadU32(frame_header);
        uint32_t crc = ReadU32(frame_header + 4);
        if (length == 0 || length > kMaxFrameLength) {
            torn_reason = "bad frame length " + std::to_string(length);
            break;
        }
        if (pos + kFrameHeaderSize + length > size_) {
            torn_reason = "partial frame payload";
            break;
        }
        payload.resize(length);
        if (!PreadFull(fd_, payload.data(), length, pos + kFrameHeaderSize)) {
            return core::Result<void>::error(ErrnoMessage("Read failed on " + path_, errno),
                                             core::Error::Code::STORAGE_INIT);
        }
        if (Crc32(payload.data(), payload.size()) != crc) {
            torn_reason = "checksum mismatch";
            break;
        }
        auto decoded = DecodePayload(payload.data(), payload.size());
        if (!decoded.ok()) {
            torn_reason = decoded.error();
            break;
        }
        on_frame(decoded.take_value());
        replay_stats_.frames++;
        pos += kFrameHeaderSize + length;
    }

    if (pos < size_) {
        replay_stats_.truncated_bytes = size_ - pos;
        LATMON_WARN("Event store {}: discarding {} bytes of torn tail at offset {} ({})",
                    path_, replay_stats_.truncated_bytes, pos, torn_reason);
        if (::ftruncate(fd_, static_cast<off_t>(pos)) != 0 || ::fsync(fd_) != 0) {
            return core::Result<void>::error(ErrnoMessage("Cannot truncate torn tail of " + path_, errno),
                                             core::Error::Code::STORAGE_INIT);
        }
        size_ = pos;
    }

    LATMON_INFO("Replayed {} frames from {}", replay_stats_.frames, path_);
    return core::Result<void>();
}

core::Result<void> EventLog::append(const std::vector<uint8_t>& payload) {
    if (payload.empty() || payload.size() > kMaxFrameLength) {
        return core::Result<void>::error("Frame payload size " + std::to_string(payload.size()) +
                                         " out of range", core::Error::Code::COMMIT_FAILURE);
    }

    auto frame = EncodeFrame(payload);
    if (!PwriteFull(fd_, frame.data(), frame.size(), size_) || (sync_ && ::fsync(fd_) != 0)) {
        int err = errno;
        // Cut any partial frame so the next append starts on a frame boundary
        if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
            LATMON_ERROR("Cannot roll back partial frame in {}: {}", path_, std::strerror(errno));
        }
        return core::Result<void>::error(ErrnoMessage("Append to " + path_ + " failed", err),
                                         core::Error::Code::COMMIT_FAILURE);
    }
    size_ += frame.size();
    return core::Result<void>();
}

core::Result<void> EventLog::rewrite(const std::vector<std::vector<uint8_t>>& payloads) {
    const std::string tmp_path = path_ + ".compact";
    int tmp_fd = ::open(tmp_path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (tmp_fd < 0) {
        return core::Result<void>::error(ErrnoMessage("Cannot create " + tmp_path, errno),
                                         core::Error::Code::RETENTION_FAILURE);
    }

    auto fail = [&](const std::string& what) {
        int err = errno;
        ::close(tmp_fd);
        ::unlink(tmp_path.c_str());
        return core::Result<void>::error(ErrnoMessage(what, err),
                                         core::Error::Code::RETENTION_FAILURE);
    };

    auto header = EncodeFileHeader();
    uint64_t offset = 0;
    if (!PwriteFull(tmp_fd, header.data(), header.size(), offset)) {
        return fail("Cannot write " + tmp_path);
    }
    offset += header.size();
    for (const auto& payload : payloads) {
        auto frame = EncodeFrame(payload);
        if (!PwriteFull(tmp_fd, frame.data(), frame.size(), offset)) {
            return fail("Cannot write " + tmp_path);
        }
        offset += frame.size();
    }
    if (::fsync(tmp_fd) != 0) {
        return fail("Cannot sync " + tmp_path);
    }
    if (::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        return fail("Cannot rename " + tmp_path + " over " + path_);
    }
    SyncParentDirectory(path_);

    // tmp_fd now refers to the live store file
    ::close(fd_);
    fd_ = tmp_fd;
    size_ = offset;
    return core::Result<void>();
}

} // namespace storage
} // namespace latmon
