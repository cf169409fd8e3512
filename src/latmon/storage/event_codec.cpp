#include "latmon/storage/event_codec.h"
#include "latmon/core/error.h"

#include <array>
#include <cstring>

namespace latmon {
namespace storage {
namespace {

constexpr uint32_t kCrc32Poly = 0xEDB88320u;

std::array<uint32_t, 256> MakeCrc32Table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (kCrc32Poly ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

    void u8(uint8_t v) { out_.push_back(v); }

    void u16(uint16_t v) {
        for (int i = 0; i < 2; ++i) out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    void u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    void i64(int64_t v) {
        uint64_t u = static_cast<uint64_t>(v);
        for (int i = 0; i < 8; ++i) out_.push_back(static_cast<uint8_t>(u >> (8 * i)));
    }

    void str(const std::string& s) {
        u32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

private:
    std::vector<uint8_t>& out_;
};

// Bounds-checked reader; every accessor returns false once the input is exhausted.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0) {}

    bool u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = data_[pos_++];
        return true;
    }

    bool u32(uint32_t& v) {
        if (remaining() < 4) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(data_[pos_++]) << (8 * i);
        return true;
    }

    bool i64(int64_t& v) {
        if (remaining() < 8) return false;
        uint64_t u = 0;
        for (int i = 0; i < 8; ++i) u |= static_cast<uint64_t>(data_[pos_++]) << (8 * i);
        v = static_cast<int64_t>(u);
        return true;
    }

    bool str(std::string& s) {
        uint32_t n = 0;
        if (!u32(n) || remaining() < n) return false;
        s.assign(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return true;
    }

    size_t remaining() const { return len_ - pos_; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_;
};

core::Result<DecodedFrame> Malformed(const std::string& what) {
    return core::Result<DecodedFrame>::error("Malformed frame: " + what,
                                             core::Error::Code::STORAGE_INIT);
}

} // namespace

uint32_t Crc32(const uint8_t* data, size_t len) {
    static const std::array<uint32_t, 256> table = MakeCrc32Table();
    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

std::vector<uint8_t> EncodeFileHeader() {
    std::vector<uint8_t> out(kFileMagic, kFileMagic + sizeof(kFileMagic));
    ByteWriter w(out);
    w.u16(kFormatVersion);
    return out;
}

bool CheckFileHeader(const uint8_t* data, size_t len) {
    if (len < kFileHeaderSize) {
        return false;
    }
    if (std::memcmp(data, kFileMagic, sizeof(kFileMagic)) != 0) {
        return false;
    }
    uint16_t version = static_cast<uint16_t>(data[6]) | static_cast<uint16_t>(data[7] << 8);
    return version == kFormatVersion;
}

std::vector<uint8_t> EncodeBatchPayload(const std::vector<core::LatencyEvent>& events) {
    std::vector<uint8_t> out;
    out.reserve(8 + events.size() * 48);
    ByteWriter w(out);
    w.u8(static_cast<uint8_t>(FrameType::BATCH));
    w.u32(static_cast<uint32_t>(events.size()));
    for (const auto& event : events) {
        w.i64(event.id());
        w.i64(event.wall_timestamp());
        w.u8(static_cast<uint8_t>(event.component()));
        w.i64(event.duration_us());
        w.u8(event.success() ? 1 : 0);
        w.str(event.source_label());
        w.u32(static_cast<uint32_t>(event.metadata().size()));
        for (const auto& [key, value] : event.metadata()) {
            w.str(key);
            w.str(value);
        }
    }
    return out;
}

std::vector<uint8_t> EncodeDeletePayload(const std::vector<core::EventID>& ids) {
    std::vector<uint8_t> out;
    out.reserve(5 + ids.size() * 8);
    ByteWriter w(out);
    w.u8(static_cast<uint8_t>(FrameType::DELETE));
    w.u32(static_cast<uint32_t>(ids.size()));
    for (core::EventID id : ids) {
        w.i64(id);
    }
    return out;
}

std::vector<uint8_t> EncodeCheckpointPayload(core::EventID next_id) {
    std::vector<uint8_t> out;
    ByteWriter w(out);
    w.u8(static_cast<uint8_t>(FrameType::CHECKPOINT));
    w.i64(next_id);
    return out;
}

std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    out.reserve(kFrameHeaderSize + payload.size());
    ByteWriter w(out);
    w.u32(static_cast<uint32_t>(payload.size()));
    w.u32(Crc32(payload.data(), payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

core::Result<DecodedFrame> DecodePayload(const uint8_t* data, size_t len) {
    ByteReader r(data, len);
    uint8_t type = 0;
    if (!r.u8(type)) {
        return Malformed("empty payload");
    }

    DecodedFrame frame;
    switch (static_cast<FrameType>(type)) {
        case FrameType::BATCH: {
            frame.type = FrameType::BATCH;
            uint32_t count = 0;
            if (!r.u32(count)) return Malformed("missing batch size");
            frame.events.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                int64_t id = 0, ts = 0, duration = 0;
                uint8_t component = 0, success = 0;
                std::string label;
                uint32_t meta_count = 0;
                if (!r.i64(id) || !r.i64(ts) || !r.u8(component) || !r.i64(duration) ||
                    !r.u8(success) || !r.str(label) || !r.u32(meta_count)) {
                    return Malformed("truncated event " + std::to_string(i));
                }
                auto parsed_component = core::ComponentFromIndex(component);
                if (!parsed_component) {
                    return Malformed("unknown component tag " + std::to_string(component));
                }
                core::Metadata metadata;
                for (uint32_t m = 0; m < meta_count; ++m) {
                    std::string key, value;
                    if (!r.str(key) || !r.str(value)) {
                        return Malformed("truncated metadata");
                    }
                    metadata.emplace(std::move(key), std::move(value));
                }
                if (id <= 0 || duration < 0) {
                    return Malformed("invalid event id or duration");
                }
                core::LatencyEvent event(ts, *parsed_component, std::move(label), duration,
                                         success != 0, std::move(metadata));
                frame.events.push_back(event.with_id(id));
            }
            break;
        }
        case FrameType::DELETE: {
            frame.type = FrameType::DELETE;
            uint32_t count = 0;
            if (!r.u32(count)) return Malformed("missing delete size");
            if (r.remaining() < static_cast<size_t>(count) * 8) return Malformed("truncated delete");
            frame.ids.resize(count);
            for (uint32_t i = 0; i < count; ++i) {
                if (!r.i64(frame.ids[i])) return Malformed("truncated delete");
            }
            break;
        }
        case FrameType::CHECKPOINT: {
            frame.type = FrameType::CHECKPOINT;
            if (!r.i64(frame.next_id)) return Malformed("missing checkpoint id");
            break;
        }
        default:
            return Malformed("unknown frame type " + std::to_string(type));
    }

    if (r.remaining() != 0) {
        return Malformed("trailing bytes");
    }
    return core::Result<DecodedFrame>(std::move(frame));
}

} // namespace storage
} // namespace latmon
