#ifndef LATMON_STORAGE_EVENT_CODEC_H_
#define LATMON_STORAGE_EVENT_CODEC_H_

#include <cstdint>
#include <string>
#include <vector>

#include "latmon/core/result.h"
#include "latmon/core/types.h"

namespace latmon {
namespace storage {

/**
 * @brief Store file layout
 *
 * File:  "LATMON" u16 version | frame*
 * Frame: u32 payload_length | u32 crc32(payload) | payload
 * Payload byte 0 is the FrameType. All integers little-endian.
 */
constexpr char kFileMagic[6] = {'L', 'A', 'T', 'M', 'O', 'N'};
constexpr uint16_t kFormatVersion = 1;
constexpr size_t kFileHeaderSize = 8;
constexpr size_t kFrameHeaderSize = 8;
constexpr uint32_t kMaxFrameLength = 256u * 1024 * 1024;

enum class FrameType : uint8_t {
    BATCH = 1,       // committed events with their ids
    DELETE = 2,      // ids removed by retention
    CHECKPOINT = 3   // next id high-water mark
};

struct DecodedFrame {
    FrameType type = FrameType::BATCH;
    std::vector<core::LatencyEvent> events;
    std::vector<core::EventID> ids;
    core::EventID next_id = 0;
};

uint32_t Crc32(const uint8_t* data, size_t len);

std::vector<uint8_t> EncodeFileHeader();
bool CheckFileHeader(const uint8_t* data, size_t len);

/**
 * @brief Encode committed events (ids already assigned) as one BATCH payload
 */
std::vector<uint8_t> EncodeBatchPayload(const std::vector<core::LatencyEvent>& events);
std::vector<uint8_t> EncodeDeletePayload(const std::vector<core::EventID>& ids);
std::vector<uint8_t> EncodeCheckpointPayload(core::EventID next_id);

/**
 * @brief Wrap a payload into a length + crc framed record
 */
std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t>& payload);

/**
 * @brief Decode a CRC-verified payload
 */
core::Result<DecodedFrame> DecodePayload(const uint8_t* data, size_t len);

} // namespace storage
} // namespace latmon

#endif // LATMON_STORAGE_EVENT_CODEC_H_
