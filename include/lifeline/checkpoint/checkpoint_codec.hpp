#pragma once

#include "checkpoint.hpp"
#include "lifeline/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lifeline::checkpoint {

// Encoded form of a checkpoint with its size metrics
struct EncodedCheckpoint {
    std::vector<uint8_t> bytes;
    size_t uncompressed_size = 0;  // Canonical form before compression
    size_t compressed_size = 0;    // bytes.size()
    double compression_ratio = 1.0;  // uncompressed / compressed
};

// Byte layout:
//   "LLCP" | version (1 byte) | flags (1 byte) | payload length (uint32 BE) | payload
// The payload is the MessagePack form of Checkpoint::to_json(), deflated with
// zlib when the compressed flag is set. The length is always the size of the
// MessagePack form.
inline constexpr uint8_t kCodecVersion = 1;
inline constexpr uint8_t kFlagCompressed = 0x01;
inline constexpr size_t kHeaderSize = 10;

// Serialize and optionally compress. The checkpoint is assumed to be validated.
Result<EncodedCheckpoint, Error> encode(const Checkpoint& checkpoint, bool compress = true);

// Inverse of encode. Fails with CorruptData on any structural problem.
Result<Checkpoint, Error> decode(const uint8_t* data, size_t size);
Result<Checkpoint, Error> decode(const std::vector<uint8_t>& bytes);

}  // namespace lifeline::checkpoint
