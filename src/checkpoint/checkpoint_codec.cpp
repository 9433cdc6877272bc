#include "lifeline/checkpoint/checkpoint_codec.hpp"

#include <zlib.h>

#include <cstring>

namespace lifeline::checkpoint {

namespace {

constexpr char kMagic[4] = {'L', 'L', 'C', 'P'};

// Refuse to allocate for absurd lengths read from a damaged header
constexpr uint32_t kMaxPayloadSize = 64u * 1024u * 1024u;

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

Result<Checkpoint, Error> corrupt(std::string message) {
    return Result<Checkpoint, Error>::err(ErrorCode::CorruptData, std::move(message));
}

}  // namespace

Result<EncodedCheckpoint, Error> encode(const Checkpoint& checkpoint, bool compress) {
    std::vector<uint8_t> packed;
    try {
        packed = Json::to_msgpack(checkpoint.to_json());
    } catch (const std::exception& e) {
        return Result<EncodedCheckpoint, Error>::err(
            Error::from_exception(e).with_source("checkpoint_codec"));
    }

    if (packed.size() > kMaxPayloadSize) {
        return Result<EncodedCheckpoint, Error>::err(
            ErrorCode::CheckpointTooLarge,
            "Serialized checkpoint exceeds codec limit",
            checkpoint.id
        );
    }

    EncodedCheckpoint encoded;
    encoded.uncompressed_size = packed.size();

    auto& out = encoded.bytes;
    out.reserve(kHeaderSize + packed.size());
    out.insert(out.end(), std::begin(kMagic), std::end(kMagic));
    out.push_back(kCodecVersion);
    out.push_back(compress ? kFlagCompressed : 0);
    put_u32(out, static_cast<uint32_t>(packed.size()));

    if (compress) {
        uLongf dest_len = compressBound(static_cast<uLong>(packed.size()));
        std::vector<uint8_t> deflated(dest_len);
        int rc = compress2(deflated.data(), &dest_len,
                           packed.data(), static_cast<uLong>(packed.size()),
                           Z_DEFAULT_COMPRESSION);
        if (rc != Z_OK) {
            return Result<EncodedCheckpoint, Error>::err(
                ErrorCode::InternalError,
                "zlib compression failed: " + std::to_string(rc),
                checkpoint.id
            );
        }
        out.insert(out.end(), deflated.begin(), deflated.begin() + dest_len);
    } else {
        out.insert(out.end(), packed.begin(), packed.end());
    }

    encoded.compressed_size = out.size();
    encoded.compression_ratio = static_cast<double>(encoded.uncompressed_size) /
                                static_cast<double>(encoded.compressed_size);
    return Result<EncodedCheckpoint, Error>::ok(std::move(encoded));
}

Result<Checkpoint, Error> decode(const uint8_t* data, size_t size) {
    if (data == nullptr || size < kHeaderSize) {
        return corrupt("Encoded checkpoint shorter than header");
    }
    if (std::memcmp(data, kMagic, sizeof(kMagic)) != 0) {
        return corrupt("Bad checkpoint magic");
    }
    if (data[4] != kCodecVersion) {
        return corrupt("Unsupported codec version " + std::to_string(data[4]));
    }

    uint8_t flags = data[5];
    uint32_t length = get_u32(data + 6);
    if (length > kMaxPayloadSize) {
        return corrupt("Declared payload length out of range");
    }

    const uint8_t* payload = data + kHeaderSize;
    size_t payload_size = size - kHeaderSize;

    std::vector<uint8_t> packed;
    if (flags & kFlagCompressed) {
        packed.resize(length);
        uLongf dest_len = length;
        int rc = uncompress(packed.data(), &dest_len, payload, static_cast<uLong>(payload_size));
        if (rc != Z_OK) {
            return corrupt("zlib decompression failed: " + std::to_string(rc));
        }
        if (dest_len != length) {
            return corrupt("Decompressed size does not match header");
        }
    } else {
        if (payload_size != length) {
            return corrupt("Payload size does not match header");
        }
        packed.assign(payload, payload + payload_size);
    }

    try {
        Json j = Json::from_msgpack(packed);
        return Result<Checkpoint, Error>::ok(Checkpoint::from_json(j));
    } catch (const std::exception& e) {
        return corrupt(std::string("Structural parse failed: ") + e.what());
    }
}

Result<Checkpoint, Error> decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

}  // namespace lifeline::checkpoint
