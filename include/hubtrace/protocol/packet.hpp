#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace hubtrace::protocol {

/// SHTP packet header: 4 bytes, little-endian.
/// Layout: length-low(8) + length-high(7) + continuation(1) + channel(8) + sequence(8).
/// The 15-bit length counts the header itself.
inline constexpr size_t kPacketHeaderSize = 4;
inline constexpr uint16_t kContinuationFlag = 0x8000;
inline constexpr uint16_t kLengthMask = 0x7FFF;

/// SHTP channel assignments on the hub.
enum class Channel : uint8_t {
    Command = 0, // advertisement
    Executable = 1,
    Control = 2,
    InputReports = 3,
    WakeInputReports = 4,
    GyroRotationVector = 5,
};

inline constexpr uint8_t kChannelCount = 6;

/// Executable channel payload byte announcing a completed reset (hub to host),
/// and requesting one (host to hub).
inline constexpr uint8_t kExecutableResetComplete = 0x01;
inline constexpr uint8_t kExecutableReset = 0x01;

struct PacketHeader {
    uint16_t length = 0;
    bool continuation = false;
    uint8_t channel = 0;
    uint8_t sequence = 0;
};

/// A reassembled packet. The payload excludes every header.
struct Packet {
    uint8_t channel = 0;
    uint8_t sequence = 0;
    std::vector<uint8_t> payload;
};

/// Parse a header from the first 4 bytes. Caller guarantees the size.
inline PacketHeader parse_header(std::span<const uint8_t> bytes) {
    const uint16_t raw = static_cast<uint16_t>(bytes[0] | (bytes[1] << 8));
    return PacketHeader{
        .length = static_cast<uint16_t>(raw & kLengthMask),
        .continuation = (raw & kContinuationFlag) != 0,
        .channel = bytes[2],
        .sequence = bytes[3],
    };
}

inline std::array<uint8_t, kPacketHeaderSize> encode_header(const PacketHeader &hdr) {
    uint16_t raw = hdr.length & kLengthMask;
    if (hdr.continuation) {
        raw |= kContinuationFlag;
    }
    return {static_cast<uint8_t>(raw & 0xFF), static_cast<uint8_t>(raw >> 8), hdr.channel,
            hdr.sequence};
}

/// Unsigned little-endian integer of 1, 2 or 4 bytes at offset.
inline uint32_t read_uint_le(std::span<const uint8_t> bytes, size_t offset, size_t width) {
    uint32_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint32_t>(bytes[offset + i]) << (8 * i);
    }
    return value;
}

/// Signed (two's complement) little-endian integer of 1, 2 or 4 bytes at offset.
inline int32_t read_int_le(std::span<const uint8_t> bytes, size_t offset, size_t width) {
    const uint32_t raw = read_uint_le(bytes, offset, width);
    if (width >= 4) {
        return static_cast<int32_t>(raw);
    }
    const uint32_t sign_bit = 1u << (8 * width - 1);
    if ((raw & sign_bit) != 0) {
        return static_cast<int32_t>(raw | ~((sign_bit << 1) - 1));
    }
    return static_cast<int32_t>(raw);
}

inline void append_u16_le(std::vector<uint8_t> &out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>(value >> 8));
}

inline void append_u32_le(std::vector<uint8_t> &out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

const char *channel_label(uint8_t channel);

} // namespace hubtrace::protocol
