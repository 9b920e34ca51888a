#pragma once
#include <cstdint>
#include <cstddef>
#include "codec/bitstream/bit_writer.hpp"
#include "codec/bitstream/bit_reader.hpp"
#include "codec/status.hpp"

namespace Frame {

constexpr uint32_t kSyncCode = 0x3FFE;
constexpr uint32_t kMaxBlockSize = 65536;

// Channel assignment codes 0..7 are independent channels (count = code + 1).
constexpr uint8_t kLeftSide = 8;
constexpr uint8_t kSideRight = 9;
constexpr uint8_t kMidSide = 10;

} // namespace Frame

struct FrameHeader {
    uint32_t block_size;
    uint8_t block_size_code;
    uint32_t sample_rate;
    uint8_t sample_rate_code;
    uint8_t channel_assignment;
    uint8_t channels;
    uint8_t sample_size_code;
    uint8_t sample_size;
    uint64_t frame_number;
    uint8_t crc8;

    FrameHeader()
        : block_size(0),
          block_size_code(0),
          sample_rate(0),
          sample_rate_code(0),
          channel_assignment(0),
          channels(1),
          sample_size_code(0),
          sample_size(0),
          frame_number(0),
          crc8(0) {}

    // Fixed-blocksize header for independent channels; sample rate and
    // sample size are inherited from STREAMINFO. Stops before the CRC-8,
    // which the caller computes over the emitted bytes.
    Status write(BitWriter& w) const;

    // Parses a header through its CRC-8 byte. Codes that defer to the
    // stream (0 for rate and size) resolve against the given values.
    Status read(BitReader& r, uint32_t stream_sample_rate, uint8_t stream_bit_depth, uint16_t stream_channels);

    bool is_independent() const {
        return this->channel_assignment < Frame::kLeftSide;
    }

    // Subframe sample size of channel `index`, including the extra side bit.
    uint8_t subframe_sample_size(size_t index) const;

    static Status write_utf8_uint(BitWriter& w, uint64_t value);
    static Status read_utf8_uint(BitReader& r, uint64_t& value);
};
