#pragma once
#include <vector>
#include <cstdint>
#include <istream>
#include "codec/bitstream/bit_reader.hpp"
#include "codec/flac/stream_info.hpp"
#include "codec/frame/frame_header.hpp"
#include "codec/status.hpp"
#include "core/sample_buffer.hpp"

namespace Flac {

// Frame-by-frame reader over a seekable stream. open() parses the
// metadata; next_frame() then yields interleaved samples per frame.
class Decoder {
public:
    Decoder();

    // Off by default: CRC-8 and CRC-16 are read but not compared.
    void set_verify_crc(bool enabled);
    bool verify_crc() const;

    Status open(std::istream& in);

    // `has_frame` turns false at end of stream. When STREAMINFO declares a
    // positive total, output stops at that total and a shortfall is an error.
    Status next_frame(std::vector<int32_t>& samples, bool& has_frame);

    // Decodes the frame at the reader's position against the open stream.
    Status decode_frame(BitReader& r, std::vector<int32_t>& samples, FrameHeader* out_header = nullptr);

    // open() followed by every frame.
    Status decode(std::istream& in, Core::SampleBuffer& out);

    const StreamInfo& stream_info() const;

private:
    std::istream* in;
    StreamInfo info;
    bool verify_crc_;
    bool opened;
    bool finished;
    bool bounded;
    uint64_t remaining;
    uint64_t expected_frame_number;
    std::vector<uint8_t> frame_bytes;
    std::vector<std::vector<int64_t>> channel_samples;
};

} // namespace Flac
