#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include "codec/flac/stream_info.hpp"
#include "codec/status.hpp"
#include "core/format.hpp"
#include "core/sample_buffer.hpp"

namespace Flac {

// Zero is rejected; anything above 65535 is clamped.
Status normalize_block_size(uint32_t requested, uint32_t& block_size);

class Encoder {
public:
    explicit Encoder(const Core::Format& format, uint32_t block_size = kDefaultBlockSize);

    // PCM only, 1..8 channels, at most 32 bits per sample.
    static Status validate_format(const Core::Format& format);

    // One frame of `frame_count` interleaved sample frames, appended to `out`.
    Status encode_frame(const int32_t* samples,
                        uint32_t frame_count,
                        uint64_t frame_number,
                        std::vector<uint8_t>& out) const;

    // Cuts `sample_count` interleaved samples into frames of `block_size`
    // sample frames (the tail becomes a short frame). Frame numbers start at
    // `next_frame_number`, which is advanced past the last frame written.
    Status encode_frames(const int32_t* samples,
                         size_t sample_count,
                         uint32_t block_size,
                         uint64_t& next_frame_number,
                         std::vector<uint8_t>& out,
                         EncodeStats& stats) const;

    // Complete stream: marker, STREAMINFO and frames.
    Status encode(const Core::SampleBuffer& buffer, std::vector<uint8_t>& out) const;

    const Core::Format& format() const;
    uint32_t block_size() const;

private:
    Core::Format format_;
    uint32_t block_size_;
};

} // namespace Flac
