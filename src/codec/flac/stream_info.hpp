#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>
#include "codec/audio_codec.hpp"
#include "codec/status.hpp"
#include "core/format.hpp"

namespace Flac {

constexpr uint8_t kStreamMarker[4] = {'f', 'L', 'a', 'C'};
constexpr uint32_t kMetadataHeaderLength = 4;
constexpr uint32_t kStreamInfoLength = 34;
constexpr uint8_t kStreamInfoBlockType = 0;
constexpr uint64_t kMaxTotalSamples = 0xFFFFFFFFFull; // 36 bits
constexpr uint32_t kDefaultBlockSize = 4096;
// Largest block the encoder emits; STREAMINFO stores block sizes in 16 bits.
constexpr uint32_t kMaxBlockSize = 65535;

// Block and frame size extremes of the frames written so far. A zero
// minimum means nothing has been recorded.
struct EncodeStats {
    uint32_t min_block_size;
    uint32_t max_block_size;
    uint32_t min_frame_size;
    uint32_t max_frame_size;

    EncodeStats()
        : min_block_size(0),
          max_block_size(0),
          min_frame_size(0),
          max_frame_size(0) {}

    void add_frame(uint32_t block_size, uint32_t frame_bytes);
    void merge(const EncodeStats& other);
    bool empty() const { return this->max_block_size == 0; }
};

struct StreamInfo {
    EncodeStats stats;
    Core::Format format;
    uint64_t total_samples;
    uint8_t md5[16];

    StreamInfo();

    // 34-byte STREAMINFO body.
    Status serialize(std::vector<uint8_t>& out) const;
    static Status parse(const uint8_t* data, size_t size, StreamInfo& info);

    AudioMetadata to_metadata() const;
};

// Marker and the last-block metadata header announcing STREAMINFO.
void write_stream_marker(std::vector<uint8_t>& out);

// Marker, last-block metadata header and STREAMINFO body.
Status write_stream_header(const StreamInfo& info, std::vector<uint8_t>& out);

// Rewinds `in`, checks the marker and walks every metadata block. Leaves
// the stream positioned at the first frame.
Status read_metadata(std::istream& in, StreamInfo& info);

bool is_seekable(std::istream& in);
bool is_seekable(std::ostream& out);

} // namespace Flac
