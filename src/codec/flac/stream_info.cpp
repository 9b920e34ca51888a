#include "stream_info.hpp"
#include <algorithm>
#include <cstring>
#include "codec/bitstream/bit_reader.hpp"
#include "codec/bitstream/bit_writer.hpp"
#include "codec/checksum/pcm_md5.hpp"
#include "utils/logger.hpp"

namespace Flac {

namespace {
constexpr uint32_t kMaxFrameSizeField = 0xFFFFFF;

bool read_exact(std::istream& in, uint8_t* dst, size_t size) {
    if (size == 0) return true;
    in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(size));
    return static_cast<size_t>(in.gcount()) == size;
}
} // namespace

void EncodeStats::add_frame(uint32_t block_size, uint32_t frame_bytes) {
    EncodeStats single;
    single.min_block_size = block_size;
    single.max_block_size = block_size;
    single.min_frame_size = frame_bytes;
    single.max_frame_size = frame_bytes;
    this->merge(single);
}

void EncodeStats::merge(const EncodeStats& other) {
    if (other.empty()) return;

    this->min_block_size = (this->min_block_size == 0) ? other.min_block_size
                                                       : std::min(this->min_block_size, other.min_block_size);
    this->max_block_size = std::max(this->max_block_size, other.max_block_size);
    this->min_frame_size = (this->min_frame_size == 0) ? other.min_frame_size
                                                       : std::min(this->min_frame_size, other.min_frame_size);
    this->max_frame_size = std::max(this->max_frame_size, other.max_frame_size);
}

StreamInfo::StreamInfo()
    : total_samples(0)
{
    std::memset(this->md5, 0, sizeof(this->md5));
}

Status StreamInfo::serialize(std::vector<uint8_t>& out) const {
    if (this->total_samples > kMaxTotalSamples) {
        WAVIFY_DEBUG_LOG("[streaminfo] total samples " << this->total_samples << " exceed 36 bits\n");
        return Status::UnsupportedFormat;
    }
    if (this->stats.min_frame_size > kMaxFrameSizeField || this->stats.max_frame_size > kMaxFrameSizeField) {
        return Status::InvalidParameter;
    }
    if (this->stats.max_block_size > kMaxBlockSize) {
        WAVIFY_DEBUG_LOG("[streaminfo] block size " << this->stats.max_block_size << " does not fit 16 bits\n");
        return Status::InvalidParameter;
    }

    BitWriter w;
    w.write_bits(this->stats.min_block_size, 16);
    w.write_bits(this->stats.max_block_size, 16);
    w.write_bits(this->stats.min_frame_size, 24);
    w.write_bits(this->stats.max_frame_size, 24);
    w.write_bits(this->format.sample_rate & 0xFFFFFu, 20);
    w.write_bits(static_cast<uint32_t>(this->format.channels - 1) & 0x7u, 3);
    w.write_bits(static_cast<uint32_t>(this->format.bit_depth - 1) & 0x1Fu, 5);
    w.write_bits(this->total_samples, 36);
    for (int i = 0; i < 16; ++i) {
        w.write_bits(this->md5[i], 8);
    }

    const std::vector<uint8_t>& body = w.get_buffer();
    out.insert(out.end(), body.begin(), body.end());
    return Status::Ok;
}

Status StreamInfo::parse(const uint8_t* data, size_t size, StreamInfo& info) {
    if (size != kStreamInfoLength) {
        WAVIFY_DEBUG_LOG("[streaminfo] block is " << size << " bytes, expected " << kStreamInfoLength << "\n");
        return Status::InvalidFormat;
    }

    BitReader r(data, size);
    info.stats.min_block_size = static_cast<uint32_t>(r.read_bits(16));
    info.stats.max_block_size = static_cast<uint32_t>(r.read_bits(16));
    info.stats.min_frame_size = static_cast<uint32_t>(r.read_bits(24));
    info.stats.max_frame_size = static_cast<uint32_t>(r.read_bits(24));
    info.format.sample_rate = static_cast<uint32_t>(r.read_bits(20));
    info.format.channels = static_cast<uint16_t>(r.read_bits(3) + 1);
    info.format.bit_depth = static_cast<uint8_t>(r.read_bits(5) + 1);
    info.format.sample_format = Core::SampleFormat::Pcm;
    info.total_samples = r.read_bits(36);
    for (int i = 0; i < 16; ++i) {
        info.md5[i] = static_cast<uint8_t>(r.read_bits(8));
    }
    if (r.has_error()) return Status::InvalidFormat;

    return info.format.validate();
}

AudioMetadata StreamInfo::to_metadata() const {
    AudioMetadata m;
    m.format = this->format;
    m.sample_frame_count = this->total_samples;
    m.duration_seconds = (this->format.sample_rate > 0)
        ? static_cast<double>(this->total_samples) / static_cast<double>(this->format.sample_rate)
        : 0.0;
    m.min_block_size = this->stats.min_block_size;
    m.max_block_size = this->stats.max_block_size;
    m.min_frame_size = this->stats.min_frame_size;
    m.max_frame_size = this->stats.max_frame_size;
    m.md5 = PcmMd5::hex(this->md5);
    return m;
}

void write_stream_marker(std::vector<uint8_t>& out) {
    out.insert(out.end(), kStreamMarker, kStreamMarker + 4);
    out.push_back(static_cast<uint8_t>(0x80u | kStreamInfoBlockType)); // last metadata block
    out.push_back(0x00);
    out.push_back(0x00);
    out.push_back(static_cast<uint8_t>(kStreamInfoLength));
}

Status write_stream_header(const StreamInfo& info, std::vector<uint8_t>& out) {
    write_stream_marker(out);
    return info.serialize(out);
}

Status read_metadata(std::istream& in, StreamInfo& info) {
    in.clear();
    in.seekg(0, std::ios::beg);
    if (!in) return Status::StreamError;

    uint8_t marker[4];
    if (!read_exact(in, marker, sizeof(marker))) {
        WAVIFY_DEBUG_LOG("[metadata] missing stream marker\n");
        return Status::InvalidFormat;
    }
    if (std::memcmp(marker, kStreamMarker, sizeof(marker)) != 0) {
        WAVIFY_DEBUG_LOG("[metadata] invalid stream marker\n");
        return Status::InvalidFormat;
    }

    bool found = false;
    bool last = false;
    std::vector<uint8_t> body;
    while (!last) {
        uint8_t header[kMetadataHeaderLength];
        if (!read_exact(in, header, sizeof(header))) {
            WAVIFY_DEBUG_LOG("[metadata] truncated metadata block header\n");
            return Status::InvalidFormat;
        }
        last = (header[0] & 0x80u) != 0;
        const uint8_t type = header[0] & 0x7Fu;
        const uint32_t length = (static_cast<uint32_t>(header[1]) << 16) |
                                (static_cast<uint32_t>(header[2]) << 8) |
                                static_cast<uint32_t>(header[3]);

        body.resize(length);
        if (!read_exact(in, body.data(), length)) {
            WAVIFY_DEBUG_LOG("[metadata] truncated metadata block type " << static_cast<int>(type) << "\n");
            return Status::InvalidFormat;
        }
        WAVIFY_TRACE_LOG("[metadata] block type=" << static_cast<int>(type) << " length=" << length
                         << (last ? " (last)" : "") << "\n");

        if (type == kStreamInfoBlockType) {
            Status st = StreamInfo::parse(body.data(), body.size(), info);
            if (st != Status::Ok) return st;
            found = true;
        }
    }

    if (!found) {
        WAVIFY_DEBUG_LOG("[metadata] STREAMINFO block missing\n");
        return Status::InvalidFormat;
    }
    return Status::Ok;
}

bool is_seekable(std::istream& in) {
    in.clear();
    return in.tellg() != std::streampos(-1);
}

bool is_seekable(std::ostream& out) {
    return out.tellp() != std::streampos(-1);
}

} // namespace Flac
