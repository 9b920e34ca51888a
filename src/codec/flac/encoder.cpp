#include "encoder.hpp"
#include "codec/bitstream/bit_writer.hpp"
#include "codec/checksum/crc.hpp"
#include "codec/checksum/pcm_md5.hpp"
#include "codec/frame/frame_header.hpp"
#include "codec/subframe/encoder.hpp"
#include "utils/logger.hpp"

namespace Flac {

namespace {
constexpr uint32_t kMaxEncodeChannels = 8;
constexpr uint8_t kMaxEncodeBitDepth = 32;
} // namespace

Status normalize_block_size(uint32_t requested, uint32_t& block_size) {
    if (requested == 0) {
        WAVIFY_DEBUG_LOG("[flac-enc] block size must be positive\n");
        return Status::InvalidParameter;
    }
    block_size = (requested > kMaxBlockSize) ? kMaxBlockSize : requested;
    return Status::Ok;
}

Encoder::Encoder(const Core::Format& format, uint32_t block_size)
    : format_(format),
      block_size_(block_size) {}

const Core::Format& Encoder::format() const {
    return this->format_;
}

uint32_t Encoder::block_size() const {
    return this->block_size_;
}

Status Encoder::validate_format(const Core::Format& format) {
    if (format.sample_format != Core::SampleFormat::Pcm) {
        WAVIFY_DEBUG_LOG("[flac-enc] only PCM sample format can be encoded\n");
        return Status::UnsupportedFormat;
    }
    if (format.channels < 1 || format.channels > kMaxEncodeChannels) {
        WAVIFY_DEBUG_LOG("[flac-enc] " << format.channels << " channels, encoder supports 1.." << kMaxEncodeChannels << "\n");
        return Status::UnsupportedFormat;
    }
    if (format.bit_depth > kMaxEncodeBitDepth) {
        WAVIFY_DEBUG_LOG("[flac-enc] bit depth " << static_cast<int>(format.bit_depth) << " above 32\n");
        return Status::UnsupportedFormat;
    }
    return Status::Ok;
}

Status Encoder::encode_frame(const int32_t* samples,
                             uint32_t frame_count,
                             uint64_t frame_number,
                             std::vector<uint8_t>& out) const {
    if (frame_count == 0) return Status::InvalidParameter;

    const uint32_t channels = this->format_.channels;

    FrameHeader hdr;
    hdr.block_size = frame_count;
    hdr.channels = static_cast<uint8_t>(channels);
    hdr.channel_assignment = static_cast<uint8_t>(channels - 1);
    hdr.sample_size = this->format_.bit_depth;
    hdr.frame_number = frame_number;

    BitWriter writer;
    Status st = hdr.write(writer);
    if (st != Status::Ok) return st;
    writer.align_to_byte();
    writer.write_bits(Crc::crc8(writer.get_buffer()), 8);

    Subframe::Encoder subframe_encoder(this->format_.bit_depth);
    std::vector<int64_t> channel_samples(frame_count);
    for (uint32_t ch = 0; ch < channels; ++ch) {
        for (uint32_t i = 0; i < frame_count; ++i) {
            channel_samples[i] = samples[static_cast<size_t>(i) * channels + ch];
        }
        subframe_encoder.encode(writer, channel_samples);
    }

    writer.align_to_byte();
    writer.write_bits(Crc::crc16(writer.get_buffer()), 16);

    const std::vector<uint8_t>& frame = writer.get_buffer();
    WAVIFY_TRACE_LOG("[flac-enc] frame " << frame_number << " block=" << frame_count
                     << " bytes=" << frame.size() << "\n");
    out.insert(out.end(), frame.begin(), frame.end());
    return Status::Ok;
}

Status Encoder::encode_frames(const int32_t* samples,
                              size_t sample_count,
                              uint32_t block_size,
                              uint64_t& next_frame_number,
                              std::vector<uint8_t>& out,
                              EncodeStats& stats) const {
    uint32_t frame_block_size = 0;
    Status st = normalize_block_size(block_size, frame_block_size);
    if (st != Status::Ok) return st;

    const size_t channels = this->format_.channels;
    if (channels == 0 || sample_count % channels != 0) return Status::InvalidParameter;

    const size_t total_frames = sample_count / channels;
    size_t position = 0;
    while (position < total_frames) {
        const size_t remaining = total_frames - position;
        const uint32_t frame_count = static_cast<uint32_t>(remaining < frame_block_size ? remaining : frame_block_size);

        const size_t before = out.size();
        st = this->encode_frame(samples + position * channels, frame_count, next_frame_number, out);
        if (st != Status::Ok) return st;

        stats.add_frame(frame_count, static_cast<uint32_t>(out.size() - before));
        ++next_frame_number;
        position += frame_count;
    }
    return Status::Ok;
}

Status Encoder::encode(const Core::SampleBuffer& buffer, std::vector<uint8_t>& out) const {
    Status st = this->format_.validate();
    if (st != Status::Ok) return st;
    st = validate_format(this->format_);
    if (st != Status::Ok) return st;
    if (buffer.format() != this->format_) return Status::InvalidParameter;
    st = buffer.validate();
    if (st != Status::Ok) return st;

    const std::vector<int32_t>& samples = buffer.samples();

    StreamInfo info;
    info.format = this->format_;
    info.total_samples = buffer.sample_frame_count();
    if (info.total_samples > kMaxTotalSamples) return Status::UnsupportedFormat;

    PcmMd5 md5;
    st = md5.update(samples, this->format_.bit_depth);
    if (st != Status::Ok) return st;
    if (!md5.finalize(info.md5)) return Status::StreamError;

    std::vector<uint8_t> frames;
    uint64_t next_frame_number = 0;
    st = this->encode_frames(samples.data(), samples.size(), this->block_size_, next_frame_number, frames, info.stats);
    if (st != Status::Ok) return st;

    st = write_stream_header(info, out);
    if (st != Status::Ok) return st;
    out.insert(out.end(), frames.begin(), frames.end());

    WAVIFY_TRACE_LOG("[flac-enc] " << next_frame_number << " frames, " << out.size() << " bytes\n");
    return Status::Ok;
}

} // namespace Flac
