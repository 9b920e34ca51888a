#include "decoder.hpp"
#include <utility>
#include "codec/channel/decorrelation.hpp"
#include "codec/checksum/crc.hpp"
#include "codec/subframe/decoder.hpp"
#include "utils/logger.hpp"

namespace Flac {

Decoder::Decoder()
    : in(nullptr),
      verify_crc_(false),
      opened(false),
      finished(false),
      bounded(false),
      remaining(0),
      expected_frame_number(0) {}

void Decoder::set_verify_crc(bool enabled) {
    this->verify_crc_ = enabled;
}

bool Decoder::verify_crc() const {
    return this->verify_crc_;
}

const StreamInfo& Decoder::stream_info() const {
    return this->info;
}

Status Decoder::open(std::istream& in) {
    this->opened = false;
    if (!is_seekable(in)) {
        WAVIFY_DEBUG_LOG("[flac-dec] input stream is not seekable\n");
        return Status::StreamError;
    }

    Status st = read_metadata(in, this->info);
    if (st != Status::Ok) return st;

    this->in = &in;
    this->opened = true;
    this->finished = false;
    this->bounded = this->info.total_samples > 0;
    this->remaining = this->info.total_samples;
    this->expected_frame_number = 0;
    WAVIFY_TRACE_LOG("[flac-dec] stream " << this->info.format.channels << "ch "
                     << this->info.format.sample_rate << "Hz "
                     << static_cast<int>(this->info.format.bit_depth) << "bit total="
                     << this->info.total_samples << "\n");
    return Status::Ok;
}

Status Decoder::decode_frame(BitReader& r, std::vector<int32_t>& samples, FrameHeader* out_header) {
    const Core::Format& format = this->info.format;

    this->frame_bytes.clear();
    r.begin_capture(&this->frame_bytes);

    FrameHeader hdr;
    Status st = hdr.read(r, format.sample_rate, format.bit_depth, format.channels);
    if (st != Status::Ok) {
        r.end_capture();
        return st;
    }

    if (this->verify_crc_) {
        const uint8_t crc8 = Crc::crc8(this->frame_bytes.data(), this->frame_bytes.size() - 1);
        if (crc8 != hdr.crc8) {
            WAVIFY_DEBUG_LOG("[flac-dec] frame " << hdr.frame_number << " header CRC-8 mismatch\n");
            r.end_capture();
            return Status::InvalidFormat;
        }
    }

    if (hdr.frame_number != this->expected_frame_number) {
        WAVIFY_DEBUG_LOG("[flac-dec] frame number " << hdr.frame_number << ", expected "
                         << this->expected_frame_number << "\n");
        r.end_capture();
        return Status::InvalidFormat;
    }
    WAVIFY_TRACE_LOG("[flac-dec] frame " << hdr.frame_number << " block=" << hdr.block_size
                     << " assignment=" << static_cast<int>(hdr.channel_assignment) << "\n");

    Subframe::Decoder subframe_decoder;
    this->channel_samples.resize(hdr.channels);
    for (size_t ch = 0; ch < hdr.channels; ++ch) {
        st = subframe_decoder.decode(r, hdr.block_size, hdr.subframe_sample_size(ch), this->channel_samples[ch]);
        if (st != Status::Ok) {
            WAVIFY_DEBUG_LOG("[flac-dec] frame " << hdr.frame_number << " channel " << ch
                             << ": " << status_name(st) << "\n");
            r.end_capture();
            return st;
        }
    }

    if (!hdr.is_independent()) {
        st = Channel::restore(hdr.channel_assignment, this->channel_samples[0], this->channel_samples[1]);
        if (st != Status::Ok) {
            r.end_capture();
            return st;
        }
    }

    r.align_to_byte();
    const uint16_t crc16 = static_cast<uint16_t>(r.read_bits(16));
    r.end_capture();
    if (r.has_error()) {
        WAVIFY_DEBUG_LOG("[flac-dec] truncated frame " << hdr.frame_number << "\n");
        return Status::InvalidFormat;
    }

    if (this->verify_crc_) {
        const uint16_t expected = Crc::crc16(this->frame_bytes.data(), this->frame_bytes.size() - 2);
        if (crc16 != expected) {
            WAVIFY_DEBUG_LOG("[flac-dec] frame " << hdr.frame_number << " CRC-16 mismatch\n");
            return Status::InvalidFormat;
        }
    }

    samples.resize(static_cast<size_t>(hdr.block_size) * hdr.channels);
    for (uint32_t i = 0; i < hdr.block_size; ++i) {
        for (size_t ch = 0; ch < hdr.channels; ++ch) {
            samples[static_cast<size_t>(i) * hdr.channels + ch] = static_cast<int32_t>(this->channel_samples[ch][i]);
        }
    }

    ++this->expected_frame_number;
    if (out_header) *out_header = hdr;
    return Status::Ok;
}

Status Decoder::next_frame(std::vector<int32_t>& samples, bool& has_frame) {
    has_frame = false;
    if (!this->opened) return Status::InvalidParameter;
    if (this->finished) return Status::Ok;

    const bool exhausted = this->bounded && this->remaining == 0;
    const bool at_eof = this->in->peek() == std::istream::traits_type::eof();
    if (exhausted || at_eof) {
        this->finished = true;
        if (this->bounded && this->remaining > 0) {
            WAVIFY_DEBUG_LOG("[flac-dec] stream ended " << this->remaining
                             << " sample frames short of STREAMINFO total\n");
            return Status::InvalidFormat;
        }
        return Status::Ok;
    }

    BitReader reader(*this->in);
    Status st = this->decode_frame(reader, samples);
    if (st != Status::Ok) return st;

    if (this->bounded) {
        const size_t channels = this->info.format.channels;
        const uint64_t frames = samples.size() / channels;
        if (frames > this->remaining) {
            samples.resize(static_cast<size_t>(this->remaining) * channels);
            this->remaining = 0;
        } else {
            this->remaining -= frames;
        }
    }

    has_frame = true;
    return Status::Ok;
}

Status Decoder::decode(std::istream& in, Core::SampleBuffer& out) {
    Status st = this->open(in);
    if (st != Status::Ok) return st;

    std::vector<int32_t> all;
    std::vector<int32_t> frame;
    bool has_frame = true;
    while (true) {
        st = this->next_frame(frame, has_frame);
        if (st != Status::Ok) return st;
        if (!has_frame) break;
        all.insert(all.end(), frame.begin(), frame.end());
    }

    out = Core::SampleBuffer(std::move(all), this->info.format);
    return Status::Ok;
}

} // namespace Flac
