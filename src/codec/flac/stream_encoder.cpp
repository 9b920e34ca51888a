#include "stream_encoder.hpp"
#include "utils/logger.hpp"

namespace Flac {

Status parse_block_size_strategy(const std::string& name, BlockSizeStrategy& strategy) {
    if (name == "per_chunk") {
        strategy = BlockSizeStrategy::PerChunk;
    } else if (name == "fixed") {
        strategy = BlockSizeStrategy::Fixed;
    } else if (name == "source_chunk") {
        strategy = BlockSizeStrategy::SourceChunk;
    } else {
        WAVIFY_DEBUG_LOG("[flac-stream] unknown block size strategy '" << name << "'\n");
        return Status::InvalidParameter;
    }
    return Status::Ok;
}

const char* block_size_strategy_name(BlockSizeStrategy strategy) {
    switch (strategy) {
        case BlockSizeStrategy::PerChunk: return "per_chunk";
        case BlockSizeStrategy::Fixed: return "fixed";
        case BlockSizeStrategy::SourceChunk: return "source_chunk";
    }
    return "unknown";
}

StreamEncoder::StreamEncoder(std::ostream& out,
                             const Core::Format& format,
                             uint32_t block_size,
                             BlockSizeStrategy strategy)
    : out(out),
      encoder(format, block_size),
      requested_block_size(block_size),
      block_size(0),
      strategy(strategy),
      state(State::Idle),
      streaminfo_offset(0),
      total_samples_(0),
      next_frame_number(0) {}

const EncodeStats& StreamEncoder::stats() const {
    return this->stats_;
}

uint64_t StreamEncoder::total_samples() const {
    return this->total_samples_;
}

uint64_t StreamEncoder::frames_written() const {
    return this->next_frame_number;
}

Status StreamEncoder::write_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return Status::Ok;
    this->out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!this->out) {
        WAVIFY_DEBUG_LOG("[flac-stream] write of " << bytes.size() << " bytes failed\n");
        return Status::StreamError;
    }
    return Status::Ok;
}

Status StreamEncoder::begin() {
    if (this->state != State::Idle) return Status::InvalidParameter;

    const Core::Format& format = this->encoder.format();
    Status st = format.validate();
    if (st != Status::Ok) return st;
    st = Encoder::validate_format(format);
    if (st != Status::Ok) return st;
    st = normalize_block_size(this->requested_block_size, this->block_size);
    if (st != Status::Ok) return st;

    if (!is_seekable(this->out)) {
        WAVIFY_DEBUG_LOG("[flac-stream] output stream is not seekable\n");
        return Status::StreamError;
    }
    this->out.seekp(0, std::ios::beg);
    if (!this->out) return Status::StreamError;

    if (!this->md5.reset()) return Status::StreamError;

    // Zero-filled STREAMINFO, patched by finish().
    this->scratch.clear();
    write_stream_marker(this->scratch);
    this->streaminfo_offset = this->out.tellp() + static_cast<std::streamoff>(this->scratch.size());
    this->scratch.resize(this->scratch.size() + kStreamInfoLength, 0);
    st = this->write_bytes(this->scratch);
    if (st != Status::Ok) return st;

    WAVIFY_TRACE_LOG("[flac-stream] begin block=" << this->block_size
                     << " strategy=" << block_size_strategy_name(this->strategy) << "\n");
    this->state = State::Open;
    return Status::Ok;
}

Status StreamEncoder::emit(const int32_t* samples, size_t count, uint32_t frame_block_size) {
    this->scratch.clear();
    Status st = this->encoder.encode_frames(samples, count, frame_block_size, this->next_frame_number,
                                            this->scratch, this->stats_);
    if (st != Status::Ok) return st;
    return this->write_bytes(this->scratch);
}

Status StreamEncoder::write(const Core::SampleBuffer& chunk) {
    if (this->state != State::Open) return Status::InvalidParameter;

    const Core::Format& format = this->encoder.format();
    if (chunk.format() != format) {
        WAVIFY_DEBUG_LOG("[flac-stream] chunk format differs from stream format\n");
        return Status::InvalidParameter;
    }
    Status st = chunk.validate();
    if (st != Status::Ok) return st;
    if (chunk.empty()) return Status::Ok;

    const size_t frames = chunk.sample_frame_count();
    if (this->strategy == BlockSizeStrategy::SourceChunk && frames > kMaxBlockSize) {
        WAVIFY_DEBUG_LOG("[flac-stream] chunk of " << frames << " frames exceeds maximum frame size\n");
        return Status::UnsupportedFormat;
    }

    st = this->md5.update(chunk.samples(), format.bit_depth);
    if (st != Status::Ok) return st;
    this->total_samples_ += frames;

    const std::vector<int32_t>& samples = chunk.samples();
    switch (this->strategy) {
        case BlockSizeStrategy::Fixed: {
            this->pending.insert(this->pending.end(), samples.begin(), samples.end());
            const size_t run = static_cast<size_t>(this->block_size) * format.channels;
            size_t offset = 0;
            while (this->pending.size() - offset >= run) {
                st = this->emit(this->pending.data() + offset, run, this->block_size);
                if (st != Status::Ok) return st;
                offset += run;
            }
            this->pending.erase(this->pending.begin(), this->pending.begin() + offset);
            return Status::Ok;
        }
        case BlockSizeStrategy::SourceChunk:
            return this->emit(samples.data(), samples.size(), static_cast<uint32_t>(frames));
        case BlockSizeStrategy::PerChunk:
        default:
            return this->emit(samples.data(), samples.size(), this->block_size);
    }
}

Status StreamEncoder::finish() {
    if (this->state != State::Open) return Status::InvalidParameter;

    Status st = Status::Ok;
    if (!this->pending.empty()) {
        st = this->emit(this->pending.data(), this->pending.size(), this->block_size);
        if (st != Status::Ok) return st;
        this->pending.clear();
    }

    StreamInfo info;
    info.format = this->encoder.format();
    info.stats = this->stats_;
    info.total_samples = this->total_samples_;
    if (!this->md5.finalize(info.md5)) return Status::StreamError;

    this->scratch.clear();
    st = info.serialize(this->scratch);
    if (st != Status::Ok) return st;

    const std::streampos end = this->out.tellp();
    this->out.seekp(this->streaminfo_offset);
    if (!this->out) return Status::StreamError;
    st = this->write_bytes(this->scratch);
    if (st != Status::Ok) return st;
    this->out.seekp(end);
    this->out.flush();
    if (!this->out) return Status::StreamError;

    WAVIFY_TRACE_LOG("[flac-stream] finish frames=" << this->next_frame_number
                     << " total=" << this->total_samples_ << "\n");
    this->state = State::Finished;
    return Status::Ok;
}

} // namespace Flac
