#include "stream_decoder.hpp"
#include <utility>
#include "utils/logger.hpp"

namespace Flac {

StreamDecoder::StreamDecoder(std::istream& in, uint32_t chunk_size)
    : in(in),
      chunk_size(chunk_size),
      opened(false),
      drained(false),
      pending_offset(0) {}

void StreamDecoder::set_verify_crc(bool enabled) {
    this->decoder.set_verify_crc(enabled);
}

const StreamInfo& StreamDecoder::stream_info() const {
    return this->decoder.stream_info();
}

Status StreamDecoder::open() {
    if (this->chunk_size == 0) {
        WAVIFY_DEBUG_LOG("[flac-stream] chunk size must be positive\n");
        return Status::InvalidParameter;
    }

    Status st = this->decoder.open(this->in);
    if (st != Status::Ok) return st;

    this->opened = true;
    this->drained = false;
    this->pending.clear();
    this->pending_offset = 0;
    return Status::Ok;
}

Status StreamDecoder::next(Core::SampleBuffer& chunk, bool& has_chunk) {
    has_chunk = false;
    if (!this->opened) return Status::InvalidParameter;

    const Core::Format& format = this->decoder.stream_info().format;
    const size_t chunk_samples = static_cast<size_t>(this->chunk_size) * format.channels;

    while (!this->drained && this->pending.size() - this->pending_offset < chunk_samples) {
        bool has_frame = false;
        Status st = this->decoder.next_frame(this->frame, has_frame);
        if (st != Status::Ok) return st;
        if (!has_frame) {
            this->drained = true;
            break;
        }

        if (this->pending_offset > 0) {
            this->pending.erase(this->pending.begin(), this->pending.begin() + this->pending_offset);
            this->pending_offset = 0;
        }
        this->pending.insert(this->pending.end(), this->frame.begin(), this->frame.end());
    }

    const size_t available = this->pending.size() - this->pending_offset;
    if (available == 0) return Status::Ok;

    const size_t take = (available < chunk_samples) ? available : chunk_samples;
    std::vector<int32_t> out(this->pending.begin() + this->pending_offset,
                             this->pending.begin() + this->pending_offset + take);
    this->pending_offset += take;

    chunk = Core::SampleBuffer(std::move(out), format);
    has_chunk = true;
    return Status::Ok;
}

} // namespace Flac
