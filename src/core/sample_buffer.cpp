#include "sample_buffer.hpp"
#include <utility>
#include "utils/logger.hpp"

namespace Core {

SampleBuffer::SampleBuffer() {}

SampleBuffer::SampleBuffer(std::vector<int32_t> samples, const Format& format)
    : samples_(std::move(samples)),
      format_(format) {}

Status SampleBuffer::validate() const {
    if (this->format_.channels == 0) return Status::InvalidParameter;
    if (this->samples_.size() % this->format_.channels != 0) return Status::InvalidParameter;

    // Samples must fit the declared PCM depth; 32-bit covers all of int32_t.
    const uint8_t depth = this->format_.bit_depth;
    if (this->format_.sample_format != SampleFormat::Pcm || depth == 0 || depth >= 32) return Status::Ok;
    const int32_t max_value = static_cast<int32_t>((int64_t(1) << (depth - 1)) - 1);
    const int32_t min_value = -max_value - 1;
    for (size_t i = 0; i < this->samples_.size(); ++i) {
        const int32_t s = this->samples_[i];
        if (s < min_value || s > max_value) {
            WAVIFY_DEBUG_LOG("[sample-buffer] sample " << i << " = " << s << " outside "
                             << static_cast<int>(depth) << "-bit range\n");
            return Status::InvalidParameter;
        }
    }
    return Status::Ok;
}

const Format& SampleBuffer::format() const {
    return this->format_;
}

const std::vector<int32_t>& SampleBuffer::samples() const {
    return this->samples_;
}

std::vector<int32_t>& SampleBuffer::samples() {
    return this->samples_;
}

size_t SampleBuffer::sample_frame_count() const {
    if (this->format_.channels == 0) return 0;
    return this->samples_.size() / this->format_.channels;
}

bool SampleBuffer::empty() const {
    return this->samples_.empty();
}

Status SampleBuffer::append(const SampleBuffer& other) {
    if (other.format_ != this->format_) return Status::InvalidParameter;
    this->samples_.insert(this->samples_.end(), other.samples_.begin(), other.samples_.end());
    return Status::Ok;
}

bool SampleBuffer::operator==(const SampleBuffer& other) const {
    return this->format_ == other.format_ && this->samples_ == other.samples_;
}

} // namespace Core
