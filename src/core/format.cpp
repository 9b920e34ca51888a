#include "format.hpp"
#include "utils/logger.hpp"

namespace Core {

namespace {
constexpr uint16_t kMaxChannels = 32;
constexpr uint32_t kMinSampleRate = 8000;
constexpr uint32_t kMaxSampleRate = 768000;
} // namespace

Status Format::validate() const {
    if (this->channels < 1 || this->channels > kMaxChannels) {
        WAVIFY_DEBUG_LOG("[format] channels out of range: " << this->channels << "\n");
        return Status::InvalidFormat;
    }
    if (this->sample_rate < kMinSampleRate || this->sample_rate > kMaxSampleRate) {
        WAVIFY_DEBUG_LOG("[format] sample_rate out of range: " << this->sample_rate << "\n");
        return Status::InvalidFormat;
    }

    bool depth_ok = false;
    if (this->sample_format == SampleFormat::Pcm) {
        depth_ok = this->bit_depth == 8 || this->bit_depth == 16 || this->bit_depth == 24 || this->bit_depth == 32;
    } else {
        depth_ok = this->bit_depth == 32 || this->bit_depth == 64;
    }
    if (!depth_ok) {
        WAVIFY_DEBUG_LOG("[format] bit_depth " << static_cast<int>(this->bit_depth) << " invalid for sample format\n");
        return Status::InvalidFormat;
    }
    return Status::Ok;
}

} // namespace Core
