#pragma once
#include <cstdint>
#include "codec/status.hpp"

namespace Core {

enum class SampleFormat : uint8_t {
    Pcm = 0,
    Float = 1
};

// Sample layout of an audio stream. Plain value type, equality by field.
struct Format {
    uint16_t channels;
    uint32_t sample_rate;
    uint8_t bit_depth;
    SampleFormat sample_format;

    Format()
        : channels(2),
          sample_rate(44100),
          bit_depth(16),
          sample_format(SampleFormat::Pcm) {}

    Format(uint16_t channels, uint32_t sample_rate, uint8_t bit_depth, SampleFormat sample_format = SampleFormat::Pcm)
        : channels(channels),
          sample_rate(sample_rate),
          bit_depth(bit_depth),
          sample_format(sample_format) {}

    // channels 1..32, sample rate 8000..768000, PCM depth 8/16/24/32, float depth 32/64
    Status validate() const;

    uint32_t bytes_per_sample() const {
        return this->bit_depth / 8u;
    }

    uint32_t block_align() const {
        return this->channels * this->bytes_per_sample();
    }

    bool operator==(const Format& other) const {
        return this->channels == other.channels &&
               this->sample_rate == other.sample_rate &&
               this->bit_depth == other.bit_depth &&
               this->sample_format == other.sample_format;
    }

    bool operator!=(const Format& other) const {
        return !(*this == other);
    }
};

} // namespace Core
