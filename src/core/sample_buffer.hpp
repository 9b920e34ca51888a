#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "codec/status.hpp"
#include "core/format.hpp"

namespace Core {

// Interleaved integer samples tagged with their format.
class SampleBuffer {
public:
    SampleBuffer();
    SampleBuffer(std::vector<int32_t> samples, const Format& format);

    // Sample count must be a multiple of the channel count and PCM samples
    // must fit the bit depth.
    Status validate() const;

    const Format& format() const;
    const std::vector<int32_t>& samples() const;
    std::vector<int32_t>& samples();

    size_t sample_frame_count() const;
    bool empty() const;

    Status append(const SampleBuffer& other);

    bool operator==(const SampleBuffer& other) const;

private:
    std::vector<int32_t> samples_;
    Format format_;
};

} // namespace Core
