#pragma once
#include <vector>
#include <cstdint>
#include <istream>
#include "codec/audio_codec.hpp"
#include "codec/flac/decoder.hpp"
#include "codec/status.hpp"

namespace Flac {

// Re-chunks decoded frames into buffers of exactly `chunk_size` sample
// frames; only the last chunk of a stream may be shorter.
class StreamDecoder : public ChunkSource {
public:
    StreamDecoder(std::istream& in, uint32_t chunk_size = kDefaultBlockSize);

    void set_verify_crc(bool enabled);

    Status open();
    Status next(Core::SampleBuffer& chunk, bool& has_chunk) override;

    const StreamInfo& stream_info() const;

private:
    std::istream& in;
    uint32_t chunk_size;
    Decoder decoder;
    bool opened;
    bool drained;
    std::vector<int32_t> pending;
    size_t pending_offset;
    std::vector<int32_t> frame;
};

} // namespace Flac
