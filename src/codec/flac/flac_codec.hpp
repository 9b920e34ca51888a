#pragma once
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include "codec/audio_codec.hpp"
#include "codec/flac/stream_encoder.hpp"
#include "codec/flac/stream_decoder.hpp"

namespace Flac {

class Codec : public AudioCodec {
public:
    Codec();

    // Applies to read() and open_reader().
    void set_verify_crc(bool enabled);
    // Frames per block for write().
    void set_block_size(uint32_t block_size);

    const char* name() const override;

    bool can_read(const std::string& path) const override;
    bool can_read(std::istream& in) const override;

    Status read(std::istream& in, Core::SampleBuffer& out) override;
    Status write(std::ostream& out, const Core::SampleBuffer& buffer) override;
    Status metadata(std::istream& in, AudioMetadata& out) override;

    Status open_reader(std::istream& in, uint32_t chunk_size, std::unique_ptr<ChunkSource>& reader) override;
    Status open_writer(std::ostream& out,
                       const Core::Format& format,
                       const StreamWriteOptions& options,
                       std::unique_ptr<ChunkSink>& writer) override;

    // Opens a writer, hands it to `producer` and finalizes the stream when
    // the producer succeeds.
    Status stream_write(std::ostream& out,
                        const Core::Format& format,
                        const StreamWriteOptions& options,
                        const std::function<Status(ChunkSink&)>& producer);

    // Feeds every chunk to `consumer`; stops at the first non-Ok status.
    Status stream_read(std::istream& in,
                       uint32_t chunk_size,
                       const std::function<Status(const Core::SampleBuffer&)>& consumer);

private:
    bool verify_crc;
    uint32_t block_size;
};

} // namespace Flac
