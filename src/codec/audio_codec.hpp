#pragma once
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include "codec/status.hpp"
#include "core/format.hpp"
#include "core/sample_buffer.hpp"

// Stream-level facts reported without decoding audio.
struct AudioMetadata {
    Core::Format format;
    uint64_t sample_frame_count;
    double duration_seconds;
    uint32_t min_block_size;
    uint32_t max_block_size;
    uint32_t min_frame_size;
    uint32_t max_frame_size;
    std::string md5; // 32 lowercase hex characters

    AudioMetadata()
        : sample_frame_count(0),
          duration_seconds(0.0),
          min_block_size(0),
          max_block_size(0),
          min_frame_size(0),
          max_frame_size(0) {}
};

struct StreamWriteOptions {
    uint32_t block_size;
    std::string block_size_strategy; // "per_chunk", "fixed" or "source_chunk"

    StreamWriteOptions()
        : block_size(4096),
          block_size_strategy("per_chunk") {}
};

// Pull side of a streaming read. `has_chunk` turns false at end of stream.
class ChunkSource {
public:
    virtual ~ChunkSource() {}
    virtual Status next(Core::SampleBuffer& chunk, bool& has_chunk) = 0;
};

// Push side of a streaming write. Nothing is complete until finish().
class ChunkSink {
public:
    virtual ~ChunkSink() {}
    virtual Status write(const Core::SampleBuffer& chunk) = 0;
    virtual Status finish() = 0;
};

class AudioCodec {
public:
    virtual ~AudioCodec() {}

    virtual const char* name() const = 0;

    // Judged by file extension only.
    virtual bool can_read(const std::string& path) const = 0;
    // Judged by magic bytes; the stream is rewound afterwards.
    virtual bool can_read(std::istream& in) const = 0;

    virtual Status read(std::istream& in, Core::SampleBuffer& out) = 0;
    virtual Status write(std::ostream& out, const Core::SampleBuffer& buffer) = 0;
    virtual Status metadata(std::istream& in, AudioMetadata& out) = 0;

    virtual Status open_reader(std::istream& in, uint32_t chunk_size, std::unique_ptr<ChunkSource>& reader) = 0;
    virtual Status open_writer(std::ostream& out,
                               const Core::Format& format,
                               const StreamWriteOptions& options,
                               std::unique_ptr<ChunkSink>& writer) = 0;
};
