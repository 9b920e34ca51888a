#pragma once
#include <vector>
#include <cstdint>
#include <ostream>
#include <string>
#include "codec/audio_codec.hpp"
#include "codec/flac/encoder.hpp"
#include "codec/flac/stream_info.hpp"
#include "codec/checksum/pcm_md5.hpp"
#include "codec/status.hpp"

namespace Flac {

enum class BlockSizeStrategy : uint8_t {
    PerChunk,    // each chunk cut into block_size frames, remainder as a short frame
    Fixed,       // block_size frames across chunk boundaries, remainder carried over
    SourceChunk  // one frame per chunk
};

Status parse_block_size_strategy(const std::string& name, BlockSizeStrategy& strategy);
const char* block_size_strategy_name(BlockSizeStrategy strategy);

// Incremental writer. begin() emits a placeholder STREAMINFO which finish()
// patches in place, so the output must be seekable.
class StreamEncoder : public ChunkSink {
public:
    StreamEncoder(std::ostream& out,
                  const Core::Format& format,
                  uint32_t block_size = kDefaultBlockSize,
                  BlockSizeStrategy strategy = BlockSizeStrategy::PerChunk);

    Status begin();
    Status write(const Core::SampleBuffer& chunk) override;
    Status finish() override;

    const EncodeStats& stats() const;
    uint64_t total_samples() const;
    uint64_t frames_written() const;

private:
    enum class State : uint8_t {
        Idle,
        Open,
        Finished
    };

    std::ostream& out;
    Encoder encoder;
    uint32_t requested_block_size;
    uint32_t block_size;
    BlockSizeStrategy strategy;
    State state;
    std::streampos streaminfo_offset;
    EncodeStats stats_;
    uint64_t total_samples_;
    uint64_t next_frame_number;
    PcmMd5 md5;
    std::vector<int32_t> pending;
    std::vector<uint8_t> scratch;

    Status emit(const int32_t* samples, size_t count, uint32_t frame_block_size);
    Status write_bytes(const std::vector<uint8_t>& bytes);
};

} // namespace Flac
