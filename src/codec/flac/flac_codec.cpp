#include "flac_codec.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>
#include "codec/flac/decoder.hpp"
#include "codec/flac/encoder.hpp"
#include "codec/flac/stream_info.hpp"
#include "utils/logger.hpp"

namespace Flac {

namespace {
constexpr const char* kExtension = ".flac";

std::string lowercase_extension(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return std::string();

    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}
} // namespace

Codec::Codec()
    : verify_crc(false),
      block_size(kDefaultBlockSize) {}

void Codec::set_verify_crc(bool enabled) {
    this->verify_crc = enabled;
}

void Codec::set_block_size(uint32_t block_size) {
    this->block_size = block_size;
}

const char* Codec::name() const {
    return "flac";
}

bool Codec::can_read(const std::string& path) const {
    return lowercase_extension(path) == kExtension;
}

bool Codec::can_read(std::istream& in) const {
    char magic[4] = {0, 0, 0, 0};
    in.read(magic, sizeof(magic));
    const bool matched = in.gcount() == static_cast<std::streamsize>(sizeof(magic)) &&
                         std::memcmp(magic, kStreamMarker, sizeof(magic)) == 0;
    in.clear();
    in.seekg(0, std::ios::beg);
    return matched;
}

Status Codec::read(std::istream& in, Core::SampleBuffer& out) {
    Decoder decoder;
    decoder.set_verify_crc(this->verify_crc);
    return decoder.decode(in, out);
}

Status Codec::write(std::ostream& out, const Core::SampleBuffer& buffer) {
    Encoder encoder(buffer.format(), this->block_size);

    std::vector<uint8_t> bytes;
    Status st = encoder.encode(buffer, bytes);
    if (st != Status::Ok) return st;

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        WAVIFY_DEBUG_LOG("[flac] failed to write " << bytes.size() << " bytes\n");
        return Status::StreamError;
    }
    return Status::Ok;
}

Status Codec::metadata(std::istream& in, AudioMetadata& out) {
    if (!is_seekable(in)) return Status::StreamError;

    StreamInfo info;
    Status st = read_metadata(in, info);
    if (st != Status::Ok) return st;

    out = info.to_metadata();
    return Status::Ok;
}

Status Codec::open_reader(std::istream& in, uint32_t chunk_size, std::unique_ptr<ChunkSource>& reader) {
    auto decoder = std::make_unique<StreamDecoder>(in, chunk_size);
    decoder->set_verify_crc(this->verify_crc);

    Status st = decoder->open();
    if (st != Status::Ok) return st;

    reader = std::move(decoder);
    return Status::Ok;
}

Status Codec::open_writer(std::ostream& out,
                          const Core::Format& format,
                          const StreamWriteOptions& options,
                          std::unique_ptr<ChunkSink>& writer) {
    BlockSizeStrategy strategy = BlockSizeStrategy::PerChunk;
    Status st = parse_block_size_strategy(options.block_size_strategy, strategy);
    if (st != Status::Ok) return st;

    auto encoder = std::make_unique<StreamEncoder>(out, format, options.block_size, strategy);
    st = encoder->begin();
    if (st != Status::Ok) return st;

    writer = std::move(encoder);
    return Status::Ok;
}

Status Codec::stream_write(std::ostream& out,
                           const Core::Format& format,
                           const StreamWriteOptions& options,
                           const std::function<Status(ChunkSink&)>& producer) {
    std::unique_ptr<ChunkSink> writer;
    Status st = this->open_writer(out, format, options, writer);
    if (st != Status::Ok) return st;

    st = producer(*writer);
    if (st != Status::Ok) return st;

    return writer->finish();
}

Status Codec::stream_read(std::istream& in,
                          uint32_t chunk_size,
                          const std::function<Status(const Core::SampleBuffer&)>& consumer) {
    std::unique_ptr<ChunkSource> reader;
    Status st = this->open_reader(in, chunk_size, reader);
    if (st != Status::Ok) return st;

    Core::SampleBuffer chunk;
    bool has_chunk = true;
    while (true) {
        st = reader->next(chunk, has_chunk);
        if (st != Status::Ok) return st;
        if (!has_chunk) break;

        st = consumer(chunk);
        if (st != Status::Ok) return st;
    }
    return Status::Ok;
}

} // namespace Flac
