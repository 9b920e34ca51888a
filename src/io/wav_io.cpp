#include "wav_io.hpp"
#include <fstream>
#include <utility>
#include <vector>
#include "utils/logger.hpp"

namespace {

constexpr uint16_t kWavePcm = 1;
constexpr uint16_t kMaxChannels = 8;

bool is_supported_bit_depth(uint16_t bits) {
    return bits == 8 || bits == 16 || bits == 24 || bits == 32;
}

uint16_t read_u16_le(std::ifstream& f) {
    uint8_t b[2] = {0, 0};
    f.read(reinterpret_cast<char*>(b), 2);
    return static_cast<uint16_t>(b[0] | (static_cast<uint16_t>(b[1]) << 8));
}

uint32_t read_u32_le(std::ifstream& f) {
    uint8_t b[4] = {0, 0, 0, 0};
    f.read(reinterpret_cast<char*>(b), 4);
    return static_cast<uint32_t>(b[0] |
                                 (static_cast<uint32_t>(b[1]) << 8) |
                                 (static_cast<uint32_t>(b[2]) << 16) |
                                 (static_cast<uint32_t>(b[3]) << 24));
}

void write_u16_le(std::ofstream& f, uint16_t v) {
    uint8_t b[2] = { static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF) };
    f.write(reinterpret_cast<const char*>(b), 2);
}

void write_u32_le(std::ofstream& f, uint32_t v) {
    uint8_t b[4] = {
        static_cast<uint8_t>(v & 0xFF),
        static_cast<uint8_t>((v >> 8) & 0xFF),
        static_cast<uint8_t>((v >> 16) & 0xFF),
        static_cast<uint8_t>((v >> 24) & 0xFF)
    };
    f.write(reinterpret_cast<const char*>(b), 4);
}

int32_t read_pcm_sample(const uint8_t*& p, uint16_t bits) {
    switch (bits) {
        case 8: {
            int32_t sample = static_cast<int32_t>(p[0]) - 128;
            p += 1;
            return sample;
        }
        case 16: {
            int32_t sample = static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                                  (static_cast<uint32_t>(p[1]) << 8));
            p += 2;
            if (sample & 0x8000) sample |= ~0xFFFF;
            return sample;
        }
        case 24: {
            int32_t sample = static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                                  (static_cast<uint32_t>(p[1]) << 8) |
                                                  (static_cast<uint32_t>(p[2]) << 16));
            p += 3;
            if (sample & 0x800000) sample |= ~0xFFFFFF;
            return sample;
        }
        default: {
            uint32_t u = static_cast<uint32_t>(p[0]) |
                         (static_cast<uint32_t>(p[1]) << 8) |
                         (static_cast<uint32_t>(p[2]) << 16) |
                         (static_cast<uint32_t>(p[3]) << 24);
            p += 4;
            return static_cast<int32_t>(u);
        }
    }
}

void write_pcm_sample(std::vector<uint8_t>& out, int32_t v, uint16_t bits) {
    if (bits == 8) {
        out.push_back(static_cast<uint8_t>(v + 128));
        return;
    }
    const uint32_t u = static_cast<uint32_t>(v);
    for (uint16_t shift = 0; shift < bits; shift += 8) {
        out.push_back(static_cast<uint8_t>((u >> shift) & 0xFF));
    }
}

} // namespace

Status read_wav(const std::string& path, Core::SampleBuffer& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        WAVIFY_DEBUG_LOG("[wav] cannot open " << path << "\n");
        return Status::StreamError;
    }

    char riff[4];
    f.read(riff, 4);
    if (f.gcount() != 4 || std::string(riff, 4) != "RIFF") return Status::InvalidFormat;
    uint32_t riff_size = read_u32_le(f);
    (void)riff_size;
    char wave[4];
    f.read(wave, 4);
    if (f.gcount() != 4 || std::string(wave, 4) != "WAVE") return Status::InvalidFormat;

    bool got_fmt = false;
    uint16_t fmt_audio_format = 0;
    uint16_t fmt_channels = 0;
    uint32_t fmt_sample_rate = 0;
    uint16_t fmt_block_align = 0;
    uint16_t fmt_bits_per_sample = 0;

    while (f) {
        char chunk_id[4];
        f.read(chunk_id, 4);
        if (f.gcount() != 4) break;
        uint32_t chunk_size = read_u32_le(f);

        if (std::string(chunk_id, 4) == "fmt ") {
            if (chunk_size < 16) return Status::InvalidFormat;
            fmt_audio_format = read_u16_le(f);
            fmt_channels = read_u16_le(f);
            fmt_sample_rate = read_u32_le(f);
            uint32_t byte_rate = read_u32_le(f);
            (void)byte_rate;
            fmt_block_align = read_u16_le(f);
            fmt_bits_per_sample = read_u16_le(f);
            if (chunk_size > 16) {
                f.seekg(static_cast<std::streamoff>(chunk_size - 16), std::ios::cur);
            }
            got_fmt = true;
        } else if (std::string(chunk_id, 4) == "data") {
            if (!got_fmt) return Status::InvalidFormat;
            if (fmt_audio_format != kWavePcm) return Status::UnsupportedFormat;
            if (!is_supported_bit_depth(fmt_bits_per_sample)) return Status::UnsupportedFormat;
            if (fmt_channels < 1 || fmt_channels > kMaxChannels) return Status::UnsupportedFormat;
            const uint16_t bytes_per_sample = static_cast<uint16_t>(fmt_bits_per_sample / 8);
            if (fmt_block_align != fmt_channels * bytes_per_sample) return Status::InvalidFormat;
            if (chunk_size % fmt_block_align != 0) return Status::InvalidFormat;

            std::vector<char> raw(chunk_size);
            f.read(raw.data(), static_cast<std::streamsize>(chunk_size));
            if (f.gcount() != static_cast<std::streamsize>(chunk_size)) return Status::InvalidFormat;

            const size_t count = chunk_size / bytes_per_sample;
            std::vector<int32_t> samples(count);
            const uint8_t* p = reinterpret_cast<const uint8_t*>(raw.data());
            for (size_t i = 0; i < count; ++i) {
                samples[i] = read_pcm_sample(p, fmt_bits_per_sample);
            }

            Core::Format format(fmt_channels, fmt_sample_rate, static_cast<uint8_t>(fmt_bits_per_sample));
            Status st = format.validate();
            if (st != Status::Ok) return st;

            out = Core::SampleBuffer(std::move(samples), format);
            WAVIFY_TRACE_LOG("[wav] read " << out.sample_frame_count() << " frames from " << path << "\n");
            return Status::Ok;
        } else {
            f.seekg(static_cast<std::streamoff>(chunk_size), std::ios::cur);
        }

        if (chunk_size % 2 == 1 && f) f.seekg(1, std::ios::cur);
    }

    WAVIFY_DEBUG_LOG("[wav] no data chunk in " << path << "\n");
    return Status::InvalidFormat;
}

Status write_wav(const std::string& path, const Core::SampleBuffer& buffer) {
    const Core::Format& format = buffer.format();
    if (format.sample_format != Core::SampleFormat::Pcm) return Status::UnsupportedFormat;
    if (format.channels < 1 || format.channels > kMaxChannels) return Status::UnsupportedFormat;
    if (!is_supported_bit_depth(format.bit_depth)) return Status::UnsupportedFormat;
    Status st = buffer.validate();
    if (st != Status::Ok) return st;

    const uint32_t block_align = format.block_align();
    const uint32_t data_size = static_cast<uint32_t>(buffer.samples().size() * format.bytes_per_sample());
    const uint32_t riff_size = 36 + data_size;

    std::ofstream f(path, std::ios::binary);
    if (!f) return Status::StreamError;

    f.write("RIFF", 4);
    write_u32_le(f, riff_size);
    f.write("WAVE", 4);

    f.write("fmt ", 4);
    write_u32_le(f, 16);
    write_u16_le(f, kWavePcm);
    write_u16_le(f, format.channels);
    write_u32_le(f, format.sample_rate);
    write_u32_le(f, format.sample_rate * block_align);
    write_u16_le(f, static_cast<uint16_t>(block_align));
    write_u16_le(f, format.bit_depth);

    f.write("data", 4);
    write_u32_le(f, data_size);

    std::vector<uint8_t> bytes;
    bytes.reserve(data_size);
    for (int32_t s : buffer.samples()) {
        write_pcm_sample(bytes, s, format.bit_depth);
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));

    return f.good() ? Status::Ok : Status::StreamError;
}
