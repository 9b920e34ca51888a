#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <cmath>
#include <cstdlib>
#include <chrono>
#include <iomanip>
#include "io/wav_io.hpp"
#include "codec/flac/flac_codec.hpp"

static bool parse_u32_flag(const std::string& flag, const std::string& prefix, uint32_t& value) {
    if (flag.compare(0, prefix.size(), prefix) != 0) return false;
    const std::string digits = flag.substr(prefix.size());
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) return false;
    value = static_cast<uint32_t>(std::strtoul(digits.c_str(), nullptr, 10));
    return true;
}

static void usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  wavify_flac_cli encode input.wav output.flac [--block-size=N]"
                 " [--strategy=per_chunk|fixed|source_chunk] [--stream]\n";
    std::cerr << "  wavify_flac_cli decode input.flac output.wav [--verify-crc] [--chunk-size=N]\n";
    std::cerr << "  wavify_flac_cli info input.flac\n";
    std::cerr << "  wavify_flac_cli selftest\n";
}

static int run_encode(int argc, char** argv) {
    std::string in_path = argv[2];
    std::string out_path = argv[3];
    StreamWriteOptions options;
    bool streaming = false;
    for (int i = 4; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--stream") {
            streaming = true;
        } else if (parse_u32_flag(flag, "--block-size=", options.block_size)) {
            continue;
        } else if (flag.compare(0, 11, "--strategy=") == 0) {
            options.block_size_strategy = flag.substr(11);
            streaming = true;
        } else {
            usage();
            return 1;
        }
    }

    Core::SampleBuffer buffer;
    Status st = read_wav(in_path, buffer);
    if (st != Status::Ok) {
        std::cerr << "Failed to read WAV: " << in_path << " (" << status_name(st) << ")\n";
        return 1;
    }

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open output: " << out_path << "\n";
        return 1;
    }

    Flac::Codec codec;
    if (streaming) {
        // Feed the codec one block-sized chunk at a time.
        const uint32_t chunk_frames = options.block_size ? options.block_size : Flac::kDefaultBlockSize;
        const Core::Format format = buffer.format();
        st = codec.stream_write(out, format, options, [&](ChunkSink& sink) -> Status {
            const std::vector<int32_t>& samples = buffer.samples();
            const size_t step = static_cast<size_t>(chunk_frames) * format.channels;
            for (size_t pos = 0; pos < samples.size(); pos += step) {
                const size_t end = std::min(samples.size(), pos + step);
                Core::SampleBuffer chunk(std::vector<int32_t>(samples.begin() + pos, samples.begin() + end), format);
                Status chunk_status = sink.write(chunk);
                if (chunk_status != Status::Ok) return chunk_status;
            }
            return Status::Ok;
        });
    } else {
        codec.set_block_size(options.block_size);
        st = codec.write(out, buffer);
    }
    if (st != Status::Ok) {
        std::cerr << "Encode failed: " << status_name(st) << "\n";
        return 1;
    }

    std::cout << "Encoded " << in_path << " -> " << out_path << " ("
              << buffer.sample_frame_count() << " frames, " << out.tellp() << " bytes)\n";
    return 0;
}

static int run_decode(int argc, char** argv) {
    std::string in_path = argv[2];
    std::string out_path = argv[3];
    bool verify_crc = false;
    uint32_t chunk_size = 0;
    for (int i = 4; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--verify-crc") {
            verify_crc = true;
        } else if (parse_u32_flag(flag, "--chunk-size=", chunk_size)) {
            if (chunk_size == 0) {
                usage();
                return 1;
            }
        } else {
            usage();
            return 1;
        }
    }

    std::ifstream in(in_path, std::ios::binary);
    if (!in) {
        std::cerr << "Failed to open FLAC file: " << in_path << "\n";
        return 1;
    }

    Flac::Codec codec;
    codec.set_verify_crc(verify_crc);
    if (!codec.can_read(in)) {
        std::cerr << "Not a FLAC stream: " << in_path << "\n";
        return 1;
    }

    Core::SampleBuffer decoded;
    Status st = Status::Ok;
    size_t chunks = 0;
    if (chunk_size > 0) {
        st = codec.stream_read(in, chunk_size, [&](const Core::SampleBuffer& chunk) -> Status {
            ++chunks;
            if (decoded.empty()) {
                decoded = chunk;
                return Status::Ok;
            }
            return decoded.append(chunk);
        });
    } else {
        st = codec.read(in, decoded);
    }
    if (st != Status::Ok) {
        std::cerr << "Decode failed: " << status_name(st) << "\n";
        return 1;
    }

    st = write_wav(out_path, decoded);
    if (st != Status::Ok) {
        std::cerr << "Failed to write WAV: " << out_path << " (" << status_name(st) << ")\n";
        return 1;
    }
    std::cout << "Decoded " << in_path << " -> " << out_path << " ("
              << decoded.sample_frame_count() << " frames";
    if (chunk_size > 0) std::cout << " in " << chunks << " chunks";
    std::cout << ")\n";
    return 0;
}

static int run_info(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "Failed to open FLAC file: " << path << "\n";
        return 1;
    }

    Flac::Codec codec;
    AudioMetadata meta;
    Status st = codec.metadata(in, meta);
    if (st != Status::Ok) {
        std::cerr << "Failed to read metadata: " << status_name(st) << "\n";
        return 1;
    }

    std::cout << "channels:      " << meta.format.channels << "\n";
    std::cout << "sample rate:   " << meta.format.sample_rate << " Hz\n";
    std::cout << "bit depth:     " << static_cast<int>(meta.format.bit_depth) << "\n";
    std::cout << "sample frames: " << meta.sample_frame_count << "\n";
    std::cout << "duration:      " << std::fixed << std::setprecision(3) << meta.duration_seconds << " s\n";
    std::cout << "block size:    " << meta.min_block_size << ".." << meta.max_block_size << "\n";
    std::cout << "frame size:    " << meta.min_frame_size << ".." << meta.max_frame_size << " bytes\n";
    std::cout << "md5:           " << meta.md5 << "\n";
    return 0;
}

static int run_selftest() {
    const double pi = 3.14159265358979323846;

    auto generate_signal = [&](const Core::Format& format, size_t frames) {
        std::vector<int32_t> samples(frames * format.channels);
        const double amplitude = std::ldexp(1.0, format.bit_depth - 1) * 0.4;
        for (size_t i = 0; i < frames; ++i) {
            double t = static_cast<double>(i) / static_cast<double>(format.sample_rate);
            for (uint16_t ch = 0; ch < format.channels; ++ch) {
                const double freq = 440.0 + 3.0 * ch;
                samples[i * format.channels + ch] = static_cast<int32_t>(std::sin(2.0 * pi * freq * t) * amplitude);
            }
        }
        return Core::SampleBuffer(std::move(samples), format);
    };

    auto run_case = [&](const Core::Format& format, const std::string& strategy) -> bool {
        const size_t frames = std::max<size_t>(format.sample_rate / 20, 2048);
        Core::SampleBuffer source = generate_signal(format, frames);

        Flac::Codec codec;
        std::stringstream whole;
        auto t0 = std::chrono::high_resolution_clock::now();
        if (codec.write(whole, source) != Status::Ok) {
            std::cerr << "write failed for sr=" << format.sample_rate << " depth=" << int(format.bit_depth) << "\n";
            return false;
        }
        Core::SampleBuffer decoded;
        codec.set_verify_crc(true);
        if (codec.read(whole, decoded) != Status::Ok || !(decoded == source)) {
            std::cerr << "roundtrip mismatch for sr=" << format.sample_rate << " depth=" << int(format.bit_depth) << "\n";
            return false;
        }
        auto t1 = std::chrono::high_resolution_clock::now();

        std::stringstream streamed;
        StreamWriteOptions options;
        options.block_size = 1152;
        options.block_size_strategy = strategy;
        Status st = codec.stream_write(streamed, format, options, [&](ChunkSink& sink) -> Status {
            const size_t half = (source.samples().size() / format.channels / 2) * format.channels;
            Core::SampleBuffer a(std::vector<int32_t>(source.samples().begin(), source.samples().begin() + half), format);
            Core::SampleBuffer b(std::vector<int32_t>(source.samples().begin() + half, source.samples().end()), format);
            Status chunk_status = sink.write(a);
            if (chunk_status != Status::Ok) return chunk_status;
            return sink.write(b);
        });
        Core::SampleBuffer restreamed;
        if (st != Status::Ok || codec.read(streamed, restreamed) != Status::Ok || !(restreamed == source)) {
            std::cerr << "stream roundtrip (" << strategy << ") failed for sr=" << format.sample_rate << "\n";
            return false;
        }

        auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
        std::cout << "Selftest sr=" << format.sample_rate << "Hz depth=" << int(format.bit_depth)
                  << " ch=" << format.channels
                  << " whole=" << whole.str().size() << " bytes (" << us << "us)"
                  << " " << strategy << "=" << streamed.str().size() << " bytes\n";
        return true;
    };

    if (!run_case(Core::Format(2, 44100, 16), "per_chunk")) return 1;
    if (!run_case(Core::Format(1, 48000, 24), "fixed")) return 1;
    if (!run_case(Core::Format(2, 96000, 24), "source_chunk")) return 1;
    if (!run_case(Core::Format(6, 48000, 8), "fixed")) return 1;
    if (!run_case(Core::Format(2, 44100, 32), "per_chunk")) return 1;

    std::cout << "Selftest complete: all round trips matched.\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string mode = argv[1];

    if (mode == "encode" || mode == "decode") {
        if (argc < 4) {
            usage();
            return 1;
        }
        return (mode == "encode") ? run_encode(argc, argv) : run_decode(argc, argv);
    }

    if (mode == "info") {
        if (argc < 3) {
            usage();
            return 1;
        }
        return run_info(argv[2]);
    }

    if (mode == "selftest") {
        return run_selftest();
    }

    usage();
    return 1;
}
