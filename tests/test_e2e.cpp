#include "codec/flac/flac_codec.hpp"
#include "codec/checksum/pcm_md5.hpp"
#include "io/wav_io.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

std::filesystem::path write_temp_path(const std::string& ext) {
    static uint64_t counter = 0;
    auto base = std::filesystem::temp_directory_path() / ("wavify_flac_test_" + std::to_string(++counter) + ext);
    return base;
}

Core::SampleBuffer make_signal(const Core::Format& format, size_t frames) {
    const double two_pi = 6.28318530717958647692;
    const double amplitude = std::ldexp(1.0, format.bit_depth - 1) * 0.6;
    std::vector<int32_t> samples(frames * format.channels);
    uint32_t state = 7;
    for (size_t i = 0; i < frames; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(format.sample_rate);
        for (uint16_t ch = 0; ch < format.channels; ++ch) {
            state = state * 1664525u + 1013904223u;
            const double dither = static_cast<double>((state >> 24) & 0x7) - 3.5;
            const double v = std::sin(two_pi * (220.0 * (ch + 1)) * t) * amplitude + dither;
            samples[i * format.channels + ch] = static_cast<int32_t>(v);
        }
    }
    return Core::SampleBuffer(std::move(samples), format);
}

struct CompareResult {
    bool equal = true;
    size_t mismatches = 0;
    int64_t max_abs_diff = 0;
};

CompareResult compare_pcm(const std::vector<int32_t>& a, const std::vector<int32_t>& b) {
    CompareResult res;
    if (a.size() != b.size()) {
        res.equal = false;
        res.mismatches = (a.size() > b.size()) ? (a.size() - b.size()) : (b.size() - a.size());
        return res;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) {
            ++res.mismatches;
            int64_t diff = static_cast<int64_t>(a[i]) - static_cast<int64_t>(b[i]);
            int64_t adiff = diff >= 0 ? diff : -diff;
            if (adiff > res.max_abs_diff) res.max_abs_diff = adiff;
        }
    }
    res.equal = (res.mismatches == 0);
    return res;
}

void assert_same(const std::string& name, const Core::SampleBuffer& expected, const Core::SampleBuffer& actual) {
    assert(actual.format() == expected.format());
    CompareResult cmp = compare_pcm(expected.samples(), actual.samples());
    if (!cmp.equal) {
        std::cerr << "[e2e-mismatch] case=" << name
                  << " mismatches=" << cmp.mismatches << " maxdiff=" << cmp.max_abs_diff << "\n";
        assert(false && "PCM mismatch");
    }
}

std::string expected_md5(const Core::SampleBuffer& buffer) {
    PcmMd5 md5;
    uint8_t digest[16];
    assert(md5.update(buffer.samples(), buffer.format().bit_depth) == Status::Ok);
    const bool finalized = md5.finalize(digest);
    assert(finalized);
    return PcmMd5::hex(digest);
}

void run_codec_case(const std::string& name, const Core::SampleBuffer& source, uint32_t block_size) {
    Flac::Codec codec;
    codec.set_block_size(block_size);
    std::stringstream io;
    assert(codec.write(io, source) == Status::Ok);

    AudioMetadata meta;
    assert(codec.metadata(io, meta) == Status::Ok);
    assert(meta.format == source.format());
    assert(meta.sample_frame_count == source.sample_frame_count());
    assert(meta.md5 == expected_md5(source));

    Core::SampleBuffer decoded;
    codec.set_verify_crc(true);
    assert(codec.read(io, decoded) == Status::Ok);
    assert_same(name, source, decoded);

    std::cout << "[e2e] ok " << name << " bytes=" << io.str().size()
              << " raw=" << source.samples().size() * source.format().bytes_per_sample() << "\n";
}

void test_whole_stream_metadata() {
    const Core::Format format(2, 44100, 16);
    const Core::SampleBuffer source = make_signal(format, 4500);

    Flac::Codec codec;
    std::stringstream io;
    assert(codec.write(io, source) == Status::Ok);

    AudioMetadata meta;
    assert(codec.metadata(io, meta) == Status::Ok);
    assert(meta.min_block_size == 404);
    assert(meta.max_block_size == 4096);
    assert(meta.sample_frame_count == 4500);
    assert(std::fabs(meta.duration_seconds - 4500.0 / 44100.0) < 1e-9);
    assert(meta.min_frame_size > 0 && meta.min_frame_size < meta.max_frame_size);
    assert(meta.md5.size() == 32);
    assert(meta.md5 == expected_md5(source));

    Core::SampleBuffer decoded;
    assert(codec.read(io, decoded) == Status::Ok);
    assert(decoded == source);
    // Sine plus dither compresses well below raw PCM.
    assert(io.str().size() < source.samples().size() * 2);
    std::cout << "Test e2e_whole_stream_metadata passed\n";
}

void test_depths_and_channels() {
    run_codec_case("mono_8bit", make_signal(Core::Format(1, 8000, 8), 3000), 4096);
    run_codec_case("stereo_24bit_96k", make_signal(Core::Format(2, 96000, 24), 10000), 4096);
    run_codec_case("surround_16bit", make_signal(Core::Format(6, 48000, 16), 2500), 1152);
    run_codec_case("octo_24bit", make_signal(Core::Format(8, 48000, 24), 700), 256);
    run_codec_case("stereo_32bit", make_signal(Core::Format(2, 44100, 32), 3000), 4096);

    std::vector<int32_t> extremes;
    for (int i = 0; i < 64; ++i) {
        extremes.push_back((i & 1) ? std::numeric_limits<int32_t>::max() : std::numeric_limits<int32_t>::min());
        extremes.push_back(i * 1000003);
    }
    run_codec_case("extremes_32bit", Core::SampleBuffer(extremes, Core::Format(2, 44100, 32)), 4096);

    const std::vector<int32_t> edges16 = {32767, -32768, 0, -1, 32767, 32767, -32768, 1};
    run_codec_case("edges_16bit", Core::SampleBuffer(edges16, Core::Format(1, 44100, 16)), 4096);
    const std::vector<int32_t> edges8 = {127, -128, -128, 127, 0, 5};
    run_codec_case("edges_8bit", Core::SampleBuffer(edges8, Core::Format(2, 8000, 8)), 4096);

    std::vector<int32_t> silence(2 * 5000, 0);
    run_codec_case("silence", Core::SampleBuffer(silence, Core::Format(2, 44100, 16)), 4096);

    run_codec_case("tiny_blocks", make_signal(Core::Format(1, 22050, 16), 100), 1);
    std::cout << "Test e2e_depths_and_channels passed\n";
}

void test_empty_and_invalid_buffers() {
    Flac::Codec codec;
    const Core::Format format(2, 44100, 16);

    std::stringstream empty;
    assert(codec.write(empty, Core::SampleBuffer(std::vector<int32_t>{}, format)) == Status::Ok);
    assert(empty.str().size() == 42);
    AudioMetadata meta;
    assert(codec.metadata(empty, meta) == Status::Ok);
    assert(meta.sample_frame_count == 0);
    assert(meta.min_block_size == 0 && meta.max_block_size == 0);
    assert(meta.md5 == "d41d8cd98f00b204e9800998ecf8427e");
    Core::SampleBuffer decoded;
    assert(codec.read(empty, decoded) == Status::Ok);
    assert(decoded.empty());
    assert(decoded.format() == format);

    std::stringstream odd;
    assert(codec.write(odd, Core::SampleBuffer(std::vector<int32_t>{1, 2, 3}, format)) == Status::InvalidParameter);
    assert(codec.write(odd, Core::SampleBuffer(std::vector<int32_t>{1, 2}, Core::Format(2, 44100, 20))) ==
           Status::InvalidFormat);
    assert(codec.write(odd, Core::SampleBuffer(std::vector<int32_t>{1, 2}, Core::Format(2, 44100, 32, Core::SampleFormat::Float))) ==
           Status::UnsupportedFormat);
    assert(codec.write(odd, Core::SampleBuffer(std::vector<int32_t>(12, 0), Core::Format(12, 44100, 16))) ==
           Status::UnsupportedFormat);

    // Samples past the declared depth are rejected, not wrapped.
    std::vector<int32_t> loud;
    for (int32_t v = 40000; v < 40008; ++v) loud.push_back(v);
    assert(codec.write(odd, Core::SampleBuffer(loud, Core::Format(1, 44100, 16))) == Status::InvalidParameter);
    assert(codec.write(odd, Core::SampleBuffer(std::vector<int32_t>{0, -129}, Core::Format(1, 8000, 8))) ==
           Status::InvalidParameter);
    assert(codec.write(odd, Core::SampleBuffer(std::vector<int32_t>{1 << 23, 0}, Core::Format(2, 48000, 24))) ==
           Status::InvalidParameter);
    assert(odd.str().empty());

    codec.set_block_size(0);
    assert(codec.write(odd, Core::SampleBuffer(std::vector<int32_t>{1, 2}, format)) == Status::InvalidParameter);
    std::cout << "Test e2e_empty_and_invalid passed\n";
}

void test_detection() {
    Flac::Codec codec;
    assert(std::string(codec.name()) == "flac");
    assert(codec.can_read(std::string("music/track01.flac")));
    assert(codec.can_read(std::string("TRACK.FLAC")));
    assert(!codec.can_read(std::string("track.wav")));
    assert(!codec.can_read(std::string("album.flac/cover")));
    assert(!codec.can_read(std::string("flac")));

    std::stringstream io;
    assert(codec.write(io, make_signal(Core::Format(1, 44100, 16), 100)) == Status::Ok);
    assert(codec.can_read(io));
    assert(io.tellg() == std::streampos(0));

    std::istringstream riff(std::string("RIFF\x24\x00\x00\x00WAVE", 12));
    assert(!codec.can_read(riff));
    std::istringstream short_input(std::string("fL"));
    assert(!codec.can_read(short_input));
    assert(short_input.tellg() == std::streampos(0));
    std::cout << "Test e2e_detection passed\n";
}

void run_wav_case(const std::string& name, const Core::SampleBuffer& source, bool streaming) {
    std::cout << "[e2e] start " << name << "\n";
    const auto src_path = write_temp_path(".wav");
    assert(write_wav(src_path.string(), source) == Status::Ok);

    Core::SampleBuffer orig;
    assert(read_wav(src_path.string(), orig) == Status::Ok);
    assert_same(name + "_wav", source, orig);

    Flac::Codec codec;
    const auto flac_path = write_temp_path(".flac");
    {
        std::fstream f(flac_path, std::ios::in | std::ios::out | std::ios::trunc | std::ios::binary);
        assert(f.good());
        if (streaming) {
            StreamWriteOptions options;
            options.block_size = 1000;
            options.block_size_strategy = "fixed";
            const Core::Format format = orig.format();
            Status st = codec.stream_write(f, format, options, [&](ChunkSink& sink) -> Status {
                const size_t step = 777 * format.channels;
                const std::vector<int32_t>& s = orig.samples();
                for (size_t pos = 0; pos < s.size(); pos += step) {
                    const size_t end = std::min(s.size(), pos + step);
                    Status chunk_status = sink.write(
                        Core::SampleBuffer(std::vector<int32_t>(s.begin() + pos, s.begin() + end), format));
                    if (chunk_status != Status::Ok) return chunk_status;
                }
                return Status::Ok;
            });
            assert(st == Status::Ok);
        } else {
            assert(codec.write(f, orig) == Status::Ok);
        }
    }
    assert(codec.can_read(flac_path.string()));

    Core::SampleBuffer decoded;
    {
        std::ifstream in(flac_path, std::ios::binary);
        assert(in.good());
        assert(codec.can_read(in));
        codec.set_verify_crc(true);
        assert(codec.read(in, decoded) == Status::Ok);
    }

    const auto out_wav_path = write_temp_path(".wav");
    assert(write_wav(out_wav_path.string(), decoded) == Status::Ok);
    Core::SampleBuffer restored;
    assert(read_wav(out_wav_path.string(), restored) == Status::Ok);
    assert_same(name, source, restored);

    std::error_code ec;
    std::filesystem::remove(src_path, ec);
    std::filesystem::remove(flac_path, ec);
    std::filesystem::remove(out_wav_path, ec);
    std::cout << "[e2e] ok " << name << "\n";
}

void test_wav_errors() {
    Core::SampleBuffer out;
    assert(read_wav((std::filesystem::temp_directory_path() / "wavify_flac_missing.wav").string(), out) ==
           Status::StreamError);

    const auto bogus = write_temp_path(".wav");
    {
        const std::string bytes = std::string("RIFF\x04\x00\x00\x00", 8) + "AVI ";
        std::ofstream f(bogus, std::ios::binary);
        f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }
    assert(read_wav(bogus.string(), out) == Status::InvalidFormat);

    const auto float_path = write_temp_path(".wav");
    assert(write_wav(float_path.string(),
                     Core::SampleBuffer(std::vector<int32_t>{0, 0}, Core::Format(2, 44100, 32, Core::SampleFormat::Float))) ==
           Status::UnsupportedFormat);

    const auto loud_path = write_temp_path(".wav");
    assert(write_wav(loud_path.string(),
                     Core::SampleBuffer(std::vector<int32_t>{40000, 0}, Core::Format(1, 44100, 16))) ==
           Status::InvalidParameter);

    std::error_code ec;
    std::filesystem::remove(loud_path, ec);
    std::filesystem::remove(bogus, ec);
    std::filesystem::remove(float_path, ec);
    std::cout << "Test e2e_wav_errors passed\n";
}

} // namespace

void run_e2e_tests() {
    test_whole_stream_metadata();
    test_depths_and_channels();
    test_empty_and_invalid_buffers();
    test_detection();
    run_wav_case("16.44100", make_signal(Core::Format(2, 44100, 16), 9000), false);
    run_wav_case("24.48000", make_signal(Core::Format(2, 48000, 24), 9000), true);
    run_wav_case("8.22050.mono", make_signal(Core::Format(1, 22050, 8), 4000), false);
    run_wav_case("32.96000", make_signal(Core::Format(2, 96000, 32), 3000), true);
    test_wav_errors();
    std::cout << "e2e wav->flac->wav tests ok\n";
}
