#include "flac_test_builder.hpp"
#include "codec/channel/decorrelation.hpp"
#include "codec/flac/decoder.hpp"
#include "codec/flac/encoder.hpp"
#include "codec/flac/flac_codec.hpp"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using TestFlac::FrameBuilder;

Status decode_bytes(const std::string& bytes, Core::SampleBuffer& out, bool verify_crc = false) {
    std::istringstream in(bytes);
    Flac::Decoder decoder;
    decoder.set_verify_crc(verify_crc);
    return decoder.decode(in, out);
}

void test_verbatim_mono() {
    FrameBuilder frame(4, 0);
    TestFlac::write_verbatim(frame.bits(), {0, 1000, -1000, 32767}, 16);
    const std::string bytes = TestFlac::to_string(TestFlac::stream_header(1, 16, 4), {frame.finish()});

    Core::SampleBuffer out;
    assert(decode_bytes(bytes, out, true) == Status::Ok);
    assert(out.format() == Core::Format(1, 44100, 16));
    assert((out.samples() == std::vector<int32_t>{0, 1000, -1000, 32767}));
    std::cout << "Test decode_verbatim_mono passed\n";
}

void test_constant_stereo() {
    FrameBuilder frame(4, 1);
    TestFlac::write_constant(frame.bits(), 42, 16);
    TestFlac::write_constant(frame.bits(), -42, 16);
    const std::string bytes = TestFlac::to_string(TestFlac::stream_header(2, 16, 4), {frame.finish()});

    Core::SampleBuffer out;
    assert(decode_bytes(bytes, out) == Status::Ok);
    assert((out.samples() == std::vector<int32_t>{42, -42, 42, -42, 42, -42, 42, -42}));
    std::cout << "Test decode_constant_stereo passed\n";
}

void test_stereo_decorrelation() {
    const std::vector<int64_t> left = {100, 110, 120, 130};
    const std::vector<int64_t> right = {4, 6, 8, 10};
    const std::vector<int32_t> expected = {100, 4, 110, 6, 120, 8, 130, 10};

    std::vector<int64_t> side(4);
    std::vector<int64_t> mid(4);
    for (size_t i = 0; i < 4; ++i) {
        side[i] = left[i] - right[i];
        mid[i] = (left[i] + right[i]) >> 1;
    }

    FrameBuilder left_side(4, Frame::kLeftSide);
    TestFlac::write_verbatim(left_side.bits(), left, 16);
    TestFlac::write_verbatim(left_side.bits(), side, 17);

    FrameBuilder side_right(4, Frame::kSideRight, 1);
    TestFlac::write_verbatim(side_right.bits(), side, 17);
    TestFlac::write_verbatim(side_right.bits(), right, 16);

    FrameBuilder mid_side(4, Frame::kMidSide, 2);
    TestFlac::write_verbatim(mid_side.bits(), mid, 16);
    TestFlac::write_verbatim(mid_side.bits(), side, 17);

    const std::string bytes = TestFlac::to_string(TestFlac::stream_header(2, 16, 12),
                                                  {left_side.finish(), side_right.finish(), mid_side.finish()});
    Core::SampleBuffer out;
    assert(decode_bytes(bytes, out, true) == Status::Ok);
    assert(out.sample_frame_count() == 12);
    for (size_t f = 0; f < 3; ++f) {
        std::vector<int32_t> frame(out.samples().begin() + f * 8, out.samples().begin() + (f + 1) * 8);
        assert(frame == expected);
    }

    // Odd sums keep their low bit through the side channel.
    std::vector<int64_t> l2 = {-7, 3, 32767, -32768};
    std::vector<int64_t> r2 = {2, -4, -32768, 32767};
    std::vector<int64_t> m2(4), s2(4);
    for (size_t i = 0; i < 4; ++i) {
        s2[i] = l2[i] - r2[i];
        m2[i] = (l2[i] + r2[i]) >> 1;
    }
    assert(Channel::restore(Frame::kMidSide, m2, s2) == Status::Ok);
    assert(m2 == l2);
    assert(s2 == r2);
    std::cout << "Test decode_stereo_decorrelation passed\n";
}

void test_fixed_order2_roundtrip() {
    const std::vector<int32_t> ramp = {1000, 1010, 1020, 1030, 1040, 1050};
    Core::SampleBuffer source(ramp, Core::Format(1, 44100, 16));

    Flac::Encoder encoder(source.format());
    std::vector<uint8_t> bytes;
    assert(encoder.encode(source, bytes) == Status::Ok);

    // marker (4) + metadata header (4) + STREAMINFO (34), then the frame;
    // header is 6 bytes, CRC-8 at frame byte 6, subframe header at byte 7
    const size_t frame_start = 42;
    assert((bytes[frame_start + 7] >> 1) == 10);

    Core::SampleBuffer out;
    assert(decode_bytes(std::string(bytes.begin(), bytes.end()), out, true) == Status::Ok);
    assert(out == source);

    FrameBuilder hand(6, 0);
    TestFlac::write_fixed(hand.bits(), {1000, 1010, 1020, 1030, 1040, 1050}, 2, 16);
    Core::SampleBuffer hand_out;
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 6), {hand.finish()}), hand_out) == Status::Ok);
    assert(hand_out.samples() == ramp);
    std::cout << "Test decode_fixed_order2 passed\n";
}

void test_wasted_bits() {
    // Samples are multiples of 8: three wasted bits, coded as 1 then unary 2.
    FrameBuilder frame(4, 0);
    BitWriter& w = frame.bits();
    w.write_bit(0);
    w.write_bits(1, 6);
    w.write_bit(1);
    w.write_unary_zeros(2);
    for (int64_t s : {8, -16, 24, 32760}) {
        w.write_signed_bits(s >> 3, 13);
    }
    Core::SampleBuffer out;
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 4), {frame.finish()}), out, true) == Status::Ok);
    assert((out.samples() == std::vector<int32_t>{8, -16, 24, 32760}));

    // Wasted bits covering the whole sample size are rejected.
    FrameBuilder bad(4, 0);
    bad.bits().write_bit(0);
    bad.bits().write_bits(0, 6);
    bad.bits().write_bit(1);
    bad.bits().write_unary_zeros(15);
    Core::SampleBuffer bad_out;
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 4), {bad.finish()}), bad_out) ==
           Status::InvalidFormat);
    std::cout << "Test decode_wasted_bits passed\n";
}

void test_unsupported_subframe_type() {
    FrameBuilder frame(4, 0);
    frame.bits().write_bit(0);
    frame.bits().write_bits(13, 6);
    frame.bits().write_bit(0);
    frame.bits().write_bits(0, 64);
    Core::SampleBuffer out;
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 4), {frame.finish()}), out) ==
           Status::UnsupportedFormat);

    FrameBuilder padded(4, 0);
    padded.bits().write_bit(1);
    padded.bits().write_bits(1, 6);
    padded.bits().write_bit(0);
    padded.bits().write_bits(0, 64);
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 4), {padded.finish()}), out) ==
           Status::InvalidFormat);
    std::cout << "Test decode_unsupported_subframe passed\n";
}

void test_metadata_errors() {
    Core::SampleBuffer out;
    assert(decode_bytes("", out) == Status::InvalidFormat);
    assert(decode_bytes("RIFF....WAVE", out) == Status::InvalidFormat);

    // A lone PADDING block flagged as last: no STREAMINFO.
    std::string padding_only = std::string("fLaC") + std::string("\x81\x00\x00\x04", 4) + std::string(4, '\0');
    assert(decode_bytes(padding_only, out) == Status::InvalidFormat);

    // Unknown blocks before STREAMINFO are skipped.
    std::vector<uint8_t> header = TestFlac::stream_header(1, 16, 4);
    std::vector<uint8_t> with_padding(header.begin(), header.begin() + 4);
    const uint8_t padding_block[] = {0x01, 0x00, 0x00, 0x02, 0x00, 0x00};
    with_padding.insert(with_padding.end(), padding_block, padding_block + sizeof(padding_block));
    with_padding.insert(with_padding.end(), header.begin() + 4, header.end());
    FrameBuilder frame(4, 0);
    TestFlac::write_verbatim(frame.bits(), {1, 2, 3, 4}, 16);
    assert(decode_bytes(TestFlac::to_string(with_padding, {frame.finish()}), out) == Status::Ok);
    assert((out.samples() == std::vector<int32_t>{1, 2, 3, 4}));

    std::string truncated_info = TestFlac::to_string(header, {});
    truncated_info.resize(truncated_info.size() - 10);
    assert(decode_bytes(truncated_info, out) == Status::InvalidFormat);

    // STREAMINFO declaring a 12-bit depth is not a format this codec produces.
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 12, 0), {}), out) == Status::InvalidFormat);
    std::cout << "Test decode_metadata_errors passed\n";
}

void test_stream_totals() {
    FrameBuilder first(4, 0, 0);
    TestFlac::write_verbatim(first.bits(), {1, 2, 3, 4}, 16);
    FrameBuilder second(4, 0, 1);
    TestFlac::write_verbatim(second.bits(), {5, 6, 7, 8}, 16);
    const std::vector<uint8_t> f0 = first.finish();
    const std::vector<uint8_t> f1 = second.finish();

    Core::SampleBuffer out;
    // Declared total shorter than the frames: output is cut at the total.
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 6), {f0, f1}), out) == Status::Ok);
    assert((out.samples() == std::vector<int32_t>{1, 2, 3, 4, 5, 6}));

    // Zero total: decode until the input runs out.
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 0), {f0, f1}), out) == Status::Ok);
    assert(out.sample_frame_count() == 8);

    // Frames run out before the declared total.
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 12), {f0, f1}), out) == Status::InvalidFormat);

    // Frame numbers must count up from zero.
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 8), {f1, f0}), out) == Status::InvalidFormat);

    // A frame cut short inside its subframe.
    std::vector<uint8_t> cut = f0;
    cut.resize(cut.size() - 5);
    assert(decode_bytes(TestFlac::to_string(TestFlac::stream_header(1, 16, 4), {cut}), out) == Status::InvalidFormat);
    std::cout << "Test decode_stream_totals passed\n";
}

void test_crc_verification() {
    FrameBuilder frame(4, 0);
    TestFlac::write_verbatim(frame.bits(), {10, 20, 30, 40}, 16);
    const std::vector<uint8_t> good = frame.finish();
    const std::vector<uint8_t> header = TestFlac::stream_header(1, 16, 4);

    std::vector<uint8_t> bad_crc16 = good;
    bad_crc16.back() ^= 0x01;
    Core::SampleBuffer out;
    assert(decode_bytes(TestFlac::to_string(header, {bad_crc16}), out, false) == Status::Ok);
    assert(decode_bytes(TestFlac::to_string(header, {bad_crc16}), out, true) == Status::InvalidFormat);

    std::vector<uint8_t> bad_crc8 = good;
    bad_crc8[6] ^= 0x80;
    assert(decode_bytes(TestFlac::to_string(header, {bad_crc8}), out, false) == Status::Ok);
    assert(decode_bytes(TestFlac::to_string(header, {bad_crc8}), out, true) == Status::InvalidFormat);

    // Codec-level switch reaches the decoder.
    Flac::Codec codec;
    codec.set_verify_crc(true);
    std::istringstream in(TestFlac::to_string(header, {bad_crc16}));
    assert(codec.read(in, out) == Status::InvalidFormat);
    std::cout << "Test decode_crc_verification passed\n";
}

void test_next_frame_interface() {
    FrameBuilder a(3, 1, 0);
    TestFlac::write_verbatim(a.bits(), {1, 2, 3}, 24);
    TestFlac::write_verbatim(a.bits(), {-1, -2, -3}, 24);
    FrameBuilder b(2, 1, 1);
    TestFlac::write_constant(b.bits(), 7, 24);
    TestFlac::write_constant(b.bits(), -7, 24);
    std::istringstream in(TestFlac::to_string(TestFlac::stream_header(2, 24, 5, 96000), {a.finish(), b.finish()}));

    Flac::Decoder decoder;
    std::vector<int32_t> samples;
    bool has_frame = true;
    assert(decoder.next_frame(samples, has_frame) == Status::InvalidParameter);
    assert(decoder.open(in) == Status::Ok);
    assert(decoder.stream_info().format == Core::Format(2, 96000, 24));
    assert(decoder.stream_info().total_samples == 5);

    assert(decoder.next_frame(samples, has_frame) == Status::Ok && has_frame);
    assert((samples == std::vector<int32_t>{1, -1, 2, -2, 3, -3}));
    assert(decoder.next_frame(samples, has_frame) == Status::Ok && has_frame);
    assert((samples == std::vector<int32_t>{7, -7, 7, -7}));
    assert(decoder.next_frame(samples, has_frame) == Status::Ok && !has_frame);
    assert(decoder.next_frame(samples, has_frame) == Status::Ok && !has_frame);
    std::cout << "Test decode_next_frame passed\n";
}

} // namespace

void run_decoder_tests() {
    test_verbatim_mono();
    test_constant_stereo();
    test_stereo_decorrelation();
    test_fixed_order2_roundtrip();
    test_wasted_bits();
    test_unsupported_subframe_type();
    test_metadata_errors();
    test_stream_totals();
    test_crc_verification();
    test_next_frame_interface();
}
