#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

// MSB-first bit reader. Bytes are pulled one at a time from either an
// in-memory range or a std::istream. Reading past the end of input sets a
// sticky error flag and every later read returns zero.
class BitReader {
public:
    BitReader(const uint8_t* data, size_t size);
    BitReader(const std::vector<uint8_t>& buf);
    explicit BitReader(std::istream& in);

    uint32_t read_bit();
    uint64_t read_bits(int nbits);
    int64_t read_signed_bits(int nbits);
    // Number of zero bits before the next one bit (the one bit is consumed).
    uint32_t read_unary_zeros();

    void align_to_byte();
    bool is_byte_aligned() const;
    bool has_error() const;
    size_t bytes_consumed() const;

    // Every byte fetched while capturing is appended to `sink`.
    void begin_capture(std::vector<uint8_t>* sink);
    void end_capture();

private:
    const uint8_t* data;
    size_t size;
    size_t byte_pos;
    std::istream* in;
    uint8_t current_byte;
    int bits_left;
    size_t consumed;
    bool error;
    std::vector<uint8_t>* capture;

    bool fetch_byte();
    void mark_error();
};
