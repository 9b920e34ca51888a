#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

class BitWriter {
public:
    BitWriter();

    void write_bit(uint32_t bit);
    void write_bits(uint64_t value, int nbits);
    // Two's-complement, masked to nbits.
    void write_signed_bits(int64_t value, int nbits);
    // `count` zero bits followed by a terminating one bit.
    void write_unary_zeros(uint64_t count);
    void align_to_byte();

    const std::vector<uint8_t>& get_buffer() const;
    uint64_t bit_count() const;
    void clear();

private:
    std::vector<uint8_t> buffer;
    uint8_t current_byte;
    int bit_pos;
};
