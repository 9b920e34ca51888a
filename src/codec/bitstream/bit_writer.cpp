#include "bit_writer.hpp"

BitWriter::BitWriter() : current_byte(0), bit_pos(0) {}

void BitWriter::write_bit(uint32_t bit) {
    if (bit > 1) bit = 1;

    int shift = 7 - this->bit_pos;
    this->current_byte |= static_cast<uint8_t>(bit << shift);
    this->bit_pos++;

    if (this->bit_pos == 8) {
        this->buffer.push_back(this->current_byte);
        this->current_byte = 0;
        this->bit_pos = 0;
    }
}

void BitWriter::write_bits(uint64_t value, int nbits) {
    for (int i = nbits - 1; i >= 0; --i) {
        uint32_t bit = static_cast<uint32_t>((value >> i) & 1u);
        this->write_bit(bit);
    }
}

void BitWriter::write_signed_bits(int64_t value, int nbits) {
    if (nbits <= 0) return;
    uint64_t mask = (nbits >= 64) ? ~uint64_t(0) : ((uint64_t(1) << nbits) - 1u);
    this->write_bits(static_cast<uint64_t>(value) & mask, nbits);
}

void BitWriter::write_unary_zeros(uint64_t count) {
    for (uint64_t i = 0; i < count; ++i) {
        this->write_bit(0);
    }
    this->write_bit(1);
}

void BitWriter::align_to_byte() {
    if (this->bit_pos == 0) return;

    this->buffer.push_back(this->current_byte);
    this->current_byte = 0;
    this->bit_pos = 0;
}

const std::vector<uint8_t>& BitWriter::get_buffer() const {
    return this->buffer;
}

uint64_t BitWriter::bit_count() const {
    return static_cast<uint64_t>(this->buffer.size()) * 8u + static_cast<uint64_t>(this->bit_pos);
}

void BitWriter::clear() {
    this->buffer.clear();
    this->current_byte = 0;
    this->bit_pos = 0;
}
