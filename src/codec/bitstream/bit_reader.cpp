#include "bit_reader.hpp"

BitReader::BitReader(const uint8_t* data, size_t size)
    : data(data), size(size), byte_pos(0), in(nullptr), current_byte(0), bits_left(0), consumed(0), error(false), capture(nullptr) {}

BitReader::BitReader(const std::vector<uint8_t>& buf)
    : data(buf.data()), size(buf.size()), byte_pos(0), in(nullptr), current_byte(0), bits_left(0), consumed(0), error(false), capture(nullptr) {}

BitReader::BitReader(std::istream& in)
    : data(nullptr), size(0), byte_pos(0), in(&in), current_byte(0), bits_left(0), consumed(0), error(false), capture(nullptr) {}

void BitReader::mark_error() {
    this->error = true;
    this->bits_left = 0;
    this->current_byte = 0;
}

bool BitReader::fetch_byte() {
    if (this->error) return false;

    if (this->in) {
        const std::istream::int_type c = this->in->get();
        if (c == std::istream::traits_type::eof()) {
            this->mark_error();
            return false;
        }
        this->current_byte = static_cast<uint8_t>(c);
    } else {
        if (this->byte_pos >= this->size) {
            this->mark_error();
            return false;
        }
        this->current_byte = this->data[this->byte_pos++];
    }

    this->bits_left = 8;
    this->consumed++;
    if (this->capture) {
        this->capture->push_back(this->current_byte);
    }
    return true;
}

uint32_t BitReader::read_bit() {
    if (this->bits_left == 0 && !this->fetch_byte()) {
        return 0;
    }

    this->bits_left--;
    return (this->current_byte >> this->bits_left) & 1u;
}

uint64_t BitReader::read_bits(int nbits) {
    uint64_t value = 0;

    for (int i = 0; i < nbits; ++i) {
        value = (value << 1) | this->read_bit();
        if (this->error) return 0;
    }

    return value;
}

int64_t BitReader::read_signed_bits(int nbits) {
    if (nbits <= 0) return 0;

    uint64_t value = this->read_bits(nbits);
    if (nbits < 64 && ((value >> (nbits - 1)) & 1u)) {
        value |= ~uint64_t(0) << nbits;
    }
    return static_cast<int64_t>(value);
}

uint32_t BitReader::read_unary_zeros() {
    uint32_t count = 0;
    while (this->read_bit() == 0) {
        if (this->error) return count;
        ++count;
    }
    return count;
}

void BitReader::align_to_byte() {
    this->bits_left = 0;
}

bool BitReader::is_byte_aligned() const {
    return this->bits_left == 0;
}

bool BitReader::has_error() const {
    return this->error;
}

size_t BitReader::bytes_consumed() const {
    return this->consumed;
}

void BitReader::begin_capture(std::vector<uint8_t>* sink) {
    this->capture = sink;
}

void BitReader::end_capture() {
    this->capture = nullptr;
}
