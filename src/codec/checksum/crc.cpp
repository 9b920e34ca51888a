#include "crc.hpp"

namespace Crc {

namespace {
constexpr uint8_t kCrc8Polynomial = 0x07;
constexpr uint16_t kCrc16Polynomial = 0x8005;
} // namespace

uint8_t crc8(const uint8_t* data, size_t size) {
    uint8_t crc = 0;
    for (size_t i = 0; i < size; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x80u) {
                crc = static_cast<uint8_t>((crc << 1) ^ kCrc8Polynomial);
            } else {
                crc = static_cast<uint8_t>(crc << 1);
            }
        }
    }
    return crc;
}

uint8_t crc8(const std::vector<uint8_t>& data) {
    return crc8(data.data(), data.size());
}

uint16_t crc16(const uint8_t* data, size_t size) {
    uint16_t crc = 0;
    for (size_t i = 0; i < size; ++i) {
        crc ^= static_cast<uint16_t>(data[i] << 8);
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000u) {
                crc = static_cast<uint16_t>((crc << 1) ^ kCrc16Polynomial);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

uint16_t crc16(const std::vector<uint8_t>& data) {
    return crc16(data.data(), data.size());
}

} // namespace Crc
