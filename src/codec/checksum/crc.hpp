#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Crc {

// x^8 + x^2 + x + 1, MSB first, zero initial value.
uint8_t crc8(const uint8_t* data, size_t size);
uint8_t crc8(const std::vector<uint8_t>& data);

// x^16 + x^15 + x^2 + 1, MSB first, zero initial value.
uint16_t crc16(const uint8_t* data, size_t size);
uint16_t crc16(const std::vector<uint8_t>& data);

} // namespace Crc
