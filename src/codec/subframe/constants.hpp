#pragma once
#include <cstdint>

namespace Subframe {

constexpr uint32_t TYPE_CONSTANT = 0;
constexpr uint32_t TYPE_VERBATIM = 1;
constexpr uint32_t TYPE_FIXED_BASE = 8;
constexpr uint32_t TYPE_FIXED_LAST = 12;
constexpr uint32_t TYPE_LPC_BASE = 32;
constexpr uint32_t TYPE_LPC_LAST = 63;

constexpr uint32_t HEADER_BITS = 8; // pad + type + wasted flag
constexpr uint32_t LPC_PRECISION_BITS = 4;
constexpr uint32_t LPC_INVALID_PRECISION = 0xF;
constexpr uint32_t LPC_SHIFT_BITS = 5;

}
