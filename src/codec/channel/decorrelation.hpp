#pragma once
#include <cstdint>
#include <vector>
#include "codec/status.hpp"

namespace Channel {

// Restores left/right from a decorrelated stereo pair in place.
// `first`/`second` are the subframes in bitstream order.
Status restore(uint8_t channel_assignment, std::vector<int64_t>& first, std::vector<int64_t>& second);

void restore_left_side(std::vector<int64_t>& left, std::vector<int64_t>& side);
void restore_side_right(std::vector<int64_t>& side, std::vector<int64_t>& right);
void restore_mid_side(std::vector<int64_t>& mid, std::vector<int64_t>& side);

} // namespace Channel
