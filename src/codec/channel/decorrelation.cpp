#include "decorrelation.hpp"
#include "codec/frame/frame_header.hpp"
#include "utils/logger.hpp"

namespace Channel {

void restore_left_side(std::vector<int64_t>& left, std::vector<int64_t>& side) {
    // side becomes right
    for (size_t i = 0; i < left.size(); ++i) {
        side[i] = left[i] - side[i];
    }
}

void restore_side_right(std::vector<int64_t>& side, std::vector<int64_t>& right) {
    // side becomes left
    for (size_t i = 0; i < right.size(); ++i) {
        side[i] = side[i] + right[i];
    }
}

void restore_mid_side(std::vector<int64_t>& mid, std::vector<int64_t>& side) {
    for (size_t i = 0; i < mid.size(); ++i) {
        const int64_t s = side[i];
        const int64_t m = static_cast<int64_t>(static_cast<uint64_t>(mid[i]) << 1) | (s & 1);
        mid[i] = (m + s) >> 1;
        side[i] = (m - s) >> 1;
    }
}

Status restore(uint8_t channel_assignment, std::vector<int64_t>& first, std::vector<int64_t>& second) {
    if (first.size() != second.size()) return Status::InvalidFormat;

    switch (channel_assignment) {
        case Frame::kLeftSide:
            restore_left_side(first, second);
            return Status::Ok;
        case Frame::kSideRight:
            restore_side_right(first, second);
            return Status::Ok;
        case Frame::kMidSide:
            restore_mid_side(first, second);
            return Status::Ok;
        default:
            WAVIFY_DEBUG_LOG("[channel] not a stereo decorrelation mode: " << static_cast<int>(channel_assignment) << "\n");
            return Status::InvalidFormat;
    }
}

} // namespace Channel
