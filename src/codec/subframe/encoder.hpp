#pragma once
#include <vector>
#include <cstdint>
#include "codec/bitstream/bit_writer.hpp"
#include "codec/rice/rice.hpp"
#include "codec/subframe/type.hpp"

namespace Subframe {

struct Selection {
    Type type;
    uint64_t bit_length;
    std::vector<int64_t> residuals;
    ResidualEncoding residual_encoding;

    Selection() : type(Type::Kind::Verbatim, 0), bit_length(0) {}
};

// Picks the smallest of verbatim and fixed orders 0..4 for one channel
// and writes it. Constant and LPC subframes are never produced.
class Encoder {
public:
    explicit Encoder(uint32_t sample_size);

    Selection select(const std::vector<int64_t>& samples) const;

    void write(BitWriter& w, const std::vector<int64_t>& samples, const Selection& selection) const;

    Selection encode(BitWriter& w, const std::vector<int64_t>& samples) const;

private:
    uint32_t sample_size;
};

} // namespace Subframe
