#pragma once
#include <vector>
#include <cstdint>
#include "codec/bitstream/bit_reader.hpp"
#include "codec/status.hpp"
#include "codec/subframe/type.hpp"

namespace Subframe {

class Decoder {
public:
    Decoder();

    // Decodes one subframe of `block_size` samples coded at `sample_size`
    // bits (before wasted bits are removed).
    Status decode(BitReader& br, uint32_t block_size, uint32_t sample_size, std::vector<int64_t>& out);

    const Type& last_type() const;

private:
    Type type;

    Status decode_predicted(BitReader& br, uint32_t block_size, uint32_t sample_size, std::vector<int64_t>& out);
};

} // namespace Subframe
