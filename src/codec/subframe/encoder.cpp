#include "encoder.hpp"
#include <algorithm>
#include <utility>
#include "codec/predictor/fixed_predictor.hpp"
#include "codec/subframe/constants.hpp"
#include "utils/logger.hpp"

namespace Subframe {

Encoder::Encoder(uint32_t sample_size)
    : sample_size(sample_size)
{
}

Selection Encoder::select(const std::vector<int64_t>& samples) const {
    Selection best;
    best.type = Type(Type::Kind::Verbatim, 0);
    best.bit_length = HEADER_BITS + static_cast<uint64_t>(samples.size()) * this->sample_size;

    if (samples.empty()) return best;

    const uint32_t max_order = std::min<uint32_t>(FixedPredictor::kMaxOrder,
                                                  static_cast<uint32_t>(samples.size() - 1));
    for (uint32_t order = 0; order <= max_order; ++order) {
        Selection candidate;
        candidate.type = Type(Type::Kind::Fixed, order);
        FixedPredictor::compute_residual(samples, order, candidate.residuals);
        candidate.residual_encoding = Rice::choose_encoding(candidate.residuals);
        candidate.bit_length = HEADER_BITS +
                               static_cast<uint64_t>(order) * this->sample_size +
                               candidate.residual_encoding.bit_length;

        if (candidate.bit_length < best.bit_length) {
            best = std::move(candidate);
        }
    }

    return best;
}

void Encoder::write(BitWriter& w, const std::vector<int64_t>& samples, const Selection& selection) const {
    w.write_bit(0); // padding
    w.write_bits(selection.type.code(), 6);
    w.write_bit(0); // no wasted bits

    const int ss = static_cast<int>(this->sample_size);
    if (selection.type.kind == Type::Kind::Fixed) {
        for (uint32_t i = 0; i < selection.type.order; ++i) {
            w.write_signed_bits(samples[i], ss);
        }
        Rice::write_residuals(w, selection.residual_encoding, selection.residuals);
        return;
    }

    for (int64_t s : samples) {
        w.write_signed_bits(s, ss);
    }
}

Selection Encoder::encode(BitWriter& w, const std::vector<int64_t>& samples) const {
    Selection selection = this->select(samples);
    WAVIFY_TRACE_LOG("[subframe-enc] type=" << selection.type.code()
                     << " bits=" << selection.bit_length
                     << " k=" << selection.residual_encoding.parameter << "\n");
    this->write(w, samples, selection);
    return selection;
}

} // namespace Subframe
