#include "decoder.hpp"
#include "codec/lpc/lpc.hpp"
#include "codec/predictor/fixed_predictor.hpp"
#include "codec/rice/rice.hpp"
#include "codec/subframe/constants.hpp"
#include "utils/logger.hpp"

namespace Subframe {

Decoder::Decoder() {}

const Type& Decoder::last_type() const {
    return this->type;
}

Status Decoder::decode(BitReader& br, uint32_t block_size, uint32_t sample_size, std::vector<int64_t>& out) {
    out.clear();

    if (br.read_bit() != 0) {
        WAVIFY_DEBUG_LOG("[subframe] padding bit set\n");
        return Status::InvalidFormat;
    }
    const uint32_t code = static_cast<uint32_t>(br.read_bits(6));
    const uint32_t wasted_flag = br.read_bit();
    uint32_t wasted = 0;
    if (wasted_flag) {
        wasted = br.read_unary_zeros() + 1u;
    }
    if (br.has_error()) {
        WAVIFY_DEBUG_LOG("[subframe] truncated subframe header\n");
        return Status::InvalidFormat;
    }

    if (wasted >= sample_size) {
        WAVIFY_DEBUG_LOG("[subframe] invalid wasted bits count " << wasted << " for sample size " << sample_size << "\n");
        return Status::InvalidFormat;
    }
    const uint32_t effective = sample_size - wasted;

    this->type = Type::from_code(code);
    WAVIFY_TRACE_LOG("[subframe] type=" << code << " order=" << this->type.order
                     << " wasted=" << wasted << " n=" << block_size << "\n");

    Status st = Status::Ok;
    switch (this->type.kind) {
        case Type::Kind::Constant: {
            const int64_t value = br.read_signed_bits(static_cast<int>(effective));
            out.assign(block_size, value);
            break;
        }
        case Type::Kind::Verbatim:
            out.reserve(block_size);
            for (uint32_t i = 0; i < block_size; ++i) {
                out.push_back(br.read_signed_bits(static_cast<int>(effective)));
                if (br.has_error()) break;
            }
            break;
        case Type::Kind::Fixed:
        case Type::Kind::Lpc:
            st = this->decode_predicted(br, block_size, effective, out);
            break;
        default:
            WAVIFY_DEBUG_LOG("[subframe] unsupported subframe type " << code << "\n");
            return Status::UnsupportedFormat;
    }

    if (st != Status::Ok) return st;
    if (br.has_error()) {
        WAVIFY_DEBUG_LOG("[subframe] truncated subframe\n");
        return Status::InvalidFormat;
    }

    if (wasted > 0) {
        for (int64_t& s : out) {
            s = static_cast<int64_t>(static_cast<uint64_t>(s) << wasted);
        }
    }
    return Status::Ok;
}

Status Decoder::decode_predicted(BitReader& br, uint32_t block_size, uint32_t sample_size, std::vector<int64_t>& out) {
    const uint32_t order = this->type.order;
    if (order > block_size) {
        WAVIFY_DEBUG_LOG("[subframe] predictor order " << order << " exceeds block size " << block_size << "\n");
        return Status::InvalidFormat;
    }

    out.reserve(block_size);
    for (uint32_t i = 0; i < order; ++i) {
        out.push_back(br.read_signed_bits(static_cast<int>(sample_size)));
    }

    std::vector<int32_t> coeffs;
    int shift = 0;
    if (this->type.kind == Type::Kind::Lpc) {
        const uint32_t precision_code = static_cast<uint32_t>(br.read_bits(LPC_PRECISION_BITS));
        if (precision_code == LPC_INVALID_PRECISION) {
            WAVIFY_DEBUG_LOG("[subframe] invalid LPC coefficient precision\n");
            return Status::InvalidFormat;
        }
        const int precision = static_cast<int>(precision_code) + 1;
        shift = static_cast<int>(br.read_signed_bits(LPC_SHIFT_BITS));
        coeffs.resize(order);
        for (uint32_t i = 0; i < order; ++i) {
            coeffs[i] = static_cast<int32_t>(br.read_signed_bits(precision));
        }
        WAVIFY_TRACE_LOG("[subframe] lpc precision=" << precision << " shift=" << shift << "\n");
    }
    if (br.has_error()) return Status::InvalidFormat;

    std::vector<int64_t> residual;
    Status st = Rice::read_residuals(br, block_size, order, residual);
    if (st != Status::Ok) return st;

    if (this->type.kind == Type::Kind::Fixed) {
        FixedPredictor::restore_from_residual(residual, order, out);
    } else {
        LPC lpc(static_cast<int>(order));
        lpc.restore_from_residual(residual, coeffs, shift, out);
    }
    return Status::Ok;
}

} // namespace Subframe
