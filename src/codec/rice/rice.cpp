#include "rice.hpp"
#include "utils/logger.hpp"

namespace {
constexpr uint32_t kMethodBits = 2;
constexpr uint32_t kPartitionOrderBits = 4;
constexpr uint32_t kEscapeWidthBits = 5;

struct CodingMethod {
    int parameter_bits;
    uint32_t escape_parameter;
};

constexpr CodingMethod kCodingMethods[2] = {
    {4, 0xF},
    {5, 0x1F}
};
} // namespace

uint64_t Rice::signed_to_unsigned(int64_t v) {
    if (v >= 0) return static_cast<uint64_t>(v) << 1;
    return (static_cast<uint64_t>(-(v + 1)) << 1) + 1u;
}

int64_t Rice::unsigned_to_signed(uint64_t u) {
    if ((u & 1u) == 0) return static_cast<int64_t>(u >> 1);
    return -static_cast<int64_t>((u >> 1)) - 1;
}

void Rice::encode(BitWriter& w, int64_t value, uint32_t k) {
    uint64_t u = signed_to_unsigned(value);

    uint64_t q = u >> k;
    w.write_unary_zeros(q);

    if (k > 0) {
        w.write_bits(u & ((uint64_t(1) << k) - 1u), static_cast<int>(k));
    }
}

int64_t Rice::decode(BitReader& r, uint32_t k) {
    uint64_t q = r.read_unary_zeros();

    uint64_t u = q << k;
    if (k > 0) {
        u |= r.read_bits(static_cast<int>(k));
    }

    return unsigned_to_signed(u);
}

uint64_t Rice::partition_bit_length(const std::vector<int64_t>& residuals, uint32_t k) {
    uint64_t bits = kMethodBits + kPartitionOrderBits + kCodingMethods[0].parameter_bits;
    for (int64_t v : residuals) {
        bits += (signed_to_unsigned(v) >> k) + 1u + k;
    }
    return bits;
}

uint32_t Rice::signed_bit_width(int64_t v) {
    if (v == 0) return 0;

    uint64_t magnitude = (v < 0) ? static_cast<uint64_t>(~v) : static_cast<uint64_t>(v);
    uint32_t bits = 1;
    while (magnitude) {
        ++bits;
        magnitude >>= 1;
    }
    return bits;
}

ResidualEncoding Rice::choose_encoding(const std::vector<int64_t>& residuals) {
    ResidualEncoding best;
    best.method = ResidualEncoding::Method::Rice;
    best.parameter = 0;
    best.bit_length = partition_bit_length(residuals, 0);

    for (uint32_t k = 1; k <= kMaxEncodeParameter; ++k) {
        const uint64_t bits = partition_bit_length(residuals, k);
        if (bits < best.bit_length) {
            best.parameter = k;
            best.bit_length = bits;
        }
    }

    uint32_t width = 0;
    for (int64_t v : residuals) {
        const uint32_t w = signed_bit_width(v);
        if (w > width) width = w;
    }
    if (width <= kMaxEscapeWidth) {
        const uint64_t escape_bits = kMethodBits + kPartitionOrderBits +
                                     kCodingMethods[0].parameter_bits + kEscapeWidthBits +
                                     static_cast<uint64_t>(residuals.size()) * width;
        if (escape_bits < best.bit_length) {
            best.method = ResidualEncoding::Method::Escape;
            best.parameter = width;
            best.bit_length = escape_bits;
        }
    }

    return best;
}

void Rice::write_residuals(BitWriter& w,
                           const ResidualEncoding& encoding,
                           const std::vector<int64_t>& residuals) {
    w.write_bits(0, kMethodBits);
    w.write_bits(0, kPartitionOrderBits);

    if (encoding.method == ResidualEncoding::Method::Rice) {
        w.write_bits(encoding.parameter, kCodingMethods[0].parameter_bits);
        for (int64_t v : residuals) {
            encode(w, v, encoding.parameter);
        }
        return;
    }

    w.write_bits(kCodingMethods[0].escape_parameter, kCodingMethods[0].parameter_bits);
    w.write_bits(encoding.parameter, kEscapeWidthBits);
    if (encoding.parameter == 0) return;
    for (int64_t v : residuals) {
        w.write_signed_bits(v, static_cast<int>(encoding.parameter));
    }
}

Status Rice::read_residuals(BitReader& r,
                            uint32_t block_size,
                            uint32_t predictor_order,
                            std::vector<int64_t>& residuals) {
    residuals.clear();

    const uint32_t method = static_cast<uint32_t>(r.read_bits(kMethodBits));
    const uint32_t partition_order = static_cast<uint32_t>(r.read_bits(kPartitionOrderBits));
    if (r.has_error()) return Status::InvalidFormat;

    if (method > 1) {
        WAVIFY_DEBUG_LOG("[rice] unsupported residual coding method " << method << "\n");
        return Status::UnsupportedFormat;
    }

    const uint32_t partition_count = 1u << partition_order;
    if (block_size % partition_count != 0) {
        WAVIFY_DEBUG_LOG("[rice] block size " << block_size << " not divisible by " << partition_count << " partitions\n");
        return Status::InvalidFormat;
    }

    const CodingMethod& coding = kCodingMethods[method];
    const uint32_t partition_block_size = block_size / partition_count;
    residuals.reserve(block_size);

    for (uint32_t p = 0; p < partition_count; ++p) {
        int64_t count = partition_block_size;
        if (p == 0) count -= predictor_order;
        if (count < 0) {
            WAVIFY_DEBUG_LOG("[rice] partition 0 smaller than predictor order " << predictor_order << "\n");
            return Status::InvalidFormat;
        }

        const uint32_t parameter = static_cast<uint32_t>(r.read_bits(coding.parameter_bits));
        if (parameter == coding.escape_parameter) {
            const int width = static_cast<int>(r.read_bits(kEscapeWidthBits));
            WAVIFY_TRACE_LOG("[rice] partition " << p << " escape width " << width << "\n");
            for (int64_t i = 0; i < count; ++i) {
                residuals.push_back(width == 0 ? 0 : r.read_signed_bits(width));
            }
        } else {
            WAVIFY_TRACE_LOG("[rice] partition " << p << " k=" << parameter << " n=" << count << "\n");
            for (int64_t i = 0; i < count; ++i) {
                residuals.push_back(decode(r, parameter));
                if (r.has_error()) break;
            }
        }

        if (r.has_error()) {
            WAVIFY_DEBUG_LOG("[rice] truncated residual partition " << p << "\n");
            return Status::InvalidFormat;
        }
    }

    return Status::Ok;
}
