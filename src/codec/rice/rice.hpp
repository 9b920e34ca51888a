#pragma once
#include <cstdint>
#include <vector>
#include "codec/bitstream/bit_writer.hpp"
#include "codec/bitstream/bit_reader.hpp"
#include "codec/status.hpp"

// Coding choice for a single residual partition.
struct ResidualEncoding {
    enum class Method : uint8_t {
        Rice,
        Escape
    };

    Method method;
    uint32_t parameter; // Rice parameter, or raw bit width for Escape
    uint64_t bit_length; // exact size of the partitioned residual section

    ResidualEncoding()
        : method(Method::Rice),
          parameter(0),
          bit_length(0) {}
};

class Rice {
public:
    static constexpr uint32_t kMaxEncodeParameter = 14;
    static constexpr uint32_t kMaxEscapeWidth = 31;

    static void encode(BitWriter& w, int64_t value, uint32_t k);

    static int64_t decode(BitReader& r, uint32_t k);

    // Bits used by a method-0, order-0 section coded with parameter k.
    static uint64_t partition_bit_length(const std::vector<int64_t>& residuals, uint32_t k);

    // Smallest two's-complement width holding v; 0 for v == 0.
    static uint32_t signed_bit_width(int64_t v);

    // Cheapest of Rice parameters 0..14 and the escape code.
    static ResidualEncoding choose_encoding(const std::vector<int64_t>& residuals);

    // Method 0, partition order 0.
    static void write_residuals(BitWriter& w,
                                const ResidualEncoding& encoding,
                                const std::vector<int64_t>& residuals);

    // Reads a partitioned residual section (coding method 0 or 1) holding
    // block_size - predictor_order residuals.
    static Status read_residuals(BitReader& r,
                                 uint32_t block_size,
                                 uint32_t predictor_order,
                                 std::vector<int64_t>& residuals);

    static uint64_t signed_to_unsigned(int64_t v);
    static int64_t unsigned_to_signed(uint64_t u);
};
