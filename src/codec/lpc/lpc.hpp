#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Quantized linear predictor: prediction = (sum coeffs[i] * s[n-1-i]) >> shift,
// shifting left when `shift` is negative.
class LPC {
public:
    explicit LPC(int order);

    int get_order() const;

    int64_t predict(const int64_t* history, const std::vector<int32_t>& coeffs, int shift) const;

    // residual.size() == block.size() - order
    void compute_residual(const std::vector<int64_t>& block,
                          const std::vector<int32_t>& coeffs,
                          int shift,
                          std::vector<int64_t>& residual) const;

    // out_block holds the warm-up samples on entry.
    void restore_from_residual(const std::vector<int64_t>& residual,
                               const std::vector<int32_t>& coeffs,
                               int shift,
                               std::vector<int64_t>& out_block) const;

private:
    int order;
};
