#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Polynomial predictors of order 0..4.
class FixedPredictor {
public:
    static constexpr uint32_t kMaxOrder = 4;

    // Prediction for samples[n] from the `order` samples before it.
    static int64_t predict(const int64_t* samples, size_t n, uint32_t order);

    // residual[i] = samples[order + i] - prediction; size() - order entries.
    static void compute_residual(const std::vector<int64_t>& samples,
                                 uint32_t order,
                                 std::vector<int64_t>& residual);

    // `out` holds the warm-up samples on entry and is extended in place.
    static void restore_from_residual(const std::vector<int64_t>& residual,
                                      uint32_t order,
                                      std::vector<int64_t>& out);
};
