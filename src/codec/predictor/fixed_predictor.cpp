#include "fixed_predictor.hpp"

int64_t FixedPredictor::predict(const int64_t* s, size_t n, uint32_t order) {
    switch (order) {
        case 0:
            return 0;
        case 1:
            return s[n - 1];
        case 2:
            return 2 * s[n - 1] - s[n - 2];
        case 3:
            return 3 * s[n - 1] - 3 * s[n - 2] + s[n - 3];
        case 4:
            return 4 * s[n - 1] - 6 * s[n - 2] + 4 * s[n - 3] - s[n - 4];
        default:
            return 0;
    }
}

void FixedPredictor::compute_residual(const std::vector<int64_t>& samples,
                                      uint32_t order,
                                      std::vector<int64_t>& residual) {
    residual.clear();
    if (samples.size() <= order) return;

    residual.reserve(samples.size() - order);
    for (size_t n = order; n < samples.size(); ++n) {
        residual.push_back(samples[n] - predict(samples.data(), n, order));
    }
}

void FixedPredictor::restore_from_residual(const std::vector<int64_t>& residual,
                                           uint32_t order,
                                           std::vector<int64_t>& out) {
    out.reserve(out.size() + residual.size());
    for (int64_t r : residual) {
        const size_t n = out.size();
        out.push_back(predict(out.data(), n, order) + r);
    }
}
