#include "lpc.hpp"

LPC::LPC(int order)
    : order(order)
{
}

int LPC::get_order() const {
    return this->order;
}

// `history` points one past the newest sample used.
int64_t LPC::predict(const int64_t* history, const std::vector<int32_t>& coeffs, int shift) const {
    int64_t acc = 0;
    for (int i = 0; i < this->order; ++i) {
        acc += static_cast<int64_t>(coeffs[i]) * history[-1 - i];
    }

    if (shift >= 0) {
        return acc >> shift;
    }
    return static_cast<int64_t>(static_cast<uint64_t>(acc) << (-shift));
}

void LPC::compute_residual(const std::vector<int64_t>& block,
                           const std::vector<int32_t>& coeffs,
                           int shift,
                           std::vector<int64_t>& residual) const {
    residual.clear();
    const size_t N = block.size();
    if (N <= static_cast<size_t>(this->order)) return;

    residual.reserve(N - this->order);
    for (size_t n = this->order; n < N; ++n) {
        residual.push_back(block[n] - this->predict(block.data() + n, coeffs, shift));
    }
}

void LPC::restore_from_residual(const std::vector<int64_t>& residual,
                                const std::vector<int32_t>& coeffs,
                                int shift,
                                std::vector<int64_t>& out_block) const {
    out_block.reserve(out_block.size() + residual.size());

    for (int64_t r : residual) {
        const int64_t pred = this->predict(out_block.data() + out_block.size(), coeffs, shift);
        out_block.push_back(pred + r);
    }
}
