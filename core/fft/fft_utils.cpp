#include "fft/fft_utils.hpp"
#include <cmath>
#include <utility>

namespace beatlight::fft {

void FftPlan::prepare(int n) {
    if (n == n_) return;
    n_ = n;
    bitrev_.clear();
    twiddles_.clear();
    scratch_.assign(n > 0 ? n : 0, std::complex<float>(0.0f, 0.0f));
    if (n <= 1) return;

    int bits = 0; while ((1 << bits) < n) ++bits;
    bitrev_.resize(n);
    for (int i = 0; i < n; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        bitrev_[i] = static_cast<int>(r);
    }

    const double two_pi = 6.28318530717958647692;
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        std::vector<std::complex<float>> stage(half);
        // Direct cos/sin per twiddle keeps large plans accurate
        for (int k = 0; k < half; ++k) {
            const double angle = -two_pi * static_cast<double>(k) / static_cast<double>(len);
            stage[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
        }
        twiddles_.push_back(std::move(stage));
    }
}

void FftPlan::execute(std::vector<std::complex<float>>& data) {
    const int n = static_cast<int>(data.size());
    if (n <= 1 || n != n_) return;

    for (int i = 0; i < n; ++i) scratch_[bitrev_[i]] = data[i];
    data.swap(scratch_);

    int stageIndex = 0;
    for (int len = 2; len <= n; len <<= 1, ++stageIndex) {
        const auto& W = twiddles_[stageIndex];
        const int half = len / 2;
        for (int i = 0; i < n; i += len) {
            for (int k = 0; k < half; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + half] * W[k];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
    }
}

float dft_bin_magnitude(const float* x, int n, int k) {
    const double two_pi = 6.28318530717958647692;
    // Goertzel recurrence, double precision
    const double w = two_pi * static_cast<double>(k) / static_cast<double>(n);
    const double coeff = 2.0 * std::cos(w);
    double s1 = 0.0, s2 = 0.0;
    for (int i = 0; i < n; ++i) {
        const double s0 = static_cast<double>(x[i]) + coeff * s1 - s2;
        s2 = s1;
        s1 = s0;
    }
    const double re = s1 - s2 * std::cos(w);
    const double im = s2 * std::sin(w);
    return static_cast<float>(std::sqrt(re * re + im * im));
}

} // namespace beatlight::fft
