#pragma once

#include <complex>
#include <vector>

namespace beatlight::fft {

inline bool is_power_of_two(int n) { return n > 0 && (n & (n - 1)) == 0; }

// Iterative radix-2 FFT with bit-reversal and twiddles built once per size.
// Each plan owns its tables, so plans on different threads never share state.
class FftPlan {
public:
    FftPlan() = default;
    explicit FftPlan(int n) { prepare(n); }

    // Rebuilds tables when n differs from the current size. n must be a power of two.
    void prepare(int n);
    int size() const { return n_; }

    // In-place forward transform; data.size() must equal size().
    void execute(std::vector<std::complex<float>>& data);

private:
    int n_ = 0;
    std::vector<int> bitrev_;
    std::vector<std::vector<std::complex<float>>> twiddles_;
    std::vector<std::complex<float>> scratch_;
};

// Magnitude of one DFT bin of a real signal, evaluated directly.
// Used when the chunk length is not a power of two.
float dft_bin_magnitude(const float* x, int n, int k);

} // namespace beatlight::fft
