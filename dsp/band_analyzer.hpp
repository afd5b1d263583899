#pragma once

#include <complex>
#include <cstdint>
#include <vector>

#include "event.hpp"
#include "fft/fft_utils.hpp"

namespace beatlight::dsp {

struct BandRange {
    float low_hz;
    float high_hz;  // inclusive
};

// Fixed band layout
constexpr BandRange kBassBand{20.0f, 250.0f};
constexpr BandRange kMidBand{250.0f, 2000.0f};
constexpr BandRange kHighBand{2000.0f, 8000.0f};
constexpr BandRange kVocalBand{300.0f, 3400.0f};

// RMS of a chunk in int16 units (0 for empty input)
float chunk_rms(const int16_t* samples, int count);

// Per-chunk spectral band energies. Scratch buffers are sized on the first
// chunk of a given length and reused afterwards, so steady-state calls do not
// allocate. Not thread safe: one analyzer per processing thread.
class BandAnalyzer {
public:
    BandAnalyzer() = default;

    // Pre-size buffers for the expected chunk length
    void prepare(int chunk_size);

    // true: samples / 32768 before the transform. false: raw int16 magnitudes.
    void set_normalize(bool normalize) { normalize_ = normalize; }
    bool normalize() const { return normalize_; }

    // Sum of bin magnitudes per band; bin k sits at k * sample_rate / count.
    // count < 2 or sample_rate <= 0 yields all zeros.
    BandEnergy analyze(const int16_t* samples, int count, int sample_rate);

    // Magnitude spectrum of the last analyzed chunk (bins 0..count/2)
    const std::vector<float>& magnitudes() const { return mags_; }

private:
    void compute_magnitudes(int count, int sample_rate);

    bool normalize_ = true;
    fft::FftPlan plan_;
    std::vector<float> input_;
    std::vector<std::complex<float>> spectrum_;
    std::vector<float> mags_;
};

} // namespace beatlight::dsp
