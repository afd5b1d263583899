#include "band_analyzer.hpp"

#include <algorithm>
#include <cmath>

namespace beatlight::dsp {

float chunk_rms(const int16_t* samples, int count) {
    if (!samples || count <= 0) return 0.0f;
    double sum_squares = 0.0;
    for (int i = 0; i < count; ++i) {
        const double s = static_cast<double>(samples[i]);
        sum_squares += s * s;
    }
    return static_cast<float>(std::sqrt(sum_squares / count));
}

static double bin_frequency(int k, int count, int sample_rate) {
    return static_cast<double>(k) * sample_rate / count;
}

void BandAnalyzer::prepare(int chunk_size) {
    if (chunk_size < 2) return;
    input_.resize(chunk_size);
    mags_.assign(chunk_size / 2 + 1, 0.0f);
    if (fft::is_power_of_two(chunk_size)) {
        plan_.prepare(chunk_size);
        spectrum_.resize(chunk_size);
    }
}

void BandAnalyzer::compute_magnitudes(int count, int sample_rate) {
    const int num_bins = count / 2 + 1;
    if (fft::is_power_of_two(count)) {
        for (int i = 0; i < count; ++i) spectrum_[i] = std::complex<float>(input_[i], 0.0f);
        plan_.execute(spectrum_);
        for (int k = 0; k < num_bins; ++k) mags_[k] = std::abs(spectrum_[k]);
        return;
    }
    // Only bins inside some band matter; everything else stays zero
    const float lo = std::min({kBassBand.low_hz, kMidBand.low_hz, kHighBand.low_hz, kVocalBand.low_hz});
    const float hi = std::max({kBassBand.high_hz, kMidBand.high_hz, kHighBand.high_hz, kVocalBand.high_hz});
    std::fill(mags_.begin(), mags_.end(), 0.0f);
    for (int k = 0; k < num_bins; ++k) {
        const double f = bin_frequency(k, count, sample_rate);
        if (f < lo || f > hi) continue;
        mags_[k] = fft::dft_bin_magnitude(input_.data(), count, k);
    }
}

static float sum_band(const std::vector<float>& mags, int count, int sample_rate, const BandRange& band) {
    double sum = 0.0;
    for (size_t k = 0; k < mags.size(); ++k) {
        const double f = bin_frequency(static_cast<int>(k), count, sample_rate);
        if (f < band.low_hz) continue;
        if (f > band.high_hz) break;
        sum += mags[k];
    }
    return static_cast<float>(sum);
}

BandEnergy BandAnalyzer::analyze(const int16_t* samples, int count, int sample_rate) {
    BandEnergy out;
    if (!samples || count < 2 || sample_rate <= 0) return out;

    if (static_cast<int>(input_.size()) != count) prepare(count);

    const float scale = normalize_ ? (1.0f / 32768.0f) : 1.0f;
    for (int i = 0; i < count; ++i) input_[i] = static_cast<float>(samples[i]) * scale;

    compute_magnitudes(count, sample_rate);

    out.bass = sum_band(mags_, count, sample_rate, kBassBand);
    out.mid = sum_band(mags_, count, sample_rate, kMidBand);
    out.high = sum_band(mags_, count, sample_rate, kHighBand);
    out.vocal = sum_band(mags_, count, sample_rate, kVocalBand);
    return out;
}

} // namespace beatlight::dsp
