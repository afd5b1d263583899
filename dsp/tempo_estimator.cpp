#include "tempo_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace beatlight::dsp {

std::optional<float> OnsetTempoEstimator::estimate_tempo(const std::vector<int16_t>& samples, int sample_rate) {
    const int hop = std::max(1, config_.hop_size);
    if (sample_rate <= 0 || !(config_.min_bpm > 0.0f) || !(config_.max_bpm > config_.min_bpm)) {
        return std::nullopt;
    }

    const int num_frames = static_cast<int>(samples.size()) / hop;
    // 60 * sr / hop converts a lag in frames to BPM
    const double frames_per_minute = 60.0 * sample_rate / hop;
    const int min_lag = std::max(1, static_cast<int>(std::floor(frames_per_minute / config_.max_bpm)));
    const int max_lag = static_cast<int>(std::ceil(frames_per_minute / config_.min_bpm));
    // Need two full periods of the slowest tempo
    if (num_frames < 2 * max_lag + 2) return std::nullopt;

    // Per-hop RMS envelope
    envelope_.assign(num_frames, 0.0);
    for (int f = 0; f < num_frames; ++f) {
        double acc = 0.0;
        const int16_t* p = samples.data() + static_cast<size_t>(f) * hop;
        for (int i = 0; i < hop; ++i) acc += static_cast<double>(p[i]) * p[i];
        envelope_[f] = std::sqrt(acc / hop);
    }

    // Half-wave rectified first difference
    onset_.assign(num_frames, 0.0);
    for (int f = 1; f < num_frames; ++f) {
        onset_[f] = std::max(0.0, envelope_[f] - envelope_[f - 1]);
    }
    double mean = 0.0;
    for (double v : onset_) mean += v;
    mean /= num_frames;
    double energy = 0.0;
    for (double& v : onset_) { v -= mean; energy += v * v; }
    if (energy <= 1e-9) return std::nullopt;  // silence or constant level

    // Biased autocorrelation: favors the shortest period among harmonics
    acf_.assign(max_lag + 2, 0.0);
    for (int lag = std::max(1, min_lag - 1); lag <= max_lag + 1 && lag < num_frames; ++lag) {
        double sum = 0.0;
        for (int n = 0; n + lag < num_frames; ++n) sum += onset_[n] * onset_[n + lag];
        acf_[lag] = sum / num_frames;
    }

    int best_lag = -1;
    double best = 0.0;
    for (int lag = min_lag; lag <= max_lag; ++lag) {
        if (acf_[lag] > best) { best = acf_[lag]; best_lag = lag; }
    }
    if (best_lag < 0) return std::nullopt;

    // Parabolic refinement around the peak
    double refined = static_cast<double>(best_lag);
    if (best_lag - 1 >= 1 && best_lag + 1 < static_cast<int>(acf_.size())) {
        const double yl = acf_[best_lag - 1], yc = acf_[best_lag], yr = acf_[best_lag + 1];
        const double denom = yl - 2.0 * yc + yr;
        if (std::fabs(denom) > 1e-12) {
            const double delta = 0.5 * (yl - yr) / denom;
            if (std::fabs(delta) < 1.0) refined += delta;
        }
    }
    if (refined <= 0.0) return std::nullopt;

    const double bpm = frames_per_minute / refined;
    if (!std::isfinite(bpm)) return std::nullopt;
    return static_cast<float>(std::max<double>(config_.min_bpm, std::min<double>(config_.max_bpm, bpm)));
}

} // namespace beatlight::dsp
