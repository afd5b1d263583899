#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace beatlight::dsp {

// Tempo estimation primitive. May be slow and may fail (empty result).
class ITempoEstimator {
public:
    virtual ~ITempoEstimator() = default;
    virtual std::optional<float> estimate_tempo(const std::vector<int16_t>& samples, int sample_rate) = 0;
};

struct OnsetTempoConfig {
    int hop_size = 512;
    float min_bpm = 60.0f;
    float max_bpm = 200.0f;
};

// Energy-envelope onset strength followed by autocorrelation over the lags of
// the allowed tempo range. Good enough for driving lights; not a beat tracker.
class OnsetTempoEstimator : public ITempoEstimator {
public:
    OnsetTempoEstimator() = default;
    explicit OnsetTempoEstimator(const OnsetTempoConfig& config) : config_(config) {}

    std::optional<float> estimate_tempo(const std::vector<int16_t>& samples, int sample_rate) override;

private:
    OnsetTempoConfig config_{};
    std::vector<double> envelope_;
    std::vector<double> onset_;
    std::vector<double> acf_;
};

} // namespace beatlight::dsp
