#include "beat_synth.hpp"

#include <algorithm>
#include <cmath>

namespace beatlight::audio {

const std::vector<BeatPattern>& default_patterns() {
    static const std::vector<BeatPattern> patterns = {
        {"Steady 4/4", {1.0f, 0.5f, 0.7f, 0.5f}},
        {"Build-up", {0.4f, 0.5f, 0.6f, 0.7f, 0.8f, 0.9f, 1.0f}},
        {"Drop", {1.0f, 1.0f, 0.8f, 0.8f, 1.0f, 0.6f, 0.9f, 0.7f}},
        {"Breakdown", {0.8f, 0.3f, 0.8f, 0.3f, 0.8f, 0.3f}},
    };
    return patterns;
}

BeatSynth::BeatSynth(int sample_rate, float bpm)
    : sample_rate_(std::max(1, sample_rate)), bpm_(bpm), patterns_(default_patterns()) {
    set_bpm(bpm);
}

void BeatSynth::set_patterns(const std::vector<BeatPattern>& patterns) {
    patterns_ = patterns;
    pattern_index_ = 0;
    beat_index_ = 0;
}

void BeatSynth::set_bpm(float bpm) {
    bpm_ = std::max(1.0f, bpm);
    samples_per_beat_ = 60.0 * sample_rate_ / bpm_;
}

const std::string& BeatSynth::current_pattern() const {
    static const std::string none;
    return patterns_.empty() ? none : patterns_[pattern_index_].name;
}

float BeatSynth::next_sample() {
    if (static_cast<double>(sample_pos_) >= next_beat_at_) {
        accent_ = 1.0f;
        if (!patterns_.empty()) {
            const auto& p = patterns_[pattern_index_];
            accent_ = p.accents.empty() ? 1.0f : p.accents[beat_index_ % p.accents.size()];
            if (++beat_index_ >= p.accents.size()) {
                beat_index_ = 0;
                pattern_index_ = (pattern_index_ + 1) % patterns_.size();
            }
        }
        beat_start_ = sample_pos_;
        next_beat_at_ += samples_per_beat_;
    }

    const double two_pi = 6.28318530717958647692;
    const double t = static_cast<double>(sample_pos_) / sample_rate_;
    const double since_beat = static_cast<double>(sample_pos_ - beat_start_) / sample_rate_;

    // Kick: 60 Hz with fast exponential decay
    double v = level_ * accent_ * std::exp(-since_beat * 18.0) * std::sin(two_pi * 60.0 * since_beat);

    // Snare: noise burst half a beat after the kick
    if (snare_) {
        const double half = 0.5 * samples_per_beat_ / sample_rate_;
        if (since_beat >= half) {
            noise_state_ = noise_state_ * 1664525u + 1013904223u;
            const double noise = (static_cast<double>(noise_state_ >> 8) / 8388608.0) - 1.0;
            v += 0.15 * accent_ * std::exp(-(since_beat - half) * 30.0) * noise;
        }
    }

    // Pad: steady 440 Hz + 880 Hz
    v += pad_level_ * (std::sin(two_pi * 440.0 * t) + 0.5 * std::sin(two_pi * 880.0 * t));

    ++sample_pos_;
    return static_cast<float>(v);
}

void BeatSynth::render(int16_t* out, int count) {
    if (!out) return;
    for (int i = 0; i < count; ++i) {
        float s = std::round(next_sample() * 32767.0f);
        s = std::max(-32768.0f, std::min(32767.0f, s));
        out[i] = static_cast<int16_t>(s);
    }
}

} // namespace beatlight::audio
