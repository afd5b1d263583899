#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace beatlight::audio {

struct BeatPattern {
    std::string name;
    std::vector<float> accents;  // kick level per beat, 0..1
};

// Built-in patterns: steady 4/4, build-up, drop, breakdown
const std::vector<BeatPattern>& default_patterns();

// Deterministic drum-machine style signal: decaying low kick on each beat
// (scaled by the pattern accent), a noise snare on off-beats and a quiet
// mid-range pad underneath. Used by the simulated input and by tests.
class BeatSynth {
public:
    BeatSynth(int sample_rate, float bpm);

    void set_patterns(const std::vector<BeatPattern>& patterns);
    void set_bpm(float bpm);
    void set_level(float level) { level_ = level; }          // kick peak, 0..1 of full scale
    void set_pad_level(float level) { pad_level_ = level; }  // pad amplitude, 0..1
    void set_snare(bool enabled) { snare_ = enabled; }

    void render(int16_t* out, int count);

    int sample_rate() const { return sample_rate_; }
    float bpm() const { return bpm_; }
    // Name of the pattern currently playing
    const std::string& current_pattern() const;

private:
    float next_sample();

    int sample_rate_;
    float bpm_;
    float level_ = 0.8f;
    float pad_level_ = 0.03f;
    bool snare_ = true;

    std::vector<BeatPattern> patterns_;
    size_t pattern_index_ = 0;
    size_t beat_index_ = 0;

    uint64_t sample_pos_ = 0;
    double samples_per_beat_ = 0.0;
    double next_beat_at_ = 0.0;
    uint64_t beat_start_ = 0;
    float accent_ = 0.0f;
    uint32_t noise_state_ = 0x12345678u;
};

} // namespace beatlight::audio
