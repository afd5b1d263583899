#pragma once

#include <string>

namespace beatlight {

enum class IntensityPolicy {
    Continuous,  // clamp(rms / scale, kind floor, 1)
    FixedTable   // one constant per event kind
};

struct EngineSettings {
    // Stream
    int sample_rate = 44100;
    int chunk_size = 1024;
    std::string device_name = "default";

    // Rolling statistics
    int history_capacity = 10;
    int warmup_samples = 5;
    int cooldown_ms = 250;
    bool normalize_samples = true;  // divide by 32768 before the FFT

    // Volume gate (RMS in int16 units)
    float silence_floor = 500.0f;
    float volume_threshold_multiplier = 1.5f;
    float min_volume_threshold = 500.0f;
    float max_volume_threshold = 10000.0f;

    // Band gates. Spectral floors here and in the classifier are in raw
    // int16 magnitude units whatever normalize_samples says; the pipeline
    // rescales them to the analyzer's output.
    bool bass_gate_enabled = true;
    float bass_gate_multiplier = 1.8f;
    float bass_gate_floor = 2000.0f;
    bool mid_gate_enabled = true;
    float mid_gate_multiplier = 1.3f;
    float mid_gate_floor = 1000.0f;

    // Classifier
    float bass_drop_multiplier = 2.0f;
    float bass_drop_floor = 5000.0f;
    float rhythm_multiplier = 1.5f;
    float rhythm_floor = 3000.0f;
    float vocal_multiplier = 1.3f;
    float vocal_dominance = 1.2f;
    int build_window = 5;

    // Intensity
    IntensityPolicy intensity_policy = IntensityPolicy::Continuous;
    float intensity_scale = 5000.0f;
    float bass_drop_intensity_floor = 0.4f;
    float rhythm_intensity_floor = 0.3f;
    float vocal_intensity_floor = 0.3f;
    float build_intensity_floor = 0.3f;
    float bass_drop_fixed_intensity = 1.0f;
    float rhythm_fixed_intensity = 0.8f;
    float vocal_fixed_intensity = 0.7f;
    float build_fixed_intensity = 0.5f;

    // Tempo
    bool tempo_enabled = true;
    int tempo_interval_chunks = 20;   // ~2 s at 1024/44100
    float tempo_window_seconds = 4.0f; // 0 = current chunk only
    bool tempo_async = true;
    float tempo_min_bpm = 60.0f;
    float tempo_max_bpm = 200.0f;

    // Emission
    int event_queue_capacity = 64;
};

const char* intensity_policy_name(IntensityPolicy policy);
bool parse_intensity_policy(const std::string& text, IntensityPolicy& out);

} // namespace beatlight
