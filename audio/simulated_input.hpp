#pragma once

#include <atomic>
#include <thread>

#include "audio_input.hpp"
#include "beat_synth.hpp"

namespace beatlight::audio {

// IAudioInput backed by BeatSynth. Chunks are paced at the real-time cadence
// (chunk_size / sample_rate) unless paced is false.
class SimulatedAudioInput : public IAudioInput {
public:
    SimulatedAudioInput(const CaptureConfig& config, float bpm, bool paced = true);
    ~SimulatedAudioInput() override;

    bool start() override;
    void stop() override;
    bool is_running() const override { return running_.load(); }

    void set_process_callback(ProcessCallback callback) override { callback_ = callback; }
    const CaptureConfig& get_config() const override { return config_; }
    LatencyStats get_latency_stats() const override;

    // Stops by itself after this many chunks (0 = unlimited)
    void set_chunk_limit(uint64_t limit) { chunk_limit_ = limit; }
    uint64_t chunks_delivered() const { return delivered_.load(); }

    BeatSynth& synth() { return synth_; }

private:
    void thread_func();

    CaptureConfig config_;
    BeatSynth synth_;
    bool paced_;
    uint64_t chunk_limit_ = 0;
    ProcessCallback callback_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> delivered_{0};
    std::thread thread_;

    std::atomic<float> min_latency_ms_{1000.0f};
    std::atomic<float> max_latency_ms_{0.0f};
    std::atomic<float> total_latency_ms_{0.0f};
    std::atomic<int> late_chunks_{0};
};

} // namespace beatlight::audio
