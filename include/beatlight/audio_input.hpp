#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace beatlight {

struct CaptureConfig {
    std::string device_name = "default";  // ALSA device (e.g., "hw:0", "plughw:0")
    unsigned int sample_rate = 44100;
    unsigned int chunk_size = 1024;       // frames per delivered chunk (~23 ms @ 44.1 kHz)
    unsigned int num_periods = 4;
    bool use_realtime_priority = false;
};

// Delivers mono int16 chunks on a dedicated thread
class IAudioInput {
public:
    using ProcessCallback = std::function<void(const int16_t* samples, int num_samples, int sample_rate)>;

    virtual ~IAudioInput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    virtual void set_process_callback(ProcessCallback callback) = 0;
    virtual const CaptureConfig& get_config() const = 0;

    struct LatencyStats {
        float min_ms;
        float max_ms;
        float avg_ms;
        int xruns;
    };
    virtual LatencyStats get_latency_stats() const = 0;
};

// ALSA capture backend; returns nullptr in builds without one
std::unique_ptr<IAudioInput> createAudioInput(const CaptureConfig& config);

// Downmix interleaved stereo to mono in place; returns the frame count
int downmix_stereo(int16_t* interleaved, int frames);

} // namespace beatlight
