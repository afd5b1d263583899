#include "simulated_input.hpp"

#include <chrono>
#include <iostream>
#include <vector>

namespace beatlight::audio {

SimulatedAudioInput::SimulatedAudioInput(const CaptureConfig& config, float bpm, bool paced)
    : config_(config), synth_(static_cast<int>(config.sample_rate), bpm), paced_(paced) {}

SimulatedAudioInput::~SimulatedAudioInput() {
    stop();
}

bool SimulatedAudioInput::start() {
    if (running_.load()) return true;
    if (config_.sample_rate == 0 || config_.chunk_size == 0) {
        std::cerr << "Simulated input needs a sample rate and chunk size" << std::endl;
        return false;
    }
    // Previous run may have ended on its chunk limit
    if (thread_.joinable()) thread_.join();
    running_ = true;
    thread_ = std::thread(&SimulatedAudioInput::thread_func, this);
    std::cerr << "Simulated input: " << synth_.bpm() << " BPM, "
              << config_.sample_rate << " Hz, " << config_.chunk_size << " frames/chunk" << std::endl;
    return true;
}

void SimulatedAudioInput::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

IAudioInput::LatencyStats SimulatedAudioInput::get_latency_stats() const {
    LatencyStats stats{};
    const uint64_t n = delivered_.load();
    stats.min_ms = n > 0 ? min_latency_ms_.load() : 0.0f;
    stats.max_ms = max_latency_ms_.load();
    stats.avg_ms = n > 0 ? total_latency_ms_.load() / static_cast<float>(n) : 0.0f;
    stats.xruns = late_chunks_.load();
    return stats;
}

void SimulatedAudioInput::thread_func() {
    using clock = std::chrono::steady_clock;
    const int chunk = static_cast<int>(config_.chunk_size);
    const int rate = static_cast<int>(config_.sample_rate);
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(static_cast<double>(chunk) / rate));

    std::vector<int16_t> buffer(chunk);
    auto deadline = clock::now();

    while (running_.load()) {
        synth_.render(buffer.data(), chunk);

        auto start_time = clock::now();
        if (callback_) callback_(buffer.data(), chunk, rate);
        auto end_time = clock::now();
        float latency_ms = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count() / 1000.0f;
        if (latency_ms < min_latency_ms_.load()) min_latency_ms_.store(latency_ms);
        if (latency_ms > max_latency_ms_.load()) max_latency_ms_.store(latency_ms);
        total_latency_ms_.store(total_latency_ms_.load() + latency_ms);

        const uint64_t n = ++delivered_;
        if (chunk_limit_ > 0 && n >= chunk_limit_) break;

        if (paced_) {
            deadline += period;
            if (clock::now() > deadline) {
                // Callback overran the cadence; count it like an xrun
                late_chunks_++;
                deadline = clock::now();
            } else {
                std::this_thread::sleep_until(deadline);
            }
        }
    }
    running_ = false;
}

} // namespace beatlight::audio
