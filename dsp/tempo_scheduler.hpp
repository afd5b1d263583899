#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "tempo_estimator.hpp"

namespace beatlight::dsp {

struct TempoSchedulerConfig {
    int interval_chunks = 20;       // estimate on every Kth chunk
    float window_seconds = 4.0f;    // analysis window, 0 = current chunk only
    bool async = true;              // run the estimator on a worker thread
};

// Runs an expensive tempo estimator on a reduced cadence. The audio thread
// calls maybe_update_tempo() for every chunk; in async mode the estimator runs
// on a worker and its result is published through atomics, so the caller
// never waits on it. Failures keep the previous tempo.
class TempoScheduler {
public:
    TempoScheduler(std::shared_ptr<ITempoEstimator> estimator, const TempoSchedulerConfig& config);
    ~TempoScheduler();

    TempoScheduler(const TempoScheduler&) = delete;
    TempoScheduler& operator=(const TempoScheduler&) = delete;

    // Clears the window and tempo, sizes buffers for sample_rate. Joins any worker.
    void reset(int sample_rate);

    // Returns a new estimate when one became available during this call
    // (sync mode) or since the previous call (async mode).
    std::optional<float> maybe_update_tempo(uint64_t chunk_counter, const int16_t* samples,
                                            int count, int sample_rate);

    float current_tempo() const { return current_bpm_.load(std::memory_order_acquire); }
    bool is_processing() const { return processing_.load(std::memory_order_acquire); }

    // Abandons any in-flight estimate (its result is dropped) and joins the worker.
    void shutdown();

    uint64_t failures() const { return failures_.load(); }
    uint64_t skipped_ticks() const { return skipped_ticks_; }

private:
    void append_to_window(const int16_t* samples, int count);
    void copy_window(std::vector<int16_t>& out) const;
    void fill_job(const int16_t* samples, int count);
    bool accept(std::optional<float> estimate);
    void launch_worker(int sample_rate);
    void worker_proc(uint64_t generation, int sample_rate);

    std::shared_ptr<ITempoEstimator> estimator_;
    TempoSchedulerConfig config_{};

    // Analysis window (audio thread only)
    std::vector<int16_t> window_;
    size_t window_head_ = 0;
    size_t window_count_ = 0;
    int window_sample_rate_ = 0;

    // Job handed to the worker; written only while processing_ is false
    std::vector<int16_t> job_buffer_;

    std::atomic<float> current_bpm_{0.0f};
    std::atomic<bool> processing_{false};
    std::atomic<bool> result_ready_{false};
    std::atomic<float> result_bpm_{0.0f};
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> failures_{0};
    uint64_t skipped_ticks_ = 0;
    std::thread worker_;
};

} // namespace beatlight::dsp
