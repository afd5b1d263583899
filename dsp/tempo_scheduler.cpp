#include "tempo_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace beatlight::dsp {

TempoScheduler::TempoScheduler(std::shared_ptr<ITempoEstimator> estimator, const TempoSchedulerConfig& config)
    : estimator_(std::move(estimator)), config_(config) {
    config_.interval_chunks = std::max(1, config_.interval_chunks);
    config_.window_seconds = std::max(0.0f, config_.window_seconds);
}

TempoScheduler::~TempoScheduler() {
    shutdown();
}

void TempoScheduler::reset(int sample_rate) {
    shutdown();
    window_sample_rate_ = sample_rate;
    const size_t capacity = sample_rate > 0
        ? static_cast<size_t>(std::lround(config_.window_seconds * static_cast<float>(sample_rate)))
        : 0;
    window_.assign(capacity, 0);
    window_head_ = 0;
    window_count_ = 0;
    job_buffer_.clear();
    job_buffer_.reserve(capacity);
    current_bpm_.store(0.0f, std::memory_order_release);
    result_ready_.store(false);
    skipped_ticks_ = 0;
}

void TempoScheduler::append_to_window(const int16_t* samples, int count) {
    if (window_.empty() || !samples || count <= 0) return;
    const size_t cap = window_.size();
    // Only the newest cap samples of an oversized chunk matter
    size_t start = count > static_cast<int>(cap) ? static_cast<size_t>(count) - cap : 0;
    for (size_t i = start; i < static_cast<size_t>(count); ++i) {
        window_[window_head_] = samples[i];
        window_head_ = (window_head_ + 1) % cap;
    }
    window_count_ = std::min(cap, window_count_ + (static_cast<size_t>(count) - start));
}

void TempoScheduler::copy_window(std::vector<int16_t>& out) const {
    out.clear();
    const size_t cap = window_.size();
    const size_t oldest = (window_head_ + cap - window_count_) % cap;
    for (size_t i = 0; i < window_count_; ++i) out.push_back(window_[(oldest + i) % cap]);
}

void TempoScheduler::fill_job(const int16_t* samples, int count) {
    if (!window_.empty()) {
        copy_window(job_buffer_);
    } else if (samples && count > 0) {
        job_buffer_.assign(samples, samples + count);
    } else {
        job_buffer_.clear();
    }
}

bool TempoScheduler::accept(std::optional<float> estimate) {
    if (!estimate || !std::isfinite(*estimate) || *estimate <= 0.0f) {
        failures_.fetch_add(1);
        return false;
    }
    return true;
}

std::optional<float> TempoScheduler::maybe_update_tempo(uint64_t chunk_counter, const int16_t* samples,
                                                        int count, int sample_rate) {
    if (sample_rate != window_sample_rate_) reset(sample_rate);
    append_to_window(samples, count);

    std::optional<float> published;
    if (config_.async && result_ready_.exchange(false, std::memory_order_acq_rel)) {
        published = result_bpm_.load(std::memory_order_acquire);
    }

    if (!estimator_ || sample_rate <= 0 || chunk_counter % static_cast<uint64_t>(config_.interval_chunks) != 0) {
        return published;
    }

    if (!config_.async) {
        fill_job(samples, count);
        auto estimate = estimator_->estimate_tempo(job_buffer_, sample_rate);
        if (!accept(estimate)) return published;
        current_bpm_.store(*estimate, std::memory_order_release);
        return *estimate;
    }

    if (processing_.load(std::memory_order_acquire)) {
        // Previous estimate still running; tempo is advisory, skip this tick
        ++skipped_ticks_;
        return published;
    }
    fill_job(samples, count);
    launch_worker(sample_rate);
    return published;
}

void TempoScheduler::launch_worker(int sample_rate) {
    // Worker has cleared processing_, so this join returns at once
    if (worker_.joinable()) worker_.join();
    processing_.store(true, std::memory_order_release);
    worker_ = std::thread(&TempoScheduler::worker_proc, this, generation_.load(), sample_rate);
}

void TempoScheduler::worker_proc(uint64_t generation, int sample_rate) {
    auto estimate = estimator_->estimate_tempo(job_buffer_, sample_rate);
    if (generation == generation_.load(std::memory_order_acquire) && accept(estimate)) {
        current_bpm_.store(*estimate, std::memory_order_release);
        result_bpm_.store(*estimate, std::memory_order_release);
        result_ready_.store(true, std::memory_order_release);
    }
    processing_.store(false, std::memory_order_release);
}

void TempoScheduler::shutdown() {
    generation_.fetch_add(1, std::memory_order_acq_rel);
    if (worker_.joinable()) worker_.join();
    processing_.store(false);
    result_ready_.store(false);
}

} // namespace beatlight::dsp
