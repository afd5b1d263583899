#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "band_analyzer.hpp"
#include "engine_settings.hpp"
#include "event.hpp"
#include "event_classifier.hpp"
#include "event_sink.hpp"
#include "intensity_mapper.hpp"
#include "rolling_history.hpp"
#include "tempo_scheduler.hpp"
#include "threshold_gate.hpp"

namespace beatlight {

enum class PipelineState {
    Idle,
    Running,
    Stopped
};

const char* pipeline_state_name(PipelineState state);

// Per-chunk event detection. Owns all rolling state; process_chunk() is
// meant to be called from a single audio thread and does not lock or
// allocate once the first chunk of a given length has been seen.
class PipelineController {
public:
    // Milliseconds on a monotonic clock
    using Clock = std::function<int64_t()>;

    struct Stats {
        uint64_t chunks = 0;
        uint64_t silent_chunks = 0;
        uint64_t gate_fires = 0;
        uint64_t vetoed = 0;        // gate fired, classifier found no kind
        uint64_t events = 0;
        uint64_t sink_drops = 0;
        uint64_t per_kind[4] = {0, 0, 0, 0};
    };

    // estimator may be null; tempo then stays 0. clock defaults to steady_clock.
    PipelineController(const EngineSettings& settings,
                       std::shared_ptr<IEventSink> sink,
                       std::shared_ptr<dsp::ITempoEstimator> estimator = nullptr,
                       Clock clock = Clock());
    ~PipelineController();

    PipelineController(const PipelineController&) = delete;
    PipelineController& operator=(const PipelineController&) = delete;

    // Validates settings and enters Running with empty state. Returns false
    // (state unchanged) on invalid settings or when already running.
    bool start();
    void stop();
    PipelineState state() const { return state_; }
    bool is_running() const { return state_ == PipelineState::Running; }

    std::optional<Event> process_chunk(const int16_t* samples, int count, int sample_rate);
    std::optional<Event> process_chunk(const std::vector<int16_t>& samples, int sample_rate);

    // Decision path after band analysis. History pushes happen here too.
    std::optional<Event> process_features(float rms, const BandEnergy& energy, int64_t now_ms);

    float current_tempo() const { return tempo_.current_tempo(); }
    const Stats& stats() const { return stats_; }
    const EngineSettings& settings() const { return settings_; }

    const dsp::RollingHistory& volume_history() const { return volume_history_; }
    const dsp::RollingHistory& bass_history() const { return bass_history_; }
    const dsp::RollingHistory& mid_history() const { return mid_history_; }
    const dsp::CooldownClock& cooldown() const { return cooldown_; }

private:
    bool any_gate_fires(float rms, const BandEnergy& energy, int64_t now_ms) const;
    void reset_state();

    EngineSettings settings_;
    std::shared_ptr<IEventSink> sink_;
    Clock clock_;
    PipelineState state_ = PipelineState::Idle;

    dsp::BandAnalyzer analyzer_;
    dsp::RollingHistory volume_history_;
    dsp::RollingHistory bass_history_;
    dsp::RollingHistory mid_history_;
    dsp::ThresholdGate volume_gate_;
    dsp::ThresholdGate bass_gate_;
    dsp::ThresholdGate mid_gate_;
    dsp::CooldownClock cooldown_;
    dsp::EventClassifier classifier_;
    dsp::IntensityMapper intensity_;
    dsp::TempoScheduler tempo_;

    uint64_t chunk_counter_ = 0;
    Stats stats_{};
};

} // namespace beatlight
