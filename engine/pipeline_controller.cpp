#include "pipeline_controller.hpp"

#include <chrono>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

#include "engine_settings_io.hpp"

namespace beatlight {

const char* pipeline_state_name(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:    return "idle";
        case PipelineState::Running: return "running";
        case PipelineState::Stopped: return "stopped";
    }
    return "idle";
}

static dsp::ThresholdGateConfig volume_gate_config(const EngineSettings& st) {
    dsp::ThresholdGateConfig c;
    c.multiplier = st.volume_threshold_multiplier;
    c.min_threshold = st.min_volume_threshold;
    c.max_threshold = st.max_volume_threshold;
    c.absolute_floor = st.min_volume_threshold;
    c.warmup_samples = st.warmup_samples;
    return c;
}

// Floors are configured in raw int16 spectral units
static float spectral_floor(const EngineSettings& st, float raw_floor) {
    return st.normalize_samples ? raw_floor / 32768.0f : raw_floor;
}

static dsp::ThresholdGateConfig band_gate_config(const EngineSettings& st, float multiplier, float floor) {
    dsp::ThresholdGateConfig c;
    c.multiplier = multiplier;
    c.min_threshold = 0.0f;
    c.max_threshold = std::numeric_limits<float>::max();
    c.absolute_floor = spectral_floor(st, floor);
    c.warmup_samples = st.warmup_samples;
    return c;
}

static dsp::ClassifierConfig classifier_config(const EngineSettings& st) {
    dsp::ClassifierConfig c;
    c.bass_drop_multiplier = st.bass_drop_multiplier;
    c.bass_drop_floor = spectral_floor(st, st.bass_drop_floor);
    c.rhythm_multiplier = st.rhythm_multiplier;
    c.rhythm_floor = spectral_floor(st, st.rhythm_floor);
    c.vocal_multiplier = st.vocal_multiplier;
    c.vocal_dominance = st.vocal_dominance;
    c.build_window = st.build_window;
    c.warmup_samples = st.warmup_samples;
    return c;
}

static dsp::IntensityConfig intensity_config(const EngineSettings& st) {
    dsp::IntensityConfig c;
    c.policy = st.intensity_policy;
    c.scale = st.intensity_scale;
    c.floors = {st.bass_drop_intensity_floor, st.rhythm_intensity_floor,
                st.vocal_intensity_floor, st.build_intensity_floor};
    c.fixed = {st.bass_drop_fixed_intensity, st.rhythm_fixed_intensity,
               st.vocal_fixed_intensity, st.build_fixed_intensity};
    return c;
}

static dsp::TempoSchedulerConfig tempo_config(const EngineSettings& st) {
    dsp::TempoSchedulerConfig c;
    c.interval_chunks = st.tempo_interval_chunks;
    c.window_seconds = st.tempo_window_seconds;
    c.async = st.tempo_async;
    return c;
}

static int64_t steady_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

PipelineController::PipelineController(const EngineSettings& settings,
                                       std::shared_ptr<IEventSink> sink,
                                       std::shared_ptr<dsp::ITempoEstimator> estimator,
                                       Clock clock)
    : settings_(settings),
      sink_(std::move(sink)),
      clock_(clock ? std::move(clock) : Clock(&steady_now_ms)),
      volume_history_(settings.history_capacity),
      bass_history_(settings.history_capacity),
      mid_history_(settings.history_capacity),
      volume_gate_(volume_gate_config(settings)),
      bass_gate_(band_gate_config(settings, settings.bass_gate_multiplier, settings.bass_gate_floor)),
      mid_gate_(band_gate_config(settings, settings.mid_gate_multiplier, settings.mid_gate_floor)),
      classifier_(classifier_config(settings)),
      intensity_(intensity_config(settings)),
      tempo_(settings.tempo_enabled ? std::move(estimator) : std::shared_ptr<dsp::ITempoEstimator>(), tempo_config(settings)) {
    cooldown_.cooldown_ms = settings.cooldown_ms;
    analyzer_.set_normalize(settings.normalize_samples);
}

PipelineController::~PipelineController() {
    stop();
}

void PipelineController::reset_state() {
    volume_history_.clear();
    bass_history_.clear();
    mid_history_.clear();
    cooldown_.reset();
    chunk_counter_ = 0;
    stats_ = Stats{};
    analyzer_.prepare(settings_.chunk_size);
    tempo_.reset(settings_.sample_rate);
}

bool PipelineController::start() {
    if (state_ == PipelineState::Running) return false;
    std::string error;
    if (!validate_settings(settings_, error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return false;
    }
    reset_state();
    state_ = PipelineState::Running;
    return true;
}

void PipelineController::stop() {
    if (state_ != PipelineState::Running) return;
    state_ = PipelineState::Stopped;
    tempo_.shutdown();
}

std::optional<Event> PipelineController::process_chunk(const std::vector<int16_t>& samples, int sample_rate) {
    return process_chunk(samples.data(), static_cast<int>(samples.size()), sample_rate);
}

std::optional<Event> PipelineController::process_chunk(const int16_t* samples, int count, int sample_rate) {
    if (state_ != PipelineState::Running) return std::nullopt;
    // Too short to analyze: nothing to learn from it
    if (!samples || count < 2 || sample_rate <= 0) return std::nullopt;

    const int64_t now_ms = clock_();
    ++chunk_counter_;

    const float rms = dsp::chunk_rms(samples, count);
    const BandEnergy energy = analyzer_.analyze(samples, count, sample_rate);

    if (settings_.tempo_enabled) {
        tempo_.maybe_update_tempo(chunk_counter_, samples, count, sample_rate);
    }
    return process_features(rms, energy, now_ms);
}

bool PipelineController::any_gate_fires(float rms, const BandEnergy& energy, int64_t now_ms) const {
    if (volume_gate_.should_fire(rms, volume_history_, cooldown_, now_ms)) return true;
    if (settings_.bass_gate_enabled && bass_gate_.should_fire(energy.bass, bass_history_, cooldown_, now_ms)) return true;
    if (settings_.mid_gate_enabled && mid_gate_.should_fire(energy.mid, mid_history_, cooldown_, now_ms)) return true;
    return false;
}

std::optional<Event> PipelineController::process_features(float rms, const BandEnergy& energy, int64_t now_ms) {
    if (state_ != PipelineState::Running) return std::nullopt;
    ++stats_.chunks;

    volume_history_.push(rms);
    bass_history_.push(energy.bass);
    mid_history_.push(energy.mid);

    // Near-silence never fires, whatever the history says
    if (!(rms >= settings_.silence_floor)) {
        ++stats_.silent_chunks;
        return std::nullopt;
    }

    if (!any_gate_fires(rms, energy, now_ms)) return std::nullopt;
    ++stats_.gate_fires;

    const auto kind = classifier_.classify(energy.bass, energy.mid, bass_history_, mid_history_);
    if (!kind) {
        ++stats_.vetoed;
        return std::nullopt;
    }

    Event ev;
    ev.kind = *kind;
    ev.intensity = intensity_.intensity(rms, *kind);
    ev.tempo_bpm = tempo_.current_tempo();
    ev.bass_energy = energy.bass;
    ev.mid_energy = energy.mid;
    ev.high_energy = energy.high;
    ev.timestamp_ms = now_ms;

    cooldown_.mark(now_ms);
    ++stats_.events;
    ++stats_.per_kind[static_cast<int>(*kind)];

    if (sink_ && !sink_->emit(ev)) ++stats_.sink_drops;
    return ev;
}

} // namespace beatlight
