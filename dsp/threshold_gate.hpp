#pragma once

#include <cstdint>
#include <limits>

#include "rolling_history.hpp"

namespace beatlight::dsp {

// Single "last event" timestamp shared by every gate. Unarmed until the first
// event, so the first qualifying chunk is never held back.
struct CooldownClock {
    int64_t cooldown_ms = 250;
    int64_t last_event_ms = 0;
    bool armed = false;

    bool ready(int64_t now_ms) const { return !armed || now_ms - last_event_ms >= cooldown_ms; }
    void mark(int64_t now_ms) { last_event_ms = now_ms; armed = true; }
    void reset() { last_event_ms = 0; armed = false; }
};

struct ThresholdGateConfig {
    float multiplier = 1.5f;
    float min_threshold = 0.0f;
    float max_threshold = std::numeric_limits<float>::max();
    float absolute_floor = 0.0f;
    int warmup_samples = 5;
};

// Pure fire/no-fire decision: value against clamp(mean * multiplier, min, max).
// Never touches the cooldown clock; the caller marks it after emitting.
class ThresholdGate {
public:
    ThresholdGate() = default;
    explicit ThresholdGate(const ThresholdGateConfig& config) : config_(config) {}

    float threshold(const RollingHistory& history) const;

    bool should_fire(float current_value, const RollingHistory& history,
                     const CooldownClock& cooldown, int64_t now_ms) const;

    const ThresholdGateConfig& config() const { return config_; }

private:
    ThresholdGateConfig config_{};
};

} // namespace beatlight::dsp
