#include "threshold_gate.hpp"

#include <algorithm>

namespace beatlight::dsp {

float ThresholdGate::threshold(const RollingHistory& history) const {
    const float raw = history.mean() * config_.multiplier;
    return std::max(config_.min_threshold, std::min(raw, config_.max_threshold));
}

bool ThresholdGate::should_fire(float current_value, const RollingHistory& history,
                                const CooldownClock& cooldown, int64_t now_ms) const {
    if (history.size() < config_.warmup_samples) return false;
    if (!cooldown.ready(now_ms)) return false;
    // NaN compares false on both tests
    return current_value > threshold(history) && current_value > config_.absolute_floor;
}

} // namespace beatlight::dsp
