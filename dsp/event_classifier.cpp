#include "event_classifier.hpp"

namespace beatlight::dsp {

std::optional<EventKind> EventClassifier::classify(float bass, float mid,
                                                   const RollingHistory& bass_history,
                                                   const RollingHistory& mid_history) const {
    if (bass_history.size() < config_.warmup_samples || mid_history.size() < config_.warmup_samples) {
        return std::nullopt;
    }

    const float avg_bass = bass_history.mean();
    const float avg_mid = mid_history.mean();

    // Sudden large bass spike
    if (bass > avg_bass * config_.bass_drop_multiplier && bass > config_.bass_drop_floor) {
        return EventKind::BassDrop;
    }
    // Moderate bass pulse
    if (bass > avg_bass * config_.rhythm_multiplier && bass > config_.rhythm_floor) {
        return EventKind::Rhythm;
    }
    // Mids dominate
    if (mid > avg_mid * config_.vocal_multiplier && mid > bass * config_.vocal_dominance) {
        return EventKind::Vocal;
    }
    if (bass_history.tail_strictly_increasing(config_.build_window)) {
        return EventKind::Build;
    }
    return std::nullopt;
}

} // namespace beatlight::dsp
