#pragma once

#include <optional>

#include "event.hpp"
#include "rolling_history.hpp"

namespace beatlight::dsp {

struct ClassifierConfig {
    float bass_drop_multiplier = 2.0f;
    float bass_drop_floor = 5000.0f;
    float rhythm_multiplier = 1.5f;
    float rhythm_floor = 3000.0f;
    float vocal_multiplier = 1.3f;
    float vocal_dominance = 1.2f;  // mid must exceed bass by this factor
    int build_window = 5;
    int warmup_samples = 5;
};

// Assigns a kind to a chunk that already passed the gates. Checks run in
// priority order BassDrop, Rhythm, Vocal, Build; first match wins. An empty
// result vetoes the gate decision.
class EventClassifier {
public:
    EventClassifier() = default;
    explicit EventClassifier(const ClassifierConfig& config) : config_(config) {}

    std::optional<EventKind> classify(float bass, float mid,
                                      const RollingHistory& bass_history,
                                      const RollingHistory& mid_history) const;

    const ClassifierConfig& config() const { return config_; }

private:
    ClassifierConfig config_{};
};

} // namespace beatlight::dsp
