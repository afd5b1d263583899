#include "intensity_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace beatlight::dsp {

float IntensityTable::operator[](EventKind kind) const {
    switch (kind) {
        case EventKind::BassDrop: return bass_drop;
        case EventKind::Rhythm:   return rhythm;
        case EventKind::Vocal:    return vocal;
        case EventKind::Build:    return build;
    }
    return rhythm;
}

static float clamp_unit(float v) {
    if (!std::isfinite(v)) return 0.0f;
    return std::max(0.0f, std::min(1.0f, v));
}

float IntensityMapper::intensity(float signal_value, EventKind kind) const {
    if (config_.policy == IntensityPolicy::FixedTable) {
        return clamp_unit(config_.fixed[kind]);
    }
    const float floor = clamp_unit(config_.floors[kind]);
    if (!std::isfinite(signal_value) || signal_value <= 0.0f || !(config_.scale > 0.0f)) {
        // +inf is a saturated signal, everything else degenerate maps to the floor
        if (signal_value > 0.0f && std::isinf(signal_value)) return 1.0f;
        return floor;
    }
    const float scaled = signal_value / config_.scale;
    return std::max(floor, std::min(1.0f, scaled));
}

} // namespace beatlight::dsp
