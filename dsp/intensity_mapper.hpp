#pragma once

#include "engine_settings.hpp"
#include "event.hpp"

namespace beatlight::dsp {

struct IntensityTable {
    float bass_drop;
    float rhythm;
    float vocal;
    float build;

    float operator[](EventKind kind) const;
};

struct IntensityConfig {
    IntensityPolicy policy = IntensityPolicy::Continuous;
    float scale = 5000.0f;
    IntensityTable floors{0.4f, 0.3f, 0.3f, 0.3f};
    IntensityTable fixed{1.0f, 0.8f, 0.7f, 0.5f};
};

// Maps a raw signal magnitude to a flash intensity in [0,1].
class IntensityMapper {
public:
    IntensityMapper() = default;
    explicit IntensityMapper(const IntensityConfig& config) : config_(config) {}

    float intensity(float signal_value, EventKind kind) const;

    const IntensityConfig& config() const { return config_; }

private:
    IntensityConfig config_{};
};

} // namespace beatlight::dsp
