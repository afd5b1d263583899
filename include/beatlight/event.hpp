#pragma once

#include <cstdint>
#include <string>

namespace beatlight {

enum class EventKind {
    BassDrop,
    Rhythm,
    Vocal,
    Build
};

// Wire tag: "bass_drop", "rhythm", "vocal", "build"
const char* event_kind_name(EventKind kind);

// Summed spectral magnitude per band for one chunk
struct BandEnergy {
    float bass = 0.0f;   // 20-250 Hz
    float mid = 0.0f;    // 250-2000 Hz
    float high = 0.0f;   // 2000-8000 Hz
    float vocal = 0.0f;  // 300-3400 Hz
};

struct Event {
    EventKind kind = EventKind::Rhythm;
    float intensity = 0.0f;   // [0,1]
    float tempo_bpm = 0.0f;   // last known estimate, 0 if none yet
    float bass_energy = 0.0f;
    float mid_energy = 0.0f;
    float high_energy = 0.0f;
    int64_t timestamp_ms = 0; // engine clock
};

// One-line JSON message for the downstream transport
std::string format_event_json(const Event& e);

} // namespace beatlight
