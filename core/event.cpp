#include "event.hpp"

#include <cmath>
#include <cstdio>

namespace beatlight {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::BassDrop: return "bass_drop";
        case EventKind::Rhythm:   return "rhythm";
        case EventKind::Vocal:    return "vocal";
        case EventKind::Build:    return "build";
    }
    return "rhythm";
}

static long long to_wire_int(float v) {
    if (!std::isfinite(v) || v < 0.0f) return 0;
    if (v >= 9.0e18f) return 9000000000000000000LL;
    return static_cast<long long>(v);
}

std::string format_event_json(const Event& e) {
    char buf[256];
    int n = std::snprintf(buf, sizeof(buf),
        "{\"event_type\":\"%s\",\"intensity\":%.3f,\"bpm\":%lld,"
        "\"bass_energy\":%lld,\"mid_energy\":%lld,\"high_energy\":%lld,\"timestamp\":%.3f}",
        event_kind_name(e.kind),
        e.intensity,
        to_wire_int(e.tempo_bpm),
        to_wire_int(e.bass_energy),
        to_wire_int(e.mid_energy),
        to_wire_int(e.high_energy),
        static_cast<double>(e.timestamp_ms) / 1000.0);
    if (n < 0) return std::string();
    return std::string(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1);
}

} // namespace beatlight
