#include "engine_settings.hpp"
#include "engine_settings_io.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace beatlight {

const char* intensity_policy_name(IntensityPolicy policy) {
    switch (policy) {
        case IntensityPolicy::Continuous: return "continuous";
        case IntensityPolicy::FixedTable: return "fixed";
    }
    return "continuous";
}

bool parse_intensity_policy(const std::string& text, IntensityPolicy& out) {
    if (text == "continuous") { out = IntensityPolicy::Continuous; return true; }
    if (text == "fixed" || text == "fixed_table") { out = IntensityPolicy::FixedTable; return true; }
    return false;
}

// Every persisted setting, in file order. The same list drives the JSON
// reader, the writer and the BEATLIGHT_* environment layer.
template <typename Settings, typename Visitor>
static void visit_fields(Settings& st, Visitor& v) {
    v("sample_rate", st.sample_rate);
    v("chunk_size", st.chunk_size);
    v("device_name", st.device_name);
    v("history_capacity", st.history_capacity);
    v("warmup_samples", st.warmup_samples);
    v("cooldown_ms", st.cooldown_ms);
    v("normalize_samples", st.normalize_samples);

    v("silence_floor", st.silence_floor);
    v("volume_threshold_multiplier", st.volume_threshold_multiplier);
    v("min_volume_threshold", st.min_volume_threshold);
    v("max_volume_threshold", st.max_volume_threshold);

    v("bass_gate_enabled", st.bass_gate_enabled);
    v("bass_gate_multiplier", st.bass_gate_multiplier);
    v("bass_gate_floor", st.bass_gate_floor);
    v("mid_gate_enabled", st.mid_gate_enabled);
    v("mid_gate_multiplier", st.mid_gate_multiplier);
    v("mid_gate_floor", st.mid_gate_floor);

    v("bass_drop_multiplier", st.bass_drop_multiplier);
    v("bass_drop_floor", st.bass_drop_floor);
    v("rhythm_multiplier", st.rhythm_multiplier);
    v("rhythm_floor", st.rhythm_floor);
    v("vocal_multiplier", st.vocal_multiplier);
    v("vocal_dominance", st.vocal_dominance);
    v("build_window", st.build_window);

    v("intensity_policy", st.intensity_policy);
    v("intensity_scale", st.intensity_scale);
    v("bass_drop_intensity_floor", st.bass_drop_intensity_floor);
    v("rhythm_intensity_floor", st.rhythm_intensity_floor);
    v("vocal_intensity_floor", st.vocal_intensity_floor);
    v("build_intensity_floor", st.build_intensity_floor);
    v("bass_drop_fixed_intensity", st.bass_drop_fixed_intensity);
    v("rhythm_fixed_intensity", st.rhythm_fixed_intensity);
    v("vocal_fixed_intensity", st.vocal_fixed_intensity);
    v("build_fixed_intensity", st.build_fixed_intensity);

    v("tempo_enabled", st.tempo_enabled);
    v("tempo_interval_chunks", st.tempo_interval_chunks);
    v("tempo_window_seconds", st.tempo_window_seconds);
    v("tempo_async", st.tempo_async);
    v("tempo_min_bpm", st.tempo_min_bpm);
    v("tempo_max_bpm", st.tempo_max_bpm);

    v("event_queue_capacity", st.event_queue_capacity);
}

// A value must be followed by nothing but blanks and, inside the JSON file,
// the next separator. "50OO" or "1e3" for an integer are rejected.
static bool at_value_end(const char* p, bool in_file) {
    while (*p == ' ' || *p == '\t') ++p;
    if (*p == '\0') return true;
    return in_file && (*p == ',' || *p == '}' || *p == '\n' || *p == '\r');
}

static bool parse_value(const char* p, float& out, bool in_file) {
    errno = 0;
    char* end = nullptr;
    float v = std::strtof(p, &end);
    if (end == p || errno == ERANGE || !std::isfinite(v) || !at_value_end(end, in_file)) return false;
    out = v;
    return true;
}
static bool parse_value(const char* p, int& out, bool in_file) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(p, &end, 10);
    if (end == p || errno == ERANGE || v < INT_MIN || v > INT_MAX || !at_value_end(end, in_file)) return false;
    out = static_cast<int>(v);
    return true;
}
static bool parse_value(const char* p, bool& out, bool in_file) {
    static const struct { const char* text; bool value; } words[] = {
        {"true", true}, {"false", false}, {"1", true}, {"0", false}, {"on", true}, {"off", false},
    };
    // JSON only knows true/false
    const int count = in_file ? 2 : 6;
    for (int i = 0; i < count; ++i) {
        const size_t n = std::strlen(words[i].text);
        if (std::strncmp(p, words[i].text, n) == 0 && at_value_end(p + n, in_file)) {
            out = words[i].value;
            return true;
        }
    }
    return false;
}
// File strings are quoted with \" and \\ escapes; environment strings are taken as is
static bool parse_value(const char* p, std::string& out, bool in_file) {
    if (!in_file) {
        out = p;
        return true;
    }
    if (*p != '"') return false;
    ++p;
    std::string s;
    while (*p && *p != '"') {
        if (*p == '\n' || *p == '\r') return false;
        if (*p == '\\') {
            ++p;
            switch (*p) {
                case '"':  s += '"'; break;
                case '\\': s += '\\'; break;
                case '/':  s += '/'; break;
                case 'n':  s += '\n'; break;
                case 't':  s += '\t'; break;
                default:   return false;
            }
            ++p;
            continue;
        }
        s += *p++;
    }
    if (*p != '"' || !at_value_end(p + 1, in_file)) return false;
    out = s;
    return true;
}
static bool parse_value(const char* p, IntensityPolicy& out, bool in_file) {
    std::string name;
    if (!parse_value(p, name, in_file)) return false;
    return parse_intensity_policy(name, out);
}

static void write_escaped(FILE* f, const std::string& s) {
    std::fputc('"', f);
    for (char c : s) {
        switch (c) {
            case '"':  std::fputs("\\\"", f); break;
            case '\\': std::fputs("\\\\", f); break;
            case '\n': std::fputs("\\n", f); break;
            case '\t': std::fputs("\\t", f); break;
            default:   std::fputc(c, f); break;
        }
    }
    std::fputc('"', f);
}

// Keys are matched with their quotes so "rhythm_floor" never hits
// "rhythm_intensity_floor".
static const char* find_value(const char* s, const char* key) {
    const std::string quoted = std::string("\"") + key + "\"";
    const char* p = std::strstr(s, quoted.c_str());
    if (!p) return nullptr;
    p += quoted.size();
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != ':') return nullptr;
    ++p;
    while (*p == ' ' || *p == '\t') ++p;
    return p;
}

namespace {

struct JsonReader {
    const char* text;
    std::string bad_key;

    template <typename T>
    void operator()(const char* key, T& out) {
        if (!bad_key.empty()) return;
        const char* p = find_value(text, key);
        if (p && !parse_value(p, out, true)) bad_key = key;
    }
};

struct JsonWriter {
    FILE* f;
    bool first = true;

    void key(const char* name) {
        std::fprintf(f, "%s\n  \"%s\": ", first ? "{" : ",", name);
        first = false;
    }
    void operator()(const char* name, int v) { key(name); std::fprintf(f, "%d", v); }
    void operator()(const char* name, float v) { key(name); std::fprintf(f, "%.9g", v); }
    void operator()(const char* name, bool v) { key(name); std::fputs(v ? "true" : "false", f); }
    void operator()(const char* name, const std::string& v) { key(name); write_escaped(f, v); }
    void operator()(const char* name, IntensityPolicy v) { key(name); write_escaped(f, intensity_policy_name(v)); }
};

struct EnvReader {
    std::string bad_var;
    int applied = 0;

    template <typename T>
    void operator()(const char* key, T& out) {
        if (!bad_var.empty()) return;
        std::string name = "BEATLIGHT_";
        for (const char* k = key; *k; ++k) name += static_cast<char>(std::toupper(static_cast<unsigned char>(*k)));
        take(name, out);
    }

    template <typename T>
    void take(const std::string& name, T& out) {
        const char* v = std::getenv(name.c_str());
        if (!v || !*v) return;
        if (parse_value(v, out, false)) {
            ++applied;
        } else {
            bad_var = name + "=" + v;
        }
    }
};

} // namespace

bool load_settings(const char* path, EngineSettings& st, std::string& error) {
    FILE* f = std::fopen(path, "rb");
    if (!f) {
        error = std::string("cannot open ") + path;
        return false;
    }
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) {
        std::fclose(f);
        error = std::string(path) + " is empty or too large";
        return false;
    }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(&buf[0], 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) {
        error = std::string("cannot read ") + path;
        return false;
    }

    // Nothing is applied unless every present key parses
    EngineSettings parsed = st;
    JsonReader reader{buf.c_str(), std::string()};
    visit_fields(parsed, reader);
    if (!reader.bad_key.empty()) {
        error = "invalid value for \"" + reader.bad_key + "\" in " + path;
        return false;
    }
    st = parsed;
    return true;
}

bool save_settings(const char* path, const EngineSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    JsonWriter writer{f};
    visit_fields(st, writer);
    std::fputs("\n}\n", f);
    bool ok = std::ferror(f) == 0;
    if (std::fclose(f) != 0) ok = false;
    return ok;
}

bool apply_environment_overrides(EngineSettings& st, std::string& error, int* applied) {
    EngineSettings parsed = st;
    EnvReader env;
    visit_fields(parsed, env);
    // Short alias for the capture device
    if (env.bad_var.empty()) env.take("BEATLIGHT_DEVICE", parsed.device_name);
    if (!env.bad_var.empty()) {
        error = "invalid environment value " + env.bad_var;
        return false;
    }
    st = parsed;
    if (applied) *applied = env.applied;
    return true;
}

bool apply_preset(const std::string& name, EngineSettings& st) {
    if (name == "default") {
        st = EngineSettings{};
        return true;
    }
    if (name == "ai_analyzer") {
        // Raw-sample band energies, classification decides alone
        st = EngineSettings{};
        st.normalize_samples = false;
        st.silence_floor = 0.0f;
        st.volume_threshold_multiplier = 0.0f;
        st.min_volume_threshold = 0.0f;
        st.bass_gate_enabled = false;
        st.mid_gate_enabled = false;
        st.intensity_policy = IntensityPolicy::FixedTable;
        return true;
    }
    if (name == "live_song") {
        st = EngineSettings{};
        st.history_capacity = 30;
        st.warmup_samples = 10;
        st.silence_floor = 800.0f;
        st.volume_threshold_multiplier = 1.6f;
        st.min_volume_threshold = 800.0f;
        st.bass_gate_multiplier = 1.9f;
        st.bass_gate_floor = 2000.0f;
        st.mid_gate_enabled = false;
        st.intensity_scale = 4000.0f;
        st.bass_drop_intensity_floor = 0.4f;
        st.rhythm_intensity_floor = 0.4f;
        st.vocal_intensity_floor = 0.4f;
        st.build_intensity_floor = 0.4f;
        return true;
    }
    if (name == "rhythm_demo") {
        st = EngineSettings{};
        st.history_capacity = 20;
        st.volume_threshold_multiplier = 1.5f;
        st.bass_gate_multiplier = 1.8f;
        st.bass_gate_floor = 0.0f;
        st.mid_gate_enabled = false;
        st.normalize_samples = false;
        st.intensity_scale = 5000.0f;
        st.bass_drop_intensity_floor = 0.3f;
        st.rhythm_intensity_floor = 0.3f;
        st.vocal_intensity_floor = 0.3f;
        st.build_intensity_floor = 0.3f;
        return true;
    }
    return false;
}

static bool in_unit_range(float v) { return std::isfinite(v) && v >= 0.0f && v <= 1.0f; }

bool validate_settings(const EngineSettings& st, std::string& error) {
    auto fail = [&](const char* msg) { error = msg; return false; };

    if (st.sample_rate <= 0) return fail("sample_rate must be positive");
    if (st.chunk_size < 2) return fail("chunk_size must be at least 2");
    if (st.history_capacity <= 0) return fail("history_capacity must be positive");
    if (st.warmup_samples < 1) return fail("warmup_samples must be at least 1");
    if (st.warmup_samples > st.history_capacity) return fail("warmup_samples cannot exceed history_capacity");
    if (st.cooldown_ms < 0) return fail("cooldown_ms cannot be negative");

    if (!(st.silence_floor >= 0.0f)) return fail("silence_floor cannot be negative");
    if (!(st.volume_threshold_multiplier >= 0.0f)) return fail("volume_threshold_multiplier cannot be negative");
    if (!(st.min_volume_threshold >= 0.0f)) return fail("min_volume_threshold cannot be negative");
    if (!(st.min_volume_threshold <= st.max_volume_threshold))
        return fail("min_volume_threshold must not exceed max_volume_threshold");
    if (st.bass_gate_enabled && !(st.bass_gate_multiplier > 0.0f)) return fail("bass_gate_multiplier must be positive");
    if (st.bass_gate_enabled && !(st.bass_gate_floor >= 0.0f)) return fail("bass_gate_floor cannot be negative");
    if (st.mid_gate_enabled && !(st.mid_gate_multiplier > 0.0f)) return fail("mid_gate_multiplier must be positive");
    if (st.mid_gate_enabled && !(st.mid_gate_floor >= 0.0f)) return fail("mid_gate_floor cannot be negative");

    if (!(st.bass_drop_multiplier > 0.0f)) return fail("bass_drop_multiplier must be positive");
    if (!(st.rhythm_multiplier > 0.0f)) return fail("rhythm_multiplier must be positive");
    if (!(st.vocal_multiplier > 0.0f)) return fail("vocal_multiplier must be positive");
    if (!(st.vocal_dominance > 0.0f)) return fail("vocal_dominance must be positive");
    if (!(st.bass_drop_floor >= 0.0f) || !(st.rhythm_floor >= 0.0f)) return fail("classifier floors cannot be negative");
    if (st.build_window < 2) return fail("build_window must be at least 2");
    if (st.build_window > st.history_capacity) return fail("build_window cannot exceed history_capacity");

    if (!(st.intensity_scale > 0.0f) || !std::isfinite(st.intensity_scale)) return fail("intensity_scale must be positive");
    if (!in_unit_range(st.bass_drop_intensity_floor) || !in_unit_range(st.rhythm_intensity_floor) ||
        !in_unit_range(st.vocal_intensity_floor) || !in_unit_range(st.build_intensity_floor))
        return fail("intensity floors must lie in [0,1]");
    if (!in_unit_range(st.bass_drop_fixed_intensity) || !in_unit_range(st.rhythm_fixed_intensity) ||
        !in_unit_range(st.vocal_fixed_intensity) || !in_unit_range(st.build_fixed_intensity))
        return fail("fixed intensities must lie in [0,1]");

    if (st.tempo_enabled) {
        if (st.tempo_interval_chunks <= 0) return fail("tempo_interval_chunks must be positive");
        if (!(st.tempo_window_seconds >= 0.0f) || st.tempo_window_seconds > 60.0f)
            return fail("tempo_window_seconds must lie in [0,60]");
        if (!(st.tempo_min_bpm > 0.0f) || !(st.tempo_min_bpm < st.tempo_max_bpm))
            return fail("tempo bpm range must satisfy 0 < min < max");
    }
    if (st.event_queue_capacity < 2) return fail("event_queue_capacity must be at least 2");
    return true;
}

} // namespace beatlight
