#include "engine_settings.hpp"
#include "engine_settings_io.hpp"
#include "event.hpp"
#include "check.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace beatlight;
using namespace beatlight::test;

static std::string temp_path(const char* name) {
    return std::string("/tmp/beatlight_") + name + "_" + std::to_string(getpid()) + ".json";
}

static void test_defaults_are_valid() {
    EngineSettings st;
    std::string error;
    check(validate_settings(st, error), __LINE__);
    check(st.cooldown_ms == 250, __LINE__);
    check(st.history_capacity == 10, __LINE__);
    check(st.warmup_samples == 5, __LINE__);
    check(st.bass_drop_multiplier == 2.0f, __LINE__);
    check(st.rhythm_multiplier == 1.5f, __LINE__);
    check(st.vocal_multiplier == 1.3f, __LINE__);
}

static void test_save_load_round_trip() {
    EngineSettings st;
    st.sample_rate = 48000;
    st.chunk_size = 2048;
    st.device_name = "hw:1,0";
    st.cooldown_ms = 300;
    st.normalize_samples = false;
    st.bass_gate_enabled = false;
    st.rhythm_floor = 2500.0f;
    st.rhythm_intensity_floor = 0.25f;
    st.intensity_policy = IntensityPolicy::FixedTable;
    st.tempo_window_seconds = 6.5f;

    const std::string path = temp_path("roundtrip");
    check(save_settings(path.c_str(), st), __LINE__);
    EngineSettings loaded;
    std::string error;
    check(load_settings(path.c_str(), loaded, error), __LINE__);
    std::remove(path.c_str());

    check(loaded.sample_rate == 48000, __LINE__);
    check(loaded.chunk_size == 2048, __LINE__);
    check(loaded.device_name == "hw:1,0", __LINE__);
    check(loaded.cooldown_ms == 300, __LINE__);
    check(!loaded.normalize_samples, __LINE__);
    check(!loaded.bass_gate_enabled, __LINE__);
    check(loaded.mid_gate_enabled, __LINE__);
    // Distinct keys sharing a prefix
    check_near(loaded.rhythm_floor, 2500.0, 1e-3, __LINE__);
    check_near(loaded.rhythm_intensity_floor, 0.25, 1e-4, __LINE__);
    check(loaded.intensity_policy == IntensityPolicy::FixedTable, __LINE__);
    check_near(loaded.tempo_window_seconds, 6.5, 1e-4, __LINE__);
}

static void test_missing_file() {
    EngineSettings st;
    std::string error;
    check(!load_settings("/nonexistent/beatlight.json", st, error), __LINE__);
    check(error.find("/nonexistent/beatlight.json") != std::string::npos, __LINE__);
    check(st.sample_rate == 44100, __LINE__);
}

static std::string write_temp(const char* name, const char* text) {
    const std::string path = temp_path(name);
    FILE* f = std::fopen(path.c_str(), "wb");
    if (f) {
        std::fputs(text, f);
        std::fclose(f);
    }
    return path;
}

static void expect_rejected_file(const char* name, const char* text, const char* key) {
    const std::string path = write_temp(name, text);
    EngineSettings st;
    std::string error;
    check(!load_settings(path.c_str(), st, error), __LINE__);
    std::remove(path.c_str());
    check(error.find(key) != std::string::npos, __LINE__);
    // Valid keys in the same file are not applied either
    check(st.cooldown_ms == 250, __LINE__);
}

static void test_malformed_file_values() {
    expect_rejected_file("exp", "{\n  \"cooldown_ms\": 100,\n  \"chunk_size\": 1e3\n}\n", "chunk_size");
    expect_rejected_file("suffix", "{\n  \"cooldown_ms\": 100,\n  \"history_capacity\": 50OO\n}\n", "history_capacity");
    expect_rejected_file("float", "{\n  \"cooldown_ms\": 100,\n  \"silence_floor\": fast\n}\n", "silence_floor");
    expect_rejected_file("bool", "{\n  \"cooldown_ms\": 100,\n  \"tempo_async\": yes\n}\n", "tempo_async");
    expect_rejected_file("string", "{\n  \"cooldown_ms\": 100,\n  \"device_name\": \"hw:0\n}\n", "device_name");
    expect_rejected_file("policy", "{\n  \"cooldown_ms\": 100,\n  \"intensity_policy\": \"loud\"\n}\n", "intensity_policy");

    // Values followed by a separator on the same line still parse
    const std::string path = write_temp("inline", "{\"cooldown_ms\": 120, \"rhythm_floor\": 2.5e3}");
    EngineSettings st;
    std::string error;
    check(load_settings(path.c_str(), st, error), __LINE__);
    std::remove(path.c_str());
    check(st.cooldown_ms == 120, __LINE__);
    check_near(st.rhythm_floor, 2500.0, 1e-3, __LINE__);
}

static void test_device_name_escaping() {
    EngineSettings st;
    st.device_name = "plug:\"my card\"\\0";
    const std::string path = temp_path("escape");
    check(save_settings(path.c_str(), st), __LINE__);
    EngineSettings loaded;
    std::string error;
    check(load_settings(path.c_str(), loaded, error), __LINE__);
    std::remove(path.c_str());
    check(loaded.device_name == st.device_name, __LINE__);
    // Fields after the string are still read
    check(loaded.history_capacity == st.history_capacity, __LINE__);
}

static void test_partial_file_keeps_defaults() {
    const std::string path = temp_path("partial");
    FILE* f = std::fopen(path.c_str(), "wb");
    check(f != nullptr, __LINE__);
    if (!f) return;
    std::fputs("{\n  \"cooldown_ms\": 400\n}\n", f);
    std::fclose(f);
    EngineSettings st;
    std::string error;
    check(load_settings(path.c_str(), st, error), __LINE__);
    std::remove(path.c_str());
    check(st.cooldown_ms == 400, __LINE__);
    check(st.chunk_size == 1024, __LINE__);
}

static void test_environment_overrides() {
    setenv("BEATLIGHT_COOLDOWN_MS", "125", 1);
    setenv("BEATLIGHT_INTENSITY_POLICY", "fixed", 1);
    setenv("BEATLIGHT_DEVICE", "plughw:2", 1);
    setenv("BEATLIGHT_TEMPO_ASYNC", "off", 1);
    setenv("BEATLIGHT_TEMPO_WINDOW_SECONDS", "2.5", 1);
    setenv("BEATLIGHT_TEMPO_MAX_BPM", "180", 1);
    setenv("BEATLIGHT_BASS_GATE_ENABLED", "false", 1);
    setenv("BEATLIGHT_BUILD_WINDOW", "4", 1);
    setenv("BEATLIGHT_RHYTHM_INTENSITY_FLOOR", "0.4", 1);
    setenv("BEATLIGHT_VOCAL_FIXED_INTENSITY", "0.6", 1);
    setenv("BEATLIGHT_EVENT_QUEUE_CAPACITY", "128", 1);
    EngineSettings st;
    std::string error;
    int n = 0;
    const bool ok = apply_environment_overrides(st, error, &n);
    const char* names[] = {
        "BEATLIGHT_COOLDOWN_MS", "BEATLIGHT_INTENSITY_POLICY", "BEATLIGHT_DEVICE",
        "BEATLIGHT_TEMPO_ASYNC", "BEATLIGHT_TEMPO_WINDOW_SECONDS", "BEATLIGHT_TEMPO_MAX_BPM",
        "BEATLIGHT_BASS_GATE_ENABLED", "BEATLIGHT_BUILD_WINDOW", "BEATLIGHT_RHYTHM_INTENSITY_FLOOR",
        "BEATLIGHT_VOCAL_FIXED_INTENSITY", "BEATLIGHT_EVENT_QUEUE_CAPACITY",
    };
    for (const char* name : names) unsetenv(name);

    check(ok, __LINE__);
    check(n == 11, __LINE__);
    check(st.cooldown_ms == 125, __LINE__);
    check(st.intensity_policy == IntensityPolicy::FixedTable, __LINE__);
    check(st.device_name == "plughw:2", __LINE__);
    check(!st.tempo_async, __LINE__);
    check_near(st.tempo_window_seconds, 2.5, 1e-6, __LINE__);
    check_near(st.tempo_max_bpm, 180.0, 1e-6, __LINE__);
    check(!st.bass_gate_enabled, __LINE__);
    check(st.build_window == 4, __LINE__);
    check_near(st.rhythm_intensity_floor, 0.4, 1e-6, __LINE__);
    check_near(st.vocal_fixed_intensity, 0.6, 1e-6, __LINE__);
    check(st.event_queue_capacity == 128, __LINE__);
    check(st.chunk_size == 1024, __LINE__);
}

static void expect_rejected_env(const char* name, const char* value) {
    setenv("BEATLIGHT_COOLDOWN_MS", "125", 1);
    setenv(name, value, 1);
    EngineSettings st;
    std::string error;
    const bool ok = apply_environment_overrides(st, error);
    unsetenv(name);
    unsetenv("BEATLIGHT_COOLDOWN_MS");
    check(!ok, __LINE__);
    check(error.find(name) != std::string::npos, __LINE__);
    check(st.cooldown_ms == 250, __LINE__);
}

static void test_malformed_environment() {
    expect_rejected_env("BEATLIGHT_SILENCE_FLOOR", "fast");
    expect_rejected_env("BEATLIGHT_CHUNK_SIZE", "50OO");
    expect_rejected_env("BEATLIGHT_HISTORY_CAPACITY", "1e3");
    expect_rejected_env("BEATLIGHT_TEMPO_ENABLED", "maybe");
    expect_rejected_env("BEATLIGHT_INTENSITY_POLICY", "loud");
    expect_rejected_env("BEATLIGHT_SAMPLE_RATE", "99999999999");
}

static void expect_invalid(const EngineSettings& st, const char* field) {
    std::string error;
    check(!validate_settings(st, error), __LINE__);
    check(error.find(field) != std::string::npos, __LINE__);
}

static void test_validation() {
    EngineSettings st;
    st.cooldown_ms = -5;
    expect_invalid(st, "cooldown_ms");

    st = EngineSettings{};
    st.history_capacity = 0;
    expect_invalid(st, "history_capacity");

    st = EngineSettings{};
    st.warmup_samples = 11;
    expect_invalid(st, "warmup_samples");

    st = EngineSettings{};
    st.min_volume_threshold = 20000.0f;
    expect_invalid(st, "min_volume_threshold");

    st = EngineSettings{};
    st.chunk_size = 1;
    expect_invalid(st, "chunk_size");

    st = EngineSettings{};
    st.rhythm_intensity_floor = 1.5f;
    expect_invalid(st, "intensity floors");

    st = EngineSettings{};
    st.tempo_min_bpm = 250.0f;
    expect_invalid(st, "bpm");

    // Tempo fields are ignored while tempo is off
    st.tempo_enabled = false;
    std::string error;
    check(validate_settings(st, error), __LINE__);
}

static void test_presets() {
    std::string error;
    const char* names[] = {"default", "ai_analyzer", "live_song", "rhythm_demo"};
    for (const char* name : names) {
        EngineSettings st;
        check(apply_preset(name, st), __LINE__);
        check(validate_settings(st, error), __LINE__);
    }
    EngineSettings st;
    check(apply_preset("ai_analyzer", st), __LINE__);
    check(!st.normalize_samples, __LINE__);
    check(st.intensity_policy == IntensityPolicy::FixedTable, __LINE__);
    check(apply_preset("live_song", st), __LINE__);
    check(st.history_capacity == 30, __LINE__);
    check(st.normalize_samples, __LINE__);
    check(!apply_preset("nope", st), __LINE__);
}

static void test_policy_names() {
    IntensityPolicy p = IntensityPolicy::Continuous;
    check(parse_intensity_policy("fixed", p) && p == IntensityPolicy::FixedTable, __LINE__);
    check(parse_intensity_policy("continuous", p) && p == IntensityPolicy::Continuous, __LINE__);
    check(!parse_intensity_policy("loud", p), __LINE__);
    check(std::string(intensity_policy_name(IntensityPolicy::FixedTable)) == "fixed", __LINE__);
}

static void test_event_json() {
    Event e;
    e.kind = EventKind::BassDrop;
    e.intensity = 0.75f;
    e.tempo_bpm = 127.6f;
    e.bass_energy = 6000.4f;
    e.mid_energy = 512.0f;
    e.high_energy = 64.0f;
    e.timestamp_ms = 12345;
    const std::string json = format_event_json(e);
    check(json.find("\"event_type\":\"bass_drop\"") != std::string::npos, __LINE__);
    check(json.find("\"intensity\":0.750") != std::string::npos, __LINE__);
    check(json.find("\"bpm\":127") != std::string::npos, __LINE__);
    check(json.find("\"bass_energy\":6000") != std::string::npos, __LINE__);
    check(json.find("\"timestamp\":12.345") != std::string::npos, __LINE__);
    check(json.find('\n') == std::string::npos, __LINE__);

    check(std::string(event_kind_name(EventKind::Build)) == "build", __LINE__);
    check(std::string(event_kind_name(EventKind::Vocal)) == "vocal", __LINE__);
    check(std::string(event_kind_name(EventKind::Rhythm)) == "rhythm", __LINE__);
}

int main() {
    std::cout << "Settings tests" << std::endl;
    test_defaults_are_valid();
    test_save_load_round_trip();
    test_missing_file();
    test_partial_file_keeps_defaults();
    test_malformed_file_values();
    test_device_name_escaping();
    test_environment_overrides();
    test_malformed_environment();
    test_validation();
    test_presets();
    test_policy_names();
    test_event_json();
    return beatlight::test::finish("settings_test");
}
