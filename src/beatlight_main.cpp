#include "audio_input.hpp"
#include "engine_settings.hpp"
#include "engine_settings_io.hpp"
#include "event.hpp"
#include "event_queue.hpp"
#include "pipeline_controller.hpp"
#include "simulated_input.hpp"
#include "tempo_estimator.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>

using namespace beatlight;

static std::atomic<bool> g_running(true);

static void signal_handler(int) {
    g_running = false;
}

static void print_usage(const char* argv0) {
    std::cerr << "beatlight - turns live audio into light trigger events\n"
              << "Usage: " << argv0 << " [options]\n"
              << "  --device <name>       ALSA capture device (default: from config)\n"
              << "  --config <file>       Load settings from a JSON file\n"
              << "  --preset <name>       default | ai_analyzer | live_song | rhythm_demo\n"
              << "  --simulate [bpm]      Use the built-in beat generator instead of a microphone\n"
              << "  --no-tempo            Disable tempo estimation\n"
              << "  --save-config <file>  Write the effective settings and exit\n"
              << "  --help                Show this help\n"
              << "Events are written to stdout as one JSON object per line.\n"
              << "BEATLIGHT_* environment variables override file settings.\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_path;
    std::string preset;
    std::string device;
    std::string save_path;
    bool simulate = false;
    float simulate_bpm = 120.0f;
    bool no_tempo = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--device" && i + 1 < argc) {
            device = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--save-config" && i + 1 < argc) {
            save_path = argv[++i];
        } else if (arg == "--simulate") {
            simulate = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                const char* text = argv[++i];
                char* end = nullptr;
                simulate_bpm = std::strtof(text, &end);
                if (end == text || *end != '\0' || !(simulate_bpm > 0.0f)) {
                    std::cerr << "Invalid --simulate tempo: " << text << "\n";
                    return 2;
                }
            }
        } else if (arg == "--no-tempo") {
            no_tempo = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    // Precedence: preset < config file < environment < command line
    EngineSettings settings;
    std::string error;
    if (!preset.empty() && !apply_preset(preset, settings)) {
        std::cerr << "Unknown preset: " << preset << std::endl;
        return 1;
    }
    if (!config_path.empty() && !load_settings(config_path.c_str(), settings, error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return 1;
    }
    if (!apply_environment_overrides(settings, error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return 1;
    }
    if (!device.empty()) settings.device_name = device;
    if (no_tempo) settings.tempo_enabled = false;

    if (!validate_settings(settings, error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return 1;
    }
    if (!save_path.empty()) {
        if (!save_settings(save_path.c_str(), settings)) {
            std::cerr << "Cannot write config file: " << save_path << std::endl;
            return 1;
        }
        std::cerr << "Settings written to " << save_path << std::endl;
        return 0;
    }

    auto sink = std::make_shared<QueuedEventSink>(
        static_cast<size_t>(settings.event_queue_capacity),
        [](const Event& ev) {
            std::cout << format_event_json(ev) << std::endl;
            return !std::cout.fail();
        });

    dsp::OnsetTempoConfig tempo_cfg;
    tempo_cfg.min_bpm = settings.tempo_min_bpm;
    tempo_cfg.max_bpm = settings.tempo_max_bpm;
    auto estimator = std::make_shared<dsp::OnsetTempoEstimator>(tempo_cfg);

    PipelineController pipeline(settings, sink, estimator);

    CaptureConfig capture;
    capture.device_name = settings.device_name;
    capture.sample_rate = static_cast<unsigned int>(settings.sample_rate);
    capture.chunk_size = static_cast<unsigned int>(settings.chunk_size);

    std::unique_ptr<IAudioInput> input;
    if (simulate) {
        input = std::make_unique<audio::SimulatedAudioInput>(capture, simulate_bpm);
    } else {
        input = createAudioInput(capture);
        if (!input) {
            return 1;
        }
    }
    input->set_process_callback([&pipeline](const int16_t* samples, int num_samples, int sample_rate) {
        pipeline.process_chunk(samples, num_samples, sample_rate);
    });

    std::cerr << "beatlight\n"
              << "Source: " << (simulate ? "simulated" : settings.device_name) << "\n"
              << "Chunk: " << settings.chunk_size << " @ " << settings.sample_rate << " Hz, "
              << "cooldown " << settings.cooldown_ms << " ms, "
              << "intensity " << intensity_policy_name(settings.intensity_policy) << ", "
              << "tempo " << (settings.tempo_enabled ? "on" : "off") << "\n"
              << "Press Ctrl+C to exit\n" << std::endl;

    if (!sink->start() || !pipeline.start()) {
        return 1;
    }
    if (!input->start()) {
        std::cerr << "Audio input failed to start" << std::endl;
        pipeline.stop();
        sink->stop();
        return 1;
    }

    while (g_running.load() && input->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "\nShutting down..." << std::endl;
    input->stop();
    pipeline.stop();
    sink->stop();

    const auto& st = pipeline.stats();
    const auto lat = input->get_latency_stats();
    std::cerr << "Chunks: " << st.chunks << " (silent " << st.silent_chunks << ")\n"
              << "Gate fires: " << st.gate_fires << ", vetoed: " << st.vetoed << "\n"
              << "Events: " << st.events
              << " [bass_drop " << st.per_kind[static_cast<int>(EventKind::BassDrop)]
              << ", rhythm " << st.per_kind[static_cast<int>(EventKind::Rhythm)]
              << ", vocal " << st.per_kind[static_cast<int>(EventKind::Vocal)]
              << ", build " << st.per_kind[static_cast<int>(EventKind::Build)] << "]\n"
              << "Queue: delivered " << sink->delivered() << ", dropped " << sink->dropped()
              << ", failed " << sink->failed() << "\n"
              << std::fixed << std::setprecision(2)
              << "Callback latency: avg " << lat.avg_ms << " ms, max " << lat.max_ms << " ms, xruns "
              << lat.xruns << "\n"
              << "Last tempo: " << pipeline.current_tempo() << " BPM" << std::endl;
    return 0;
}
