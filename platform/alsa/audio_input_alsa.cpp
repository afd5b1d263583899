#include "audio_input.hpp"

#include <alsa/asoundlib.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <pthread.h>
#include <iostream>
#include <sched.h>
#include <sys/mman.h>
#include <thread>
#include <vector>

namespace beatlight {

class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const CaptureConfig& cfg)
        : config(cfg), pcm_handle(nullptr), running(false),
          min_latency_ms(1000.0f), max_latency_ms(0.0f), total_latency_ms(0.0f),
          latency_count(0), xrun_count(0), sample_format(SND_PCM_FORMAT_S16_LE), channels(1) {}

    ~AlsaAudioInput() override { stop(); }

    bool start() override {
        if (running.load()) {
            return true;
        }
        // Thread may have exited on its own after a read error
        if (audio_thread.joinable()) {
            audio_thread.join();
        }
        cleanup_alsa();
        if (!setup_alsa()) {
            return false;
        }
        running = true;
        audio_thread = std::thread(&AlsaAudioInput::audio_thread_func, this);
        if (config.use_realtime_priority) {
            set_realtime_priority();
        }
        return true;
    }

    void stop() override {
        running = false;
        if (audio_thread.joinable()) {
            audio_thread.join();
        }
        cleanup_alsa();
    }

    bool is_running() const override { return running.load(); }

    void set_process_callback(ProcessCallback callback) override { process_callback = callback; }

    const CaptureConfig& get_config() const override { return config; }

    LatencyStats get_latency_stats() const override {
        LatencyStats stats{};
        stats.min_ms = min_latency_ms.load();
        stats.max_ms = max_latency_ms.load();
        int count = latency_count.load();
        stats.avg_ms = count > 0 ? total_latency_ms.load() / count : 0.0f;
        stats.xruns = xrun_count.load();
        return stats;
    }

private:
    CaptureConfig config;
    snd_pcm_t* pcm_handle;
    std::atomic<bool> running;
    std::thread audio_thread;
    ProcessCallback process_callback;

    // Callback latency tracking
    mutable std::atomic<float> min_latency_ms;
    mutable std::atomic<float> max_latency_ms;
    mutable std::atomic<float> total_latency_ms;
    mutable std::atomic<int> latency_count;
    mutable std::atomic<int> xrun_count;

    snd_pcm_format_t sample_format;
    unsigned int channels;

    bool open_device() {
        std::vector<std::string> candidates;
        if (!config.device_name.empty()) candidates.push_back(config.device_name);
        candidates.push_back("default");

        // Capture-capable hints as fallbacks
        void** hints = nullptr;
        if (snd_device_name_hint(-1, "pcm", &hints) == 0 && hints) {
            std::vector<std::string> plughw;
            std::vector<std::string> hw;
            for (void** n = hints; *n != nullptr; ++n) {
                char* name = snd_device_name_get_hint(*n, "NAME");
                char* ioid = snd_device_name_get_hint(*n, "IOID");
                if (name && (!ioid || std::strcmp(ioid, "Input") == 0)) {
                    std::string s(name);
                    if (s.rfind("plughw:", 0) == 0) plughw.push_back(s);
                    else if (s.rfind("hw:", 0) == 0) hw.push_back(s);
                }
                free(name);
                free(ioid);
            }
            for (auto& s : plughw) candidates.push_back(s);
            for (auto& s : hw) candidates.push_back(s);
            snd_device_name_free_hint(hints);
        }

        std::string opened_device;
        for (const auto& dev : candidates) {
            if (snd_pcm_open(&pcm_handle, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0) == 0) {
                opened_device = dev;
                break;
            }
        }
        if (opened_device.empty()) {
            std::cerr << "Cannot open any audio capture device. Last tried: "
                      << (candidates.empty() ? std::string("<none>") : candidates.back())
                      << std::endl;
            return false;
        }
        if (opened_device != config.device_name) {
            std::cerr << "Using capture device: " << opened_device << std::endl;
            config.device_name = opened_device;
        }
        return true;
    }

    bool setup_alsa() {
        if (!open_device()) return false;

        int err;
        snd_pcm_hw_params_t* hw_params;
        snd_pcm_hw_params_alloca(&hw_params);

        err = snd_pcm_hw_params_any(pcm_handle, hw_params);
        if (err < 0) {
            std::cerr << "Cannot initialize hardware parameters: " << snd_strerror(err) << std::endl;
            cleanup_alsa();
            return false;
        }

        err = snd_pcm_hw_params_set_access(pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
        if (err < 0) {
            std::cerr << "Cannot set access type: " << snd_strerror(err) << std::endl;
            cleanup_alsa();
            return false;
        }

        // The engine works on int16; float capture is converted
        sample_format = SND_PCM_FORMAT_S16_LE;
        err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format);
        if (err < 0) {
            sample_format = SND_PCM_FORMAT_FLOAT_LE;
            err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format);
            if (err < 0) {
                std::cerr << "Cannot set format: " << snd_strerror(err) << std::endl;
                cleanup_alsa();
                return false;
            }
        }

        // Mono if the device allows it, otherwise stereo downmixed per chunk
        channels = 1;
        err = snd_pcm_hw_params_set_channels(pcm_handle, hw_params, channels);
        if (err < 0) {
            channels = 2;
            err = snd_pcm_hw_params_set_channels(pcm_handle, hw_params, channels);
            if (err < 0) {
                std::cerr << "Cannot set channels: " << snd_strerror(err) << std::endl;
                cleanup_alsa();
                return false;
            }
            std::cerr << "Device is stereo only, downmixing to mono" << std::endl;
        }

        unsigned int rate = config.sample_rate;
        err = snd_pcm_hw_params_set_rate_near(pcm_handle, hw_params, &rate, 0);
        if (err < 0) {
            std::cerr << "Cannot set sample rate: " << snd_strerror(err) << std::endl;
            cleanup_alsa();
            return false;
        }
        if (rate != config.sample_rate) {
            std::cerr << "Sample rate adjusted to " << rate << " Hz" << std::endl;
        }

        snd_pcm_uframes_t period_size = config.chunk_size;
        err = snd_pcm_hw_params_set_period_size_near(pcm_handle, hw_params, &period_size, 0);
        if (err < 0) {
            std::cerr << "Cannot set period size: " << snd_strerror(err) << std::endl;
            cleanup_alsa();
            return false;
        }

        unsigned int periods = config.num_periods;
        err = snd_pcm_hw_params_set_periods_near(pcm_handle, hw_params, &periods, 0);
        if (err < 0) {
            std::cerr << "Cannot set periods: " << snd_strerror(err) << std::endl;
            cleanup_alsa();
            return false;
        }

        err = snd_pcm_hw_params(pcm_handle, hw_params);
        if (err < 0) {
            std::cerr << "Cannot set hardware parameters: " << snd_strerror(err) << std::endl;
            cleanup_alsa();
            return false;
        }

        err = snd_pcm_prepare(pcm_handle);
        if (err < 0) {
            std::cerr << "Cannot prepare audio interface: " << snd_strerror(err) << std::endl;
            cleanup_alsa();
            return false;
        }

        snd_pcm_hw_params_get_rate(hw_params, &rate, 0);
        config.sample_rate = rate;

        std::cerr << "ALSA configured: " << rate << " Hz, "
                  << config.chunk_size << " frames/chunk ("
                  << (1000.0f * config.chunk_size / rate) << " ms), "
                  << channels << (channels == 1 ? " channel" : " channels") << std::endl;
        return true;
    }

    void cleanup_alsa() {
        if (pcm_handle) {
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
        }
    }

    static int16_t to_s16(float v) {
        float s = std::round(v * 32768.0f);
        s = std::max(-32768.0f, std::min(32767.0f, s));
        return static_cast<int16_t>(s);
    }

    void audio_thread_func() {
        if (config.use_realtime_priority) {
            mlockall(MCL_CURRENT | MCL_FUTURE);
        }

        // Reads fill a chunk_size buffer exactly so the engine always sees
        // fixed-size chunks regardless of the period the device settled on
        const int chunk = static_cast<int>(config.chunk_size);
        std::vector<int16_t> raw_s16(static_cast<size_t>(chunk) * channels);
        std::vector<float> raw_f(sample_format == SND_PCM_FORMAT_FLOAT_LE ? static_cast<size_t>(chunk) * channels : 0);
        std::vector<int16_t> mono(chunk);
        int filled = 0;

        while (running.load()) {
            const int wanted = chunk - filled;
            int frames_read;
            if (sample_format == SND_PCM_FORMAT_FLOAT_LE) {
                frames_read = snd_pcm_readi(pcm_handle, raw_f.data(), wanted);
            } else {
                frames_read = snd_pcm_readi(pcm_handle, raw_s16.data(), wanted);
            }

            if (frames_read < 0) {
                if (frames_read == -EPIPE) {
                    xrun_count++;
                    snd_pcm_prepare(pcm_handle);
                } else if (frames_read == -EAGAIN) {
                    continue;
                } else {
                    std::cerr << "Read error: " << snd_strerror(frames_read) << std::endl;
                    running = false;
                    break;
                }
                continue;
            }
            if (frames_read == 0) continue;

            if (sample_format == SND_PCM_FORMAT_FLOAT_LE) {
                for (int i = 0; i < frames_read * static_cast<int>(channels); ++i) raw_s16[i] = to_s16(raw_f[i]);
            }
            if (channels == 2) downmix_stereo(raw_s16.data(), frames_read);
            std::copy(raw_s16.begin(), raw_s16.begin() + frames_read, mono.begin() + filled);
            filled += frames_read;
            if (filled < chunk) continue;
            filled = 0;

            auto start_time = std::chrono::steady_clock::now();
            if (process_callback) {
                process_callback(mono.data(), chunk, static_cast<int>(config.sample_rate));
            }
            auto end_time = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
            float latency_ms = duration.count() / 1000.0f;

            float current_min = min_latency_ms.load();
            while (latency_ms < current_min && !min_latency_ms.compare_exchange_weak(current_min, latency_ms));

            float current_max = max_latency_ms.load();
            while (latency_ms > current_max && !max_latency_ms.compare_exchange_weak(current_max, latency_ms));

            total_latency_ms.store(total_latency_ms.load() + latency_ms);
            latency_count.store(latency_count.load() + 1);
        }

        if (config.use_realtime_priority) {
            munlockall();
        }
    }

    void set_realtime_priority() {
        struct sched_param param;
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(audio_thread.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "Warning: Could not set realtime priority. Run with sudo or configure limits.conf" << std::endl;
        }
    }
};

std::unique_ptr<IAudioInput> createAudioInput(const CaptureConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace beatlight
