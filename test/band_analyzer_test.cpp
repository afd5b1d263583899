#include "band_analyzer.hpp"
#include "check.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

using namespace beatlight;
using namespace beatlight::dsp;
using namespace beatlight::test;

static std::vector<int16_t> tone(float freq_hz, float amplitude, int n, int sample_rate) {
    std::vector<int16_t> out(n);
    const double two_pi = 6.28318530717958647692;
    for (int i = 0; i < n; ++i) {
        out[i] = static_cast<int16_t>(std::lround(amplitude * 32767.0 * std::sin(two_pi * freq_hz * i / sample_rate)));
    }
    return out;
}

static void test_tone_lands_in_its_band() {
    BandAnalyzer a;
    const int sr = 44100, n = 1024;

    // Bin-centered tones keep leakage out of the neighbouring bands
    const float bin_hz = static_cast<float>(sr) / n;
    auto bass_tone = tone(3.0f * bin_hz, 0.5f, n, sr);
    BandEnergy e = a.analyze(bass_tone.data(), n, sr);
    check(e.bass > 10.0f * e.high, __LINE__);
    check(e.bass > e.mid, __LINE__);

    auto mid_tone = tone(23.0f * bin_hz, 0.5f, n, sr);
    e = a.analyze(mid_tone.data(), n, sr);
    check(e.mid > 5.0f * e.bass, __LINE__);
    check(e.mid > 5.0f * e.high, __LINE__);
    check(e.vocal > 0.5f * e.mid, __LINE__);  // ~990 Hz is inside the vocal band too

    auto high_tone = tone(116.0f * bin_hz, 0.5f, n, sr);
    e = a.analyze(high_tone.data(), n, sr);
    check(e.high > 5.0f * e.mid, __LINE__);
    check(e.high > 5.0f * e.bass, __LINE__);
}

static void test_magnitude_scale() {
    // Bin-centered tone: bin 4 of 1024 @ 44100 is 172.27 Hz, peak |X| = A*N/2
    BandAnalyzer a;
    const int sr = 44100, n = 1024;
    const float f = 4.0f * sr / n;
    auto x = tone(f, 0.5f, n, sr);
    a.analyze(x.data(), n, sr);
    const auto& mags = a.magnitudes();
    check(static_cast<int>(mags.size()) == n / 2 + 1, __LINE__);
    check_near(mags[4], 0.5 * n / 2, 2.0, __LINE__);

    a.set_normalize(false);
    a.analyze(x.data(), n, sr);
    check_near(a.magnitudes()[4] / 32768.0, 0.5 * n / 2, 2.0, __LINE__);
}

static void test_non_power_of_two_matches() {
    // 1000-sample chunk goes through the direct DFT path
    BandAnalyzer a;
    const int sr = 48000, n = 1000;
    const float f = 5.0f * sr / n;  // 240 Hz, bin 5
    auto x = tone(f, 0.25f, n, sr);
    BandEnergy e = a.analyze(x.data(), n, sr);
    check_near(a.magnitudes()[5], 0.25 * n / 2, 1.0, __LINE__);
    check(e.bass > 5.0f * e.mid, __LINE__);
}

static void test_inclusive_band_edges() {
    // 8000 Hz sample rate, 32 samples: bins every 250 Hz. Bin 1 (250 Hz) is in
    // both bass and mid; a tone there must show up in both sums.
    BandAnalyzer a;
    const int sr = 8000, n = 32;
    auto x = tone(250.0f, 0.5f, n, sr);
    BandEnergy e = a.analyze(x.data(), n, sr);
    check(e.bass > 1.0f, __LINE__);
    check(e.mid > 1.0f, __LINE__);
    check_near(e.bass, a.magnitudes()[1], 1e-3, __LINE__);  // bin 0 (DC) is below 20 Hz
}

static void test_silence_and_degenerate_input() {
    BandAnalyzer a;
    std::vector<int16_t> zeros(1024, 0);
    BandEnergy e = a.analyze(zeros.data(), 1024, 44100);
    check(e.bass == 0.0f && e.mid == 0.0f && e.high == 0.0f && e.vocal == 0.0f, __LINE__);

    int16_t one = 1000;
    e = a.analyze(&one, 1, 44100);
    check(e.bass == 0.0f && e.mid == 0.0f, __LINE__);
    e = a.analyze(nullptr, 0, 44100);
    check(e.bass == 0.0f, __LINE__);
    e = a.analyze(zeros.data(), 1024, 0);
    check(e.bass == 0.0f, __LINE__);
}

static void test_deterministic() {
    BandAnalyzer a;
    auto x = tone(180.0f, 0.3f, 1024, 44100);
    BandEnergy e1 = a.analyze(x.data(), 1024, 44100);
    BandEnergy e2 = a.analyze(x.data(), 1024, 44100);
    check(e1.bass == e2.bass && e1.mid == e2.mid && e1.high == e2.high && e1.vocal == e2.vocal, __LINE__);
    BandAnalyzer b;
    BandEnergy e3 = b.analyze(x.data(), 1024, 44100);
    check(e1.bass == e3.bass && e1.mid == e3.mid, __LINE__);
}

static void test_rms() {
    std::vector<int16_t> x(1000, 50);
    check_near(chunk_rms(x.data(), 1000), 50.0, 1e-3, __LINE__);
    auto s = tone(440.0f, 1.0f, 44100, 44100);
    check_near(chunk_rms(s.data(), 44100), 32767.0 / std::sqrt(2.0), 5.0, __LINE__);
    check(chunk_rms(nullptr, 0) == 0.0f, __LINE__);
}

int main() {
    std::cout << "Band analyzer tests" << std::endl;
    test_tone_lands_in_its_band();
    test_magnitude_scale();
    test_non_power_of_two_matches();
    test_inclusive_band_edges();
    test_silence_and_degenerate_input();
    test_deterministic();
    test_rms();
    return beatlight::test::finish("band_analyzer_test");
}
