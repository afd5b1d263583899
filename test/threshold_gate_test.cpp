#include "threshold_gate.hpp"
#include "check.hpp"

#include <cmath>
#include <iostream>
#include <limits>

using namespace beatlight::dsp;
using namespace beatlight::test;

static RollingHistory filled(int n, float value, int capacity = 10) {
    RollingHistory h(capacity);
    for (int i = 0; i < n; ++i) h.push(value);
    return h;
}

static ThresholdGateConfig volume_config() {
    ThresholdGateConfig c;
    c.multiplier = 1.5f;
    c.min_threshold = 500.0f;
    c.max_threshold = 10000.0f;
    c.absolute_floor = 500.0f;
    c.warmup_samples = 5;
    return c;
}

static void test_threshold_clamp() {
    ThresholdGate gate(volume_config());
    check_near(gate.threshold(filled(5, 1000.0f)), 1500.0, 1e-3, __LINE__);
    check_near(gate.threshold(filled(5, 100.0f)), 500.0, 1e-3, __LINE__);     // raised to min
    check_near(gate.threshold(filled(5, 20000.0f)), 10000.0, 1e-3, __LINE__); // capped at max
    check_near(gate.threshold(RollingHistory(10)), 500.0, 1e-3, __LINE__);    // empty mean is 0
}

static void test_warmup() {
    ThresholdGate gate(volume_config());
    CooldownClock cd;
    check(!gate.should_fire(5000.0f, filled(4, 1000.0f), cd, 0), __LINE__);
    check(gate.should_fire(5000.0f, filled(5, 1000.0f), cd, 0), __LINE__);
}

static void test_value_must_exceed_threshold_and_floor() {
    ThresholdGate gate(volume_config());
    CooldownClock cd;
    auto h = filled(10, 1000.0f);
    check(!gate.should_fire(1500.0f, h, cd, 0), __LINE__);  // equal is not above
    check(gate.should_fire(1500.5f, h, cd, 0), __LINE__);

    ThresholdGateConfig c = volume_config();
    c.min_threshold = 0.0f;
    c.absolute_floor = 800.0f;
    ThresholdGate low(c);
    auto quiet = filled(10, 100.0f);
    check(!low.should_fire(600.0f, quiet, cd, 0), __LINE__);  // above 150 but under the floor
    check(low.should_fire(900.0f, quiet, cd, 0), __LINE__);
    check(!low.should_fire(std::numeric_limits<float>::quiet_NaN(), quiet, cd, 0), __LINE__);
}

static void test_cooldown() {
    ThresholdGate gate(volume_config());
    CooldownClock cd;
    cd.cooldown_ms = 250;
    auto h = filled(10, 1000.0f);

    check(gate.should_fire(5000.0f, h, cd, 1000), __LINE__);  // unarmed clock never blocks
    cd.mark(1000);
    check(!gate.should_fire(5000.0f, h, cd, 1100), __LINE__);
    check(!gate.should_fire(5000.0f, h, cd, 1249), __LINE__);
    check(gate.should_fire(5000.0f, h, cd, 1250), __LINE__);
}

static void test_gate_does_not_mutate_clock() {
    ThresholdGate gate(volume_config());
    CooldownClock cd;
    auto h = filled(10, 1000.0f);
    check(gate.should_fire(5000.0f, h, cd, 42), __LINE__);
    check(!cd.armed, __LINE__);
    check(cd.last_event_ms == 0, __LINE__);
    // Same inputs, same answer
    check(gate.should_fire(5000.0f, h, cd, 42), __LINE__);
}

static void test_gates_share_clock() {
    ThresholdGate volume(volume_config());
    ThresholdGateConfig bc;
    bc.multiplier = 1.8f;
    bc.absolute_floor = 2000.0f;
    ThresholdGate bass(bc);

    CooldownClock shared;
    shared.cooldown_ms = 250;
    auto vh = filled(10, 1000.0f);
    auto bh = filled(10, 2000.0f);

    check(volume.should_fire(5000.0f, vh, shared, 0), __LINE__);
    shared.mark(0);
    // A different signal inside the same window is held back too
    check(!bass.should_fire(9000.0f, bh, shared, 100), __LINE__);
    check(bass.should_fire(9000.0f, bh, shared, 300), __LINE__);
}

int main() {
    std::cout << "Threshold gate tests" << std::endl;
    test_threshold_clamp();
    test_warmup();
    test_value_must_exceed_threshold_and_floor();
    test_cooldown();
    test_gate_does_not_mutate_clock();
    test_gates_share_clock();
    return beatlight::test::finish("threshold_gate_test");
}
