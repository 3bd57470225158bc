#pragma once
#include <cstdint>

#include "adc_converter.hpp"
#include "platform.hpp"

// Host-side stand-ins for the board: a clock that only moves when told to and a
// first-order RC network whose input is the step pin and whose output feeds
// the ADC.

class SimulatedClock : public Clock {
public:
    explicit SimulatedClock(uint32_t start_ms = 0) : now_ms_(start_ms) {}
    uint32_t nowMs() override { return now_ms_; }
    void advance(uint32_t ms) { now_ms_ += ms; }
    void set(uint32_t ms) { now_ms_ = ms; }
private:
    uint32_t now_ms_;
};

// v(t) = target + (v0 - target) * exp(-(t - t0) / tau), re-anchored on every
// input edge.
class RcCircuit : public AnalogInput, public DigitalOutput {
public:
    RcCircuit(Clock& clock, const AdcConverter& converter, float tau_ms = 330.0f, float high_volts = 3.04f);

    void write(bool high) override;
    bool read(uint16_t& outRaw) override;

    float voltageNow();
    // Every n-th read fails (0 disables).
    void setFailEvery(uint32_t n) { fail_every_ = n; }
    uint32_t reads() const { return reads_; }

private:
    Clock& clock_;
    AdcConverter converter_;
    float tau_ms_;
    float high_volts_;
    float start_volts_;
    float target_volts_;
    uint32_t edge_ms_;
    uint32_t fail_every_;
    uint32_t reads_;
};
