#pragma once

// Free-running square wave on the step output, for watching the circuit's
// charge and discharge on a scope. Each timer tick flips the output level.

#include <stdint.h>
#include "platform.hpp"

class SquareWaveGenerator {
public:
    static const uint32_t DEFAULT_HALF_PERIOD_MS = 5000;

    SquareWaveGenerator(PeriodicTimer& timer, DigitalOutput& output);

    // Drives the output high and arms the timer. Returns false for a zero
    // half period.
    bool start(uint32_t half_period_ms);
    // Disarms the timer and leaves the output low.
    void stop();

    bool running() const { return running_; }
    bool level() const { return level_; }
    uint32_t halfPeriodMs() const { return half_period_ms_; }
    uint32_t toggles() const { return toggles_; }

private:
    void onTick();

    PeriodicTimer& timer_;
    DigitalOutput& output_;
    uint32_t half_period_ms_;
    bool running_;
    bool level_;
    uint32_t toggles_;
};
