#pragma once
#include <cstdint>
#include <functional>

// Hardware capabilities handed to the acquisition code. Arduino-backed versions
// live in arduino_platform.hpp, simulated ones in simulated_rc_circuit.hpp.

// Monotonic millisecond counter. Wraps like millis(); callers use unsigned
// subtraction.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint32_t nowMs() = 0;
};

class AnalogInput {
public:
    virtual ~AnalogInput() = default;

    // Reads one raw ADC count into outRaw.
    // Returns false when the conversion failed or did not finish in time.
    virtual bool read(uint16_t& outRaw) = 0;
};

class DigitalOutput {
public:
    virtual ~DigitalOutput() = default;
    virtual void write(bool high) = 0;
};

class PeriodicTimer {
public:
    using Callback = std::function<void()>;

    virtual ~PeriodicTimer() = default;

    // Calls cb once every period_ms until disarm(). Re-arming replaces the
    // previous callback and restarts the period.
    virtual void arm(uint32_t period_ms, Callback cb) = 0;
    // Safe to call from inside the callback.
    virtual void disarm() = 0;
    virtual bool armed() const = 0;
};
