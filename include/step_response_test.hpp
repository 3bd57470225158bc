#pragma once
#include <functional>

#include "adc_converter.hpp"
#include "platform.hpp"
#include "run.hpp"

// Runs one step-response measurement: starts sampling, drives the step output
// high, services the timer until the run ends, then drives the output low.
class StepResponseTest {
public:
    // Called repeatedly while sampling; on the board this is timer.update().
    using ServiceHook = std::function<void()>;

    StepResponseTest(Clock& clock, AnalogInput& input, PeriodicTimer& timer,
                     DigitalOutput& stepOutput, const AdcConverter& converter,
                     size_t capacity);

    // Returns the frozen Run. Throws AcquisitionException for an invalid
    // period or duration; the step output is left low in that case.
    RunHandle run(int32_t period_ms, int32_t duration_ms, const ServiceHook& service);

    // True if the last run was cut short because no ticks arrived in time.
    bool timedOut() const { return timed_out_; }

private:
    Clock& clock_;
    AnalogInput& input_;
    PeriodicTimer& timer_;
    DigitalOutput& step_output_;
    AdcConverter converter_;
    size_t capacity_;
    bool timed_out_;
};
