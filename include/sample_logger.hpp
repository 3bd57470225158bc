#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

#include "adc_converter.hpp"
#include "platform.hpp"
#include "run.hpp"

// Samples an analog input on every timer tick and appends the readings to a
// Run. State moves Idle -> Acquiring -> Stopped; Stopped is terminal, so a new
// acquisition needs a new SampleLogger.
//
// start() and stop() may run on a different context than onTick(). Both sides
// serialize on one mutex around the state change and the Run append/freeze.
class SampleLogger {
public:
    enum class State { IDLE, ACQUIRING, STOPPED };
    // Invoked after the lock is released; must not block.
    using DropListener = std::function<void(uint32_t elapsed_ms)>;

    static const size_t DEFAULT_CAPACITY = 200;

    SampleLogger(Clock& clock, AnalogInput& input, PeriodicTimer& timer,
                 const AdcConverter& converter, size_t capacity = DEFAULT_CAPACITY);
    ~SampleLogger();

    // Samples every period_ms until stop() or the Run fills up.
    RunHandle start(int32_t period_ms);
    // Samples every period_ms for duration_ms. The first tick lands one period
    // after start, so an ideal clock yields period, 2*period, ... duration.
    // Throws AcquisitionException (ERR_INVALID_CONFIGURATION,
    // ERR_ALREADY_RUNNING or ERR_ALREADY_STOPPED) without changing state.
    RunHandle start(int32_t period_ms, int32_t duration_ms);

    void onTick();

    // Disarms the timer and freezes the Run. Repeated calls return the same
    // Run. Returns nullptr if start() was never called.
    RunHandle stop();

    State state() const;
    size_t droppedSamples() const;
    size_t sampleCount() const;
    void setDropListener(DropListener listener);
    void getStatistics(char* outBuf, size_t outBufSize) const;

private:
    Clock& clock_;
    AnalogInput& input_;
    PeriodicTimer& timer_;
    AdcConverter converter_;
    size_t capacity_;

    mutable std::mutex mutex_;
    State state_ = State::IDLE;
    std::shared_ptr<Run> run_;
    uint32_t start_ms_ = 0;
    uint32_t period_ms_ = 0;
    uint32_t duration_ms_ = 0;   // 0 = unbounded
    uint32_t last_tick_ms_ = 0;
    bool has_last_tick_ = false;
    size_t dropped_ = 0;
    DropListener drop_listener_;

    RunHandle begin(uint32_t period_ms, uint32_t duration_ms);
    void finish(StopReason reason);   // mutex_ must be held
};

const char* samplerStateToString(SampleLogger::State state);
