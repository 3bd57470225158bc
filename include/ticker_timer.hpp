#pragma once

// Cooperative periodic timer: update() is polled from loop() and fires the
// callback once the next deadline is reached. Deadlines advance by exactly one
// period, so ticks do not drift with loop latency.

#include <stdint.h>
#include "platform.hpp"

class TickerTimer : public PeriodicTimer {
public:
    explicit TickerTimer(Clock& clock);

    void arm(uint32_t period_ms, Callback cb) override;
    void disarm() override;
    bool armed() const override { return running_; }

    void update();

    uint32_t interval() const { return interval_; }
    uint32_t nextDeadline() const { return next_ms_; }
    // Deadlines skipped because update() was called more than a period late.
    uint32_t overruns() const { return overruns_; }

private:
    Clock& clock_;
    Callback cb_;
    uint32_t interval_;
    uint32_t next_ms_;
    bool running_;
    uint32_t overruns_;
};
