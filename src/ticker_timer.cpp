#include "../include/ticker_timer.hpp"
#include "../include/logger.hpp"

TickerTimer::TickerTimer(Clock& clock)
    : clock_(clock), interval_(0), next_ms_(0), running_(false), overruns_(0) {}

void TickerTimer::arm(uint32_t period_ms, Callback cb) {
    cb_ = cb;
    interval_ = period_ms;
    next_ms_ = clock_.nowMs() + interval_;
    overruns_ = 0;
    running_ = interval_ > 0 && cb_ != nullptr;
}

void TickerTimer::disarm() {
    // cb_ is kept: disarm() may run from inside the callback itself
    running_ = false;
}

void TickerTimer::update() {
    if (!running_) return;
    uint32_t now = clock_.nowMs();
    // Signed difference keeps this correct across millis() rollover
    if ((int32_t)(now - next_ms_) < 0) return;
    next_ms_ += interval_;
    if ((int32_t)(now - next_ms_) >= 0) {
        uint32_t missed = (now - next_ms_) / interval_ + 1;
        overruns_ += missed;
        next_ms_ += missed * interval_;
        Logger::debug("[Ticker] %lu deadline(s) missed, next at %lu ms",
                      (unsigned long)missed, (unsigned long)next_ms_);
    }
    Callback cb = cb_;
    cb();
}
