#include "../include/sample_logger.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <cstdio>

const size_t SampleLogger::DEFAULT_CAPACITY;

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ERR_NONE: return "OK";
        case ERR_INVALID_CONFIGURATION: return "InvalidConfiguration";
        case ERR_ALREADY_RUNNING: return "AlreadyRunning";
        case ERR_ALREADY_STOPPED: return "AlreadyStopped";
        case ERR_SAMPLE_DROPPED: return "SampleDropped";
        case ERR_UNKNOWN: break;
    }
    return "Unknown";
}

const char* samplerStateToString(SampleLogger::State state) {
    switch (state) {
        case SampleLogger::State::IDLE: return "idle";
        case SampleLogger::State::ACQUIRING: return "acquiring";
        case SampleLogger::State::STOPPED: return "stopped";
    }
    return "unknown";
}

SampleLogger::SampleLogger(Clock& clock, AnalogInput& input, PeriodicTimer& timer,
                           const AdcConverter& converter, size_t capacity)
    : clock_(clock), input_(input), timer_(timer), converter_(converter), capacity_(capacity) {}

SampleLogger::~SampleLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::ACQUIRING) finish(StopReason::STOPPED_BY_CALLER);
}

RunHandle SampleLogger::start(int32_t period_ms) {
    if (period_ms <= 0) {
        throw AcquisitionException("period must be positive, got " + std::to_string(period_ms) + " ms",
                                   ERR_INVALID_CONFIGURATION);
    }
    return begin((uint32_t)period_ms, 0);
}

RunHandle SampleLogger::start(int32_t period_ms, int32_t duration_ms) {
    if (period_ms <= 0) {
        throw AcquisitionException("period must be positive, got " + std::to_string(period_ms) + " ms",
                                   ERR_INVALID_CONFIGURATION);
    }
    if (duration_ms <= 0) {
        throw AcquisitionException("duration must be positive, got " + std::to_string(duration_ms) + " ms",
                                   ERR_INVALID_CONFIGURATION);
    }
    return begin((uint32_t)period_ms, (uint32_t)duration_ms);
}

RunHandle SampleLogger::begin(uint32_t period_ms, uint32_t duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::ACQUIRING) {
        throw AcquisitionException("acquisition already in progress", ERR_ALREADY_RUNNING);
    }
    if (state_ == State::STOPPED) {
        throw AcquisitionException("logger already stopped; create a new one", ERR_ALREADY_STOPPED);
    }
    if (capacity_ == 0) {
        throw AcquisitionException("sample capacity must be positive", ERR_INVALID_CONFIGURATION);
    }

    run_ = std::make_shared<Run>(period_ms, duration_ms, capacity_);
    period_ms_ = period_ms;
    duration_ms_ = duration_ms;
    has_last_tick_ = false;
    dropped_ = 0;
    start_ms_ = clock_.nowMs();
    state_ = State::ACQUIRING;
    timer_.arm(period_ms_, [this]() { onTick(); });

    if (duration_ms_ > 0) {
        Logger::info("[Sampler] Started: period=%lu ms, duration=%lu ms, capacity=%u",
                     (unsigned long)period_ms_, (unsigned long)duration_ms_, (unsigned)capacity_);
    } else {
        Logger::info("[Sampler] Started: period=%lu ms, unbounded, capacity=%u",
                     (unsigned long)period_ms_, (unsigned)capacity_);
    }
    return run_;
}

void SampleLogger::onTick() {
    bool dropped = false;
    uint32_t elapsed = 0;
    DropListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::ACQUIRING) return;

        elapsed = clock_.nowMs() - start_ms_;
        if (has_last_tick_ && elapsed <= last_tick_ms_) {
            run_->recordDuplicate();
            Logger::debug("[Sampler] Duplicate tick at %lu ms ignored", (unsigned long)elapsed);
            return;
        }
        if (duration_ms_ > 0 && elapsed > duration_ms_) {
            finish(StopReason::DURATION_ELAPSED);
            return;
        }
        last_tick_ms_ = elapsed;
        has_last_tick_ = true;

        uint16_t raw = 0;
        if (input_.read(raw) && converter_.inRange(raw)) {
            Sample s = {elapsed, converter_.toVolts(raw), raw};
            if (!run_->append(s)) {
                Logger::error("[Sampler] Run rejected sample at %lu ms", (unsigned long)elapsed);
            }
        } else {
            dropped = true;
            dropped_++;
            run_->recordDrop(elapsed);
            listener = drop_listener_;
            Logger::warn("[Sampler] %s at %lu ms (%u so far)", errorCodeToString(ERR_SAMPLE_DROPPED),
                         (unsigned long)elapsed, (unsigned)dropped_);
        }

        if (duration_ms_ > 0 && elapsed >= duration_ms_) {
            finish(StopReason::DURATION_ELAPSED);
        } else if (run_->full()) {
            finish(StopReason::CAPACITY_REACHED);
        }
    }
    if (dropped && listener) listener(elapsed);
}

RunHandle SampleLogger::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::IDLE) {
        Logger::warn("[Sampler] stop() called before start()");
        return RunHandle();
    }
    if (state_ == State::ACQUIRING) finish(StopReason::STOPPED_BY_CALLER);
    return run_;
}

void SampleLogger::finish(StopReason reason) {
    timer_.disarm();
    run_->freeze(reason);
    state_ = State::STOPPED;
    Logger::info("[Sampler] Stopped (%s): %u samples, %u dropped, %lu duplicate ticks",
                 stopReasonToString(reason), (unsigned)run_->size(), (unsigned)dropped_,
                 (unsigned long)run_->duplicateTicks());
}

SampleLogger::State SampleLogger::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t SampleLogger::droppedSamples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

size_t SampleLogger::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_ ? run_->size() : 0;
}

void SampleLogger::setDropListener(DropListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_listener_ = listener;
}

void SampleLogger::getStatistics(char* outBuf, size_t outBufSize) const {
    std::lock_guard<std::mutex> lock(mutex_);
    snprintf(outBuf, outBufSize, "state=%s, period=%lu, duration=%lu, samples=%u, dropped=%u",
             samplerStateToString(state_), (unsigned long)period_ms_, (unsigned long)duration_ms_,
             (unsigned)(run_ ? run_->size() : 0), (unsigned)dropped_);
}
