#include "../include/run.hpp"

const char* stopReasonToString(StopReason reason) {
    switch (reason) {
        case StopReason::NONE: return "none";
        case StopReason::STOPPED_BY_CALLER: return "stopped";
        case StopReason::DURATION_ELAPSED: return "duration_elapsed";
        case StopReason::CAPACITY_REACHED: return "capacity_reached";
    }
    return "unknown";
}

Run::Run(uint32_t period_ms, uint32_t duration_ms, size_t capacity)
    : period_ms_(period_ms), duration_ms_(duration_ms), capacity_(capacity),
      dropped_count_(0), duplicate_ticks_(0), frozen_(false), stop_reason_(StopReason::NONE) {
    samples_.reserve(capacity_);
}

bool Run::append(const Sample& s) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_ || samples_.size() >= capacity_) return false;
    if (!samples_.empty() && s.timestamp <= samples_.back().timestamp) return false;
    samples_.push_back(s);
    return true;
}

void Run::recordDrop(uint32_t elapsed_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) return;
    dropped_count_++;
    if (dropped_at_.size() < capacity_) dropped_at_.push_back(elapsed_ms);
}

void Run::recordDuplicate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) return;
    duplicate_ticks_++;
}

void Run::freeze(StopReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) return;
    frozen_ = true;
    stop_reason_ = reason;
}

bool Run::frozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

bool Run::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size() >= capacity_;
}

size_t Run::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

std::vector<Sample> Run::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

std::vector<uint32_t> Run::droppedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_at_;
}

size_t Run::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
}

uint32_t Run::duplicateTicks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duplicate_ticks_;
}

StopReason Run::stopReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_reason_;
}
