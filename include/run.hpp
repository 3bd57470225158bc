#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "types.hpp"

// One acquisition session: samples in acquisition order plus the in-band record
// of ticks that produced no sample. Appends are rejected once frozen.
class Run {
public:
    Run(uint32_t period_ms, uint32_t duration_ms, size_t capacity);

    // Returns false if the run is frozen, full, or s.timestamp does not
    // strictly follow the previous sample.
    bool append(const Sample& s);
    // Counts every drop; only the first capacity() drop times are kept.
    void recordDrop(uint32_t elapsed_ms);
    void recordDuplicate();
    void freeze(StopReason reason);

    bool frozen() const;
    bool full() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint32_t periodMs() const { return period_ms_; }
    uint32_t durationMs() const { return duration_ms_; }   // 0 when unbounded

    std::vector<Sample> samples() const;
    std::vector<uint32_t> droppedAt() const;
    size_t droppedCount() const;
    uint32_t duplicateTicks() const;
    StopReason stopReason() const;

private:
    const uint32_t period_ms_;
    const uint32_t duration_ms_;
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<Sample> samples_;
    std::vector<uint32_t> dropped_at_;
    size_t dropped_count_;
    uint32_t duplicate_ticks_;
    bool frozen_;
    StopReason stop_reason_;
};

// Read-only view handed to the caller that started acquisition.
using RunHandle = std::shared_ptr<const Run>;
