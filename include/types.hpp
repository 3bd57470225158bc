#pragma once
#include <cstdint>

// One ADC reading. timestamp is milliseconds since acquisition start.
struct Sample {
    uint32_t timestamp;
    float voltage;
    uint16_t raw;
};

// Why a run stopped appending samples.
enum class StopReason {
    NONE,
    STOPPED_BY_CALLER,
    DURATION_ELAPSED,
    CAPACITY_REACHED
};

const char* stopReasonToString(StopReason reason);
