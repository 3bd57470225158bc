#pragma once
#include <cstdint>

// Maps raw ADC counts to volts: volts = raw / 2^bits * vref.
class AdcConverter {
public:
    AdcConverter(uint8_t resolution_bits = 12, float vref_volts = 3.3f);

    float toVolts(uint16_t raw) const;
    // Inverse of toVolts(), clamped to [0, maxCount()].
    uint16_t toRaw(float volts) const;

    bool inRange(uint32_t raw) const { return raw <= maxCount(); }
    uint32_t counts() const { return counts_; }
    uint16_t maxCount() const { return (uint16_t)(counts_ - 1); }
    uint8_t resolutionBits() const { return resolution_bits_; }
    float vref() const { return vref_; }

private:
    uint8_t resolution_bits_;
    uint32_t counts_;
    float vref_;
};
