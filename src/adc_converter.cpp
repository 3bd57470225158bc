#include "../include/adc_converter.hpp"

AdcConverter::AdcConverter(uint8_t resolution_bits, float vref_volts)
    : resolution_bits_(resolution_bits), counts_(1UL << resolution_bits), vref_(vref_volts) {}

float AdcConverter::toVolts(uint16_t raw) const {
    uint16_t clamped = raw > maxCount() ? maxCount() : raw;
    return ((float)clamped / (float)counts_) * vref_;
}

uint16_t AdcConverter::toRaw(float volts) const {
    if (volts <= 0.0f || vref_ <= 0.0f) return 0;
    float scaled = volts / vref_ * (float)counts_ + 0.5f;
    if (scaled >= (float)maxCount()) return maxCount();
    return (uint16_t)scaled;
}
