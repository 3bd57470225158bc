#include <Arduino.h>
#include "../include/arduino_platform.hpp"
#include "../include/logger.hpp"

ArduinoAnalogInput::ArduinoAnalogInput(uint8_t pin, uint8_t resolution_bits, uint32_t budget_us)
    : pin_(pin), resolution_bits_(resolution_bits), budget_us_(budget_us) {}

void ArduinoAnalogInput::begin() {
    pinMode(pin_, INPUT);
#if defined(ESP32)
    analogReadResolution(resolution_bits_);
#endif
    Logger::info("[ADC] pin=%u, resolution=%u bits, budget=%lu us",
                 (unsigned)pin_, (unsigned)resolution_bits_, (unsigned long)budget_us_);
}

bool ArduinoAnalogInput::read(uint16_t& outRaw) {
    uint32_t started = micros();
    int value = analogRead(pin_);
    uint32_t took = micros() - started;
    if (took > budget_us_) {
        Logger::debug("[ADC] Conversion took %lu us (budget %lu us)", (unsigned long)took, (unsigned long)budget_us_);
        return false;
    }
    if (value < 0 || value >= (1L << resolution_bits_)) return false;
    outRaw = (uint16_t)value;
    return true;
}

void ArduinoDigitalOutput::begin() {
    pinMode(pin_, OUTPUT);
    digitalWrite(pin_, LOW);
}

void ArduinoDigitalOutput::write(bool high) {
    digitalWrite(pin_, high ? HIGH : LOW);
}

uint32_t arduinoMillis() {
    return millis();
}
