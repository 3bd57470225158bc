#pragma once

// Arduino-core implementations of the platform capabilities. Board builds only.

#include <Arduino.h>
#include "platform.hpp"

class ArduinoClock : public Clock {
public:
    uint32_t nowMs() override { return millis(); }
};

class ArduinoAnalogInput : public AnalogInput {
public:
    // A conversion taking longer than budget_us is reported as a failed read.
    ArduinoAnalogInput(uint8_t pin, uint8_t resolution_bits, uint32_t budget_us);

    void begin();
    bool read(uint16_t& outRaw) override;

private:
    uint8_t pin_;
    uint8_t resolution_bits_;
    uint32_t budget_us_;
};

class ArduinoDigitalOutput : public DigitalOutput {
public:
    explicit ArduinoDigitalOutput(uint8_t pin) : pin_(pin) {}

    void begin();
    void write(bool high) override;

private:
    uint8_t pin_;
};

// Logger time source backed by millis().
uint32_t arduinoMillis();
