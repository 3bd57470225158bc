#include "../include/square_wave.hpp"
#include "../include/logger.hpp"

const uint32_t SquareWaveGenerator::DEFAULT_HALF_PERIOD_MS;

SquareWaveGenerator::SquareWaveGenerator(PeriodicTimer& timer, DigitalOutput& output)
    : timer_(timer), output_(output), half_period_ms_(0), running_(false), level_(false), toggles_(0) {}

bool SquareWaveGenerator::start(uint32_t half_period_ms) {
    if (half_period_ms == 0) {
        Logger::warn("[Square] Half period must be positive");
        return false;
    }
    if (running_) timer_.disarm();

    half_period_ms_ = half_period_ms;
    toggles_ = 0;
    level_ = true;
    output_.write(level_);
    timer_.arm(half_period_ms_, [this]() { onTick(); });
    running_ = true;
    Logger::info("[Square] Started, %lu ms high / %lu ms low",
                 (unsigned long)half_period_ms_, (unsigned long)half_period_ms_);
    return true;
}

void SquareWaveGenerator::stop() {
    if (!running_) return;
    timer_.disarm();
    running_ = false;
    level_ = false;
    output_.write(level_);
    Logger::info("[Square] Stopped after %lu toggles", (unsigned long)toggles_);
}

void SquareWaveGenerator::onTick() {
    if (!running_) return;
    level_ = !level_;
    toggles_++;
    output_.write(level_);
}
