#pragma once

// Shared reporting helpers and hardware fakes for the host test programs.

#include <atomic>
#include <cmath>
#include <cstdio>
#include <set>
#include <vector>

#include "platform.hpp"
#include "simulated_rc_circuit.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

static void printTestHeader(const char* testName) {
    printf("\n========================================\n");
    printf("%s\n", testName);
    printf("========================================\n");
}

static void printTestResult(const char* testName, bool passed) {
    if (passed) {
        printf("PASS: ");
        tests_passed++;
    } else {
        printf("FAIL: ");
        tests_failed++;
    }
    printf("%s\n", testName);
}

static int printSummary() {
    printf("\n========================================\n");
    printf("Passed: %d, Failed: %d\n", tests_passed, tests_failed);
    printf("========================================\n");
    return tests_failed == 0 ? 0 : 1;
}

#define CHECK(cond)                                                        \
    do {                                                                   \
        if (!(cond)) {                                                     \
            printf("  check failed: %s (%s:%d)\n", #cond, __FILE__, __LINE__); \
            return false;                                                  \
        }                                                                  \
    } while (0)

static bool nearlyEqual(float a, float b, float tolerance) {
    return std::fabs(a - b) <= tolerance;
}

typedef SimulatedClock FakeClock;

// Returns raw = base + step * n for the n-th read (1-based); listed reads fail.
class ScriptedAnalogInput : public AnalogInput {
public:
    explicit ScriptedAnalogInput(uint16_t base = 2048, uint16_t step = 0) : base_(base), step_(step), reads_(0) {}

    void failOnRead(uint32_t n) { failing_.insert(n); }
    uint32_t reads() const { return reads_; }

    bool read(uint16_t& outRaw) override {
        reads_++;
        if (failing_.count(reads_)) return false;
        outRaw = (uint16_t)(base_ + step_ * reads_);
        return true;
    }

private:
    uint16_t base_;
    uint16_t step_;
    uint32_t reads_;
    std::set<uint32_t> failing_;
};

// ADC whose every read fails.
class DeadAnalogInput : public AnalogInput {
public:
    bool read(uint16_t&) override { return false; }
};

// Timer that only fires when the test says so.
class ManualTimer : public PeriodicTimer {
public:
    ManualTimer() : armed_(false), period_ms_(0), arm_count_(0) {}

    void arm(uint32_t period_ms, Callback cb) override {
        cb_ = cb;
        period_ms_ = period_ms;
        arm_count_++;
        armed_ = true;
    }
    void disarm() override { armed_ = false; }
    bool armed() const override { return armed_; }

    // Returns false if nothing fired.
    bool fire() {
        if (!armed_) return false;
        Callback cb = cb_;
        cb();
        return true;
    }

    uint32_t periodMs() const { return period_ms_; }
    int armCount() const { return arm_count_; }

private:
    Callback cb_;
    std::atomic<bool> armed_;
    uint32_t period_ms_;
    int arm_count_;
};

class RecordingOutput : public DigitalOutput {
public:
    explicit RecordingOutput(DigitalOutput* forward = nullptr) : forward_(forward) {}

    void write(bool high) override {
        writes.push_back(high);
        if (forward_) forward_->write(high);
    }

    std::vector<bool> writes;

private:
    DigitalOutput* forward_;
};
