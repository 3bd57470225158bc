/**
 * SquareWaveGenerator test program
 *
 * Runs the generator on a TickerTimer with a fake clock and records every
 * level written to the step output.
 */

#include "logger.hpp"
#include "square_wave.hpp"
#include "test_support.hpp"
#include "ticker_timer.hpp"

/**
 * TEST 1: Output alternates once per half period
 */
bool test_toggle_sequence() {
    printTestHeader("TEST 1: Output alternates once per half period");
    FakeClock clock(0);
    TickerTimer timer(clock);
    RecordingOutput out;
    SquareWaveGenerator wave(timer, out);

    CHECK(wave.start(SquareWaveGenerator::DEFAULT_HALF_PERIOD_MS));
    CHECK(wave.running());
    CHECK(timer.armed());
    CHECK(timer.interval() == 5000);
    CHECK(out.writes.size() == 1);
    CHECK(out.writes[0]);

    // Nothing happens before the first half period is over
    clock.advance(4999);
    timer.update();
    CHECK(out.writes.size() == 1);

    for (int i = 0; i < 4; ++i) {
        clock.advance(i == 0 ? 1 : 5000);
        timer.update();
    }
    CHECK(out.writes.size() == 5);
    const bool expected[] = {true, false, true, false, true};
    for (size_t i = 0; i < 5; ++i) {
        CHECK(out.writes[i] == expected[i]);
    }
    CHECK(wave.toggles() == 4);
    CHECK(wave.level());
    return true;
}

/**
 * TEST 2: stop() disarms and leaves the output low
 */
bool test_stop_leaves_low() {
    printTestHeader("TEST 2: stop() disarms and leaves the output low");
    FakeClock clock(100);
    TickerTimer timer(clock);
    RecordingOutput out;
    SquareWaveGenerator wave(timer, out);

    CHECK(wave.start(20));
    clock.advance(20);
    timer.update();
    clock.advance(20);
    timer.update();
    CHECK(wave.level());

    wave.stop();
    CHECK(!wave.running());
    CHECK(!timer.armed());
    CHECK(!out.writes.back());
    size_t written = out.writes.size();

    clock.advance(1000);
    timer.update();
    CHECK(out.writes.size() == written);

    // Second stop does not write again
    wave.stop();
    CHECK(out.writes.size() == written);
    return true;
}

/**
 * TEST 3: Zero half period is rejected
 */
bool test_zero_half_period() {
    printTestHeader("TEST 3: Zero half period is rejected");
    FakeClock clock;
    TickerTimer timer(clock);
    RecordingOutput out;
    SquareWaveGenerator wave(timer, out);

    CHECK(!wave.start(0));
    CHECK(!wave.running());
    CHECK(!timer.armed());
    CHECK(out.writes.empty());
    return true;
}

/**
 * TEST 4: Restart with a new half period starts high again
 */
bool test_restart() {
    printTestHeader("TEST 4: Restart with a new half period starts high again");
    FakeClock clock;
    TickerTimer timer(clock);
    RecordingOutput out;
    SquareWaveGenerator wave(timer, out);

    CHECK(wave.start(10));
    clock.advance(10);
    timer.update();
    CHECK(!wave.level());

    CHECK(wave.start(50));
    CHECK(wave.level());
    CHECK(wave.toggles() == 0);
    CHECK(timer.interval() == 50);
    clock.advance(49);
    timer.update();
    CHECK(wave.level());
    clock.advance(1);
    timer.update();
    CHECK(!wave.level());
    return true;
}

int main() {
    Logger::setLevel(Logger::WARN);

    printTestResult("Toggle sequence", test_toggle_sequence());
    printTestResult("Stop leaves output low", test_stop_leaves_low());
    printTestResult("Zero half period", test_zero_half_period());
    printTestResult("Restart", test_restart());

    return printSummary();
}
