// Host build of the step test: same acquisition path, simulated RC network and
// clock. Prints the CSV stream on stdout, log lines on stderr.
//
// usage: steplog_sim [--json] [--fail-every N] [--tau MS] [config.json]

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include "../include/run_exporter.hpp"
#include "../include/simulated_rc_circuit.hpp"
#include "../include/step_response_test.hpp"
#include "../include/ticker_timer.hpp"

static SimulatedClock* simClock = nullptr;

static uint32_t simMillis() {
    return simClock ? simClock->nowMs() : 0;
}

static void printUsage(const char* argv0) {
    fprintf(stderr, "usage: %s [--json] [--fail-every N] [--tau MS] [config.json]\n", argv0);
}

static bool readFile(const char* path, std::string& out) {
    std::ifstream in(path);
    if (!in) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char** argv) {
    bool asJson = false;
    unsigned long failEvery = 0;
    float tauMs = 330.0f;
    const char* configPath = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--json") == 0) {
            asJson = true;
        } else if (strcmp(argv[i], "--fail-every") == 0 && i + 1 < argc) {
            failEvery = strtoul(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "--tau") == 0 && i + 1 < argc) {
            tauMs = (float)atof(argv[++i]);
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            printUsage(argv[0]);
            return 2;
        } else {
            configPath = argv[i];
        }
    }

    SimulatedClock clock;
    simClock = &clock;
    Logger::setTimeSource(simMillis);

    ConfigManager config;
    if (configPath) {
        std::string text, reason;
        if (!readFile(configPath, text)) {
            Logger::error("Cannot read %s", configPath);
            return 1;
        }
        if (!config.loadFromJson(text, reason)) {
            Logger::error("Invalid config %s: %s", configPath, reason.c_str());
            return 1;
        }
    }
    Logger::begin(config.getLoggingConfig());

    AcquisitionConfig acq = config.getAcquisitionConfig();
    AdcConverter converter(acq.adc_resolution_bits, acq.vref_volts);
    RcCircuit circuit(clock, converter, tauMs);
    circuit.setFailEvery((uint32_t)failEvery);
    TickerTimer timer(clock);

    StepResponseTest test(clock, circuit, timer, circuit, converter, acq.max_samples);
    RunHandle run;
    try {
        run = test.run((int32_t)acq.period_ms, (int32_t)acq.duration_ms, [&clock, &timer]() {
            clock.advance(1);
            timer.update();
        });
    } catch (const AcquisitionException& e) {
        Logger::error("Step test rejected (%s): %s", errorCodeToString(e.code()), e.what());
        return 1;
    }

    if (asJson) {
        printf("%s\n", RunExporter::toJson(*run).c_str());
    } else {
        RunExporter::writeCsv(*run, [](const char* line) { printf("%s\n", line); });
    }
    Logger::flush();
    return 0;
}
