#pragma once
#include <functional>
#include <string>

#include "run.hpp"

// Text renderings of a Run for the plotting side.
class RunExporter {
public:
    using LineSink = std::function<void(const char* line)>;

    // Terminator line after the last sample of the CSV stream.
    static const char* const END_MARKER;

    // Emits "<ms>,<volts>" per sample in order, then END_MARKER.
    static void writeCsv(const Run& run, const LineSink& sink);
    static std::string toCsv(const Run& run);

    static std::string toJson(const Run& run);

    // Parses one "<ms>,<volts>" line as read back from the serial stream.
    // Extra columns are ignored; fewer than two or non-numeric ones fail.
    static bool parseCsvLine(const std::string& line, float& outTimeMs, float& outVolts);
};
