#include "../include/run_exporter.hpp"
#include <ArduinoJson.h>
#include <cstdio>
#include <cstdlib>

const char* const RunExporter::END_MARKER = "End";

void RunExporter::writeCsv(const Run& run, const LineSink& sink) {
    std::vector<Sample> samples = run.samples();
    char linebuf[48];
    for (size_t i = 0; i < samples.size(); ++i) {
        snprintf(linebuf, sizeof(linebuf), "%lu,%.7g",
                 (unsigned long)samples[i].timestamp, (double)samples[i].voltage);
        sink(linebuf);
    }
    sink(END_MARKER);
}

std::string RunExporter::toCsv(const Run& run) {
    std::string out;
    writeCsv(run, [&out](const char* line) {
        out += line;
        out += '\n';
    });
    return out;
}

std::string RunExporter::toJson(const Run& run) {
    std::vector<Sample> samples = run.samples();
    std::vector<uint32_t> dropped = run.droppedAt();

    size_t capacity = JSON_OBJECT_SIZE(7) + JSON_ARRAY_SIZE(dropped.size()) +
                      JSON_ARRAY_SIZE(samples.size()) + samples.size() * JSON_ARRAY_SIZE(2) + 64;
    DynamicJsonDocument doc(capacity);
    doc["period_ms"] = run.periodMs();
    doc["duration_ms"] = run.durationMs();
    doc["stop_reason"] = stopReasonToString(run.stopReason());
    doc["dropped_count"] = run.droppedCount();
    JsonArray droppedArr = doc.createNestedArray("dropped");
    for (size_t i = 0; i < dropped.size(); ++i) {
        droppedArr.add(dropped[i]);
    }
    doc["duplicate_ticks"] = run.duplicateTicks();
    JsonArray samplesArr = doc.createNestedArray("samples");
    for (size_t i = 0; i < samples.size(); ++i) {
        JsonArray pair = samplesArr.createNestedArray();
        pair.add(samples[i].timestamp);
        pair.add(samples[i].voltage);
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

static bool parseFloatField(const std::string& field, float& out) {
    size_t begin = field.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return false;
    size_t end = field.find_last_not_of(" \t\r\n");
    std::string trimmed = field.substr(begin, end - begin + 1);
    char* parsedEnd = nullptr;
    double value = strtod(trimmed.c_str(), &parsedEnd);
    if (parsedEnd == trimmed.c_str() || *parsedEnd != '\0') return false;
    out = (float)value;
    return true;
}

bool RunExporter::parseCsvLine(const std::string& line, float& outTimeMs, float& outVolts) {
    size_t comma = line.find(',');
    if (comma == std::string::npos) return false;
    size_t next = line.find(',', comma + 1);
    std::string second = line.substr(comma + 1, next == std::string::npos ? std::string::npos : next - comma - 1);
    float t = 0.0f, v = 0.0f;
    if (!parseFloatField(line.substr(0, comma), t) || !parseFloatField(second, v)) return false;
    outTimeMs = t;
    outVolts = v;
    return true;
}
