#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>
#include "../include/run_storage.hpp"
#include "../include/run_exporter.hpp"
#include "../include/logger.hpp"

RunStorage::RunStorage(const char* filename) : filename_(filename), mounted_(false) {}

bool RunStorage::begin() {
    // Format on first boot when the partition holds no filesystem yet
    mounted_ = LittleFS.begin(true);
    if (!mounted_) {
        Logger::error("[Storage] LittleFS mount failed");
        return false;
    }
    if (!LittleFS.exists("/data")) LittleFS.mkdir("/data");
    return true;
}

bool RunStorage::save(const Run& run) {
    if (!mounted_) return false;
    File file = LittleFS.open(filename_, "w");
    if (!file) {
        Logger::error("[Storage] Failed to open %s for writing", filename_);
        return false;
    }
    size_t written = 0;
    RunExporter::writeCsv(run, [&file, &written](const char* line) {
        written += file.print(line);
        written += file.print('\n');
    });
    file.close();
    Logger::info("[Storage] Saved %u samples (%u bytes) to %s",
                 (unsigned)run.size(), (unsigned)written, filename_);
    return written > 0;
}

bool RunStorage::load(std::string& out) const {
    if (!mounted_) return false;
    File file = LittleFS.open(filename_, "r");
    if (!file) return false;
    String content = file.readString();
    file.close();
    out.assign(content.c_str(), content.length());
    return true;
}

bool RunStorage::clear() {
    if (!mounted_) return false;
    return LittleFS.remove(filename_);
}
