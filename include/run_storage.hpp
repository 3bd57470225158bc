#pragma once
#include <string>

#include "run.hpp"

// Keeps the CSV rendering of the most recent run on LittleFS so it survives a
// reset. Board builds only.
class RunStorage {
public:
    RunStorage(const char* filename = "/data/last_run.csv");

    bool begin();
    bool save(const Run& run);
    bool load(std::string& out) const;
    bool clear();

private:
    const char* filename_;
    bool mounted_;
};
