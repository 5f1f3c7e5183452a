#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>

#include "planner.hpp"

// Run settings: planner inputs plus where the run log goes
struct Settings {
    PlannerConfig planner;
    std::optional<std::filesystem::path> logFile; // optional log file
};

// Parse whitespace-separated "key value" pairs. Unknown keys are skipped;
// a value that does not parse throws std::runtime_error.
Settings parseSettings(std::istream& in);

// Read settings from a file; a missing file gives the defaults
Settings loadSettings(const std::string& settingsFile);
