#include "settings.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <absl/strings/numbers.h>

namespace {

// Each parser must consume the whole token
bool parseToken(const std::string& token, size_t* out) {
    return absl::SimpleAtoi(token, out);
}

bool parseToken(const std::string& token, std::int64_t* out) {
    return absl::SimpleAtoi(token, out);
}

bool parseToken(const std::string& token, double* out) {
    return absl::SimpleAtod(token, out);
}

bool parseToken(const std::string& token, Label* out) {
    if (token.size() != 1) return false;
    *out = token[0];
    return true;
}

bool parseToken(const std::string& token, std::string* out) {
    *out = token;
    return true;
}

template<typename T>
T readValue(std::istream& in, const std::string& key) {
    std::string token;
    if (!(in >> token)) {
        throw std::runtime_error("Missing value for setting: " + key);
    }
    T value;
    if (!parseToken(token, &value)) {
        throw std::runtime_error("Invalid value '" + token + "' for setting: " + key);
    }
    return value;
}

} // namespace

Settings parseSettings(std::istream& in) {
    Settings s;
    std::string key;
    while (in >> key) {
        if (key == "numPoints") {
            s.planner.numPoints = readValue<size_t>(in, key);
        } else if (key == "radius") {
            s.planner.radius = readValue<double>(in, key);
        } else if (key == "seed") {
            s.planner.seed = readValue<std::int64_t>(in, key);
        } else if (key == "start") {
            s.planner.start = readValue<Label>(in, key);
        } else if (key == "logFile") {
            s.logFile = readValue<std::string>(in, key);
        } else {
            // Skip the value of an unknown key
            std::string ignored;
            in >> ignored;
        }
    }
    return s;
}

Settings loadSettings(const std::string& settingsFile) {
    std::ifstream in(settingsFile);
    if (!in) {
        std::cerr << "No settings file found. Using defaults." << std::endl;
        return Settings{};
    }
    return parseSettings(in);
}
