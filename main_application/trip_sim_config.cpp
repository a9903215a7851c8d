// TripNavSim/main_application/trip_sim_config.cpp
#include "trip_sim_config.h"
#include <cstdlib>
#include <cerrno>
#include <limits>

namespace main_application {

namespace {

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    out = value;
    return true;
}

bool parseInt64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    out = static_cast<int64_t>(value);
    return true;
}

bool parseBool(const std::string& text, bool& out) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") { out = true; return true; }
    if (text == "0" || text == "false" || text == "no" || text == "off") { out = false; return true; }
    return false;
}

} // namespace

void TripSimConfig::initDefaults() {
    origin = tripnav::Coordinate{48.8566, 2.3522};
    destination = tripnav::Coordinate{48.8606, 2.3582};
    speed_mps = 10.0;
    fix_interval_ms = 1000;
    provider_latency_ms = 300;
    provider_failures = 0;
    miss_turn = true;
    gps_fails_to_start = false;
    max_sim_ms = 10 * 60 * 1000;
    tick_sleep_ms = 0;
    log_level = tripnav::logging::LogLevel::INFO;
}

bool TripSimConfig::applyArgument(const std::string& argument) {
    size_t separator = argument.find('=');
    if (separator == std::string::npos) {
        TRIPNAV_LOG_ERROR("TripSimConfig: Argument '%s' is not key=value.", argument.c_str());
        return false;
    }
    std::string key = argument.substr(0, separator);
    std::string value = argument.substr(separator + 1);
    bool ok = false;
    double real = 0.0;
    int64_t integer = 0;
    bool flag = false;

    if (key == "origin_lat") {
        ok = parseDouble(value, real);
        if (ok) origin.latitude = real;
    } else if (key == "origin_lon") {
        ok = parseDouble(value, real);
        if (ok) origin.longitude = real;
    } else if (key == "dest_lat") {
        ok = parseDouble(value, real);
        if (ok) destination.latitude = real;
    } else if (key == "dest_lon") {
        ok = parseDouble(value, real);
        if (ok) destination.longitude = real;
    } else if (key == "speed_mps") {
        ok = parseDouble(value, real) && real > 0.0;
        if (ok) speed_mps = real;
    } else if (key == "fix_interval_ms") {
        ok = parseInt64(value, integer) && integer > 0;
        if (ok) fix_interval_ms = integer;
    } else if (key == "provider_latency_ms") {
        ok = parseInt64(value, integer) && integer >= 0;
        if (ok) provider_latency_ms = integer;
    } else if (key == "provider_failures") {
        ok = parseInt64(value, integer) && integer >= 0 && integer <= std::numeric_limits<int>::max();
        if (ok) provider_failures = static_cast<int>(integer);
    } else if (key == "miss_turn") {
        ok = parseBool(value, flag);
        if (ok) miss_turn = flag;
    } else if (key == "gps_fails") {
        ok = parseBool(value, flag);
        if (ok) gps_fails_to_start = flag;
    } else if (key == "max_sim_seconds") {
        ok = parseInt64(value, integer) && integer > 0 && integer <= std::numeric_limits<int64_t>::max() / 1000;
        if (ok) max_sim_ms = integer * 1000;
    } else if (key == "tick_sleep_ms") {
        ok = parseInt64(value, integer) && integer >= 0;
        if (ok) tick_sleep_ms = integer;
    } else if (key == "log_level") {
        ok = tripnav::logging::parseLogLevel(value, log_level);
    } else {
        TRIPNAV_LOG_ERROR("TripSimConfig: Unknown setting '%s'.", key.c_str());
        return false;
    }

    if (!ok) {
        TRIPNAV_LOG_ERROR("TripSimConfig: Invalid value '%s' for '%s'.", value.c_str(), key.c_str());
        return false;
    }
    TRIPNAV_LOG_DEBUG("TripSimConfig: %s = %s", key.c_str(), value.c_str());
    return true;
}

bool parseTripSimArguments(int argc, char* argv[], TripSimConfig& config) {
    for (int i = 1; i < argc; ++i) {
        if (!config.applyArgument(argv[i])) {
            return false;
        }
    }
    return true;
}

} // namespace main_application
