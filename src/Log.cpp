/**
 * Log.cpp - Tagged, coloured diagnostics on stderr
 */

#include "dp/Log.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace dp {
namespace log {

namespace {

const std::string RESET = "\033[0m";
const std::string DIM = "\033[2m";
const std::string YELLOW = "\033[33m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

Level g_level = Level::WARN;

const char* levelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "debug";
        case Level::INFO:  return "info";
        case Level::WARN:  return "warn";
        case Level::ERROR: return "error";
    }
    return "?";
}

const std::string& levelColor(Level level) {
    switch (level) {
        case Level::DEBUG: return DIM;
        case Level::INFO:  return CYAN;
        case Level::WARN:  return YELLOW;
        case Level::ERROR: return RED;
    }
    return RESET;
}

std::string timestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

} // anonymous namespace

void setLevel(Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

bool parseLevel(const std::string& name, Level& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") { out = Level::DEBUG; return true; }
    if (lower == "info") { out = Level::INFO; return true; }
    if (lower == "warn" || lower == "warning") { out = Level::WARN; return true; }
    if (lower == "error") { out = Level::ERROR; return true; }
    return false;
}

void write(Level lvl, const std::string& tag, const std::string& message) {
    if (static_cast<int>(lvl) < static_cast<int>(g_level)) {
        return;
    }

    // No colour codes when stderr is redirected to a file
    static const bool colored = isatty(STDERR_FILENO) != 0;

    if (colored) {
        std::cerr << DIM << timestamp() << RESET << " " << levelColor(lvl)
                  << levelName(lvl) << RESET << " [" << tag << "] " << message << "\n";
    } else {
        std::cerr << timestamp() << " " << levelName(lvl) << " [" << tag << "] " << message << "\n";
    }
}

} // namespace log
} // namespace dp
