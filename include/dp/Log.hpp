/**
 * Log.hpp - Tagged, coloured diagnostics on stderr
 *
 * stdout belongs to the rendered result, so everything here goes to stderr.
 */

#pragma once

#include <sstream>
#include <string>

namespace dp {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

void setLevel(Level level);
Level level();

// Accepts "debug", "info", "warn"/"warning", "error"; returns false otherwise
bool parseLevel(const std::string& name, Level& out);

void write(Level level, const std::string& tag, const std::string& message);

inline void debug(const std::string& tag, const std::string& msg) { write(Level::DEBUG, tag, msg); }
inline void info(const std::string& tag, const std::string& msg) { write(Level::INFO, tag, msg); }
inline void warn(const std::string& tag, const std::string& msg) { write(Level::WARN, tag, msg); }
inline void error(const std::string& tag, const std::string& msg) { write(Level::ERROR, tag, msg); }

} // namespace log
} // namespace dp
