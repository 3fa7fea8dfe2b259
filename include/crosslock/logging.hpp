#pragma once

#include <optional>
#include <string>

namespace crosslock {
namespace logging {

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

void set_level(Level level);
Level level();
bool enabled(Level level);

// Writes "[TAG] message"; Warn and Error go to stderr
void write(Level level, const char* tag, const std::string& message);

std::optional<Level> parse_level(const std::string& name);
const char* level_name(Level level);

inline void debug(const char* tag, const std::string& message) { write(Level::Debug, tag, message); }
inline void info(const char* tag, const std::string& message) { write(Level::Info, tag, message); }
inline void warn(const char* tag, const std::string& message) { write(Level::Warn, tag, message); }
inline void error(const char* tag, const std::string& message) { write(Level::Error, tag, message); }

} // namespace logging
} // namespace crosslock
