#include "crosslock/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace crosslock {
namespace logging {

static std::atomic<Level> g_level{Level::Info};
static std::mutex g_output_mutex;

void set_level(Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(g_level.load());
}

void write(Level lvl, const char* tag, const std::string& message) {
    if (!enabled(lvl)) return;

    std::lock_guard<std::mutex> lock(g_output_mutex);
    auto& out = (lvl >= Level::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] " << message << std::endl;
}

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    return std::nullopt;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
    }
    return "info";
}

} // namespace logging
} // namespace crosslock
