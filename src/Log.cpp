#include "Log.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace copperhead::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_mutex;

const char* prefixFor(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG: ";
        case Level::Warning: return "WARNING: ";
        case Level::Error: return "ERROR: ";
        default: return "";
    }
}

} // namespace

void setLevel(Level level) { g_level = level; }
Level level() { return g_level; }

Line::Line(Level level)
    : level_(level), enabled_(level >= g_level.load() && level != Level::Off) {}

Line::~Line() {
    if (!enabled_) return;
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(g_mutex);
    std::cerr << stamp << " | " << prefixFor(level_) << stream_.str() << std::endl;
}

} // namespace copperhead::log
