#pragma once

#include <sstream>

namespace copperhead::log {

enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3, Off = 4 };

void setLevel(Level level);
Level level();

// One log record. Written to stderr as "HH:MM:SS | message" when destroyed.
class Line {
public:
    explicit Line(Level level);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }

private:
    Level level_;
    bool enabled_;
    std::ostringstream stream_;
};

inline Line debug() { return Line(Level::Debug); }
inline Line info() { return Line(Level::Info); }
inline Line warn() { return Line(Level::Warning); }
inline Line error() { return Line(Level::Error); }

} // namespace copperhead::log
