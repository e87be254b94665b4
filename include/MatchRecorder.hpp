#pragma once

#include "GameState.hpp"
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace copperhead {

struct MatchRecord {
    int roomId = 0;
    GameMode mode = GameMode::TwoPlayer;
    std::optional<int> winner;
    std::string playerOne;
    std::string playerTwo;
    std::size_t lengthOne = 0;
    std::size_t lengthTwo = 0;
    std::uint64_t ticks = 0;
};

// Appends one CSV line per finished game.
class MatchRecorder {
public:
    explicit MatchRecorder(const std::string& path);
    void record(const MatchRecord& match);

private:
    void writeHeader();

    std::ofstream stream_;
    std::mutex mutex_;
    bool headerWritten_ = false;
};

} // namespace copperhead
