#pragma once

#include "BotPolicy.hpp"
#include "GameState.hpp"
#include "MatchRecorder.hpp"
#include <cstdint>
#include <memory>

namespace copperhead {

struct ArenaStats {
    std::uint64_t games = 0;
    std::uint64_t winsOne = 0;
    std::uint64_t winsTwo = 0;
    std::uint64_t draws = 0;
    std::uint64_t totalTicks = 0;

    double averageTicks() const { return games ? static_cast<double>(totalTicks) / games : 0.0; }
};

// Headless bot-vs-bot games, no network involved.
class Arena {
public:
    Arena(std::unique_ptr<BotPolicy> one,
          std::unique_ptr<BotPolicy> two,
          int width = rules::GRID_WIDTH,
          int height = rules::GRID_HEIGHT,
          MatchRecorder* recorder = nullptr);

    void setRecorder(MatchRecorder* recorder);

    // Games still running after maxTicks count as draws.
    ArenaStats run(std::uint64_t games, std::uint32_t seed, std::uint64_t maxTicks = 5000);

    // Plays one game to completion on the given state.
    void playOut(GameState& game, std::uint64_t maxTicks);

private:
    std::unique_ptr<BotPolicy> one_;
    std::unique_ptr<BotPolicy> two_;
    int width_;
    int height_;
    MatchRecorder* recorder_;
};

} // namespace copperhead
