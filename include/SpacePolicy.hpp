#pragma once

#include "BotPolicy.hpp"

namespace copperhead {

// Scores each safe move by the space left to the snake afterwards, the path
// length to the food, and whether the target cell can be contested by an
// equal or longer opponent head.
class SpacePolicy : public BotPolicy {
public:
    explicit SpacePolicy(std::uint32_t seed = std::random_device{}());
    Direction chooseMove(const GameState& state, int playerId) override;

private:
    double scoreMove(const GameState& state, int playerId, Direction dir) const;

    RandomPolicy fallback_;
};

} // namespace copperhead
