#pragma once

#include "BotPolicy.hpp"
#include <random>
#include <vector>

namespace copperhead {

class MonteCarloPolicy : public BotPolicy {
public:
    MonteCarloPolicy(int rollouts = 24, int depth = 25, std::uint32_t seed = std::random_device{}());

    Direction chooseMove(const GameState& state, int playerId) override;

private:
    struct EvaluatedMove {
        Direction move = Direction::Up;
        double avgScore = 0.0;
        double deathRate = 0.0;
    };

    EvaluatedMove evaluate(const GameState& state, int playerId, Direction move);
    double rollout(GameState game, int playerId, Direction first);
    Direction randomSafeMove(const GameState& game, int playerId);

    int rollouts_;
    int depth_;
    std::mt19937 rng_;
};

} // namespace copperhead
