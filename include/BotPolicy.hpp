#pragma once

#include "GameState.hpp"
#include <cstdint>
#include <memory>
#include <random>

namespace copperhead {

class BotPolicy {
public:
    virtual ~BotPolicy() = default;

    virtual Direction chooseMove(const GameState& state, int playerId) = 0;
};

// Uniform choice among moves that survive the next tick.
class RandomPolicy : public BotPolicy {
public:
    explicit RandomPolicy(std::uint32_t seed = std::random_device{}());
    Direction chooseMove(const GameState& state, int playerId) override;

private:
    std::mt19937 rng_;
};

// Shortest path to the food, random safe move when the food is unreachable.
class GreedyPolicy : public BotPolicy {
public:
    explicit GreedyPolicy(std::uint32_t seed = std::random_device{}());
    Direction chooseMove(const GameState& state, int playerId) override;

private:
    RandomPolicy fallback_;
};

// Plays a random safe move with probability `blunderRate`, otherwise defers
// to the wrapped policy.
class BlunderPolicy : public BotPolicy {
public:
    BlunderPolicy(std::unique_ptr<BotPolicy> inner, double blunderRate, std::uint32_t seed);
    Direction chooseMove(const GameState& state, int playerId) override;

    double blunderRate() const { return blunderRate_; }

private:
    std::unique_ptr<BotPolicy> inner_;
    double blunderRate_;
    std::mt19937 rng_;
    RandomPolicy random_;
};

// CopperBot strength levels 1 (weakest) to 10.
std::unique_ptr<BotPolicy> makePolicyForDifficulty(int difficulty, std::uint32_t seed);
double blunderRateForDifficulty(int difficulty);

} // namespace copperhead
