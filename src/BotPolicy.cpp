#include "BotPolicy.hpp"
#include "BoardAnalysis.hpp"
#include "MonteCarloPolicy.hpp"
#include "SpacePolicy.hpp"

#include <algorithm>

namespace copperhead {

RandomPolicy::RandomPolicy(std::uint32_t seed) : rng_(seed) {}

Direction RandomPolicy::chooseMove(const GameState& state, int playerId) {
    std::vector<Direction> moves = safeMoves(state, playerId);
    if (moves.empty()) moves = legalMoves(state, playerId);
    if (moves.empty()) return Direction::Up;
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    return moves[pick(rng_)];
}

GreedyPolicy::GreedyPolicy(std::uint32_t seed) : fallback_(seed) {}

Direction GreedyPolicy::chooseMove(const GameState& state, int playerId) {
    if (state.food()) {
        if (auto dir = firstStepToward(state, playerId, *state.food())) return *dir;
    }
    return fallback_.chooseMove(state, playerId);
}

BlunderPolicy::BlunderPolicy(std::unique_ptr<BotPolicy> inner, double blunderRate, std::uint32_t seed)
    : inner_(std::move(inner)), blunderRate_(blunderRate), rng_(seed), random_(seed ^ 0x9e3779b9u) {}

Direction BlunderPolicy::chooseMove(const GameState& state, int playerId) {
    std::bernoulli_distribution blunder(blunderRate_);
    if (blunder(rng_)) return random_.chooseMove(state, playerId);
    return inner_->chooseMove(state, playerId);
}

double blunderRateForDifficulty(int difficulty) {
    int d = std::clamp(difficulty, rules::MIN_DIFFICULTY, rules::MAX_DIFFICULTY);
    return (rules::MAX_DIFFICULTY - d) * 0.04;
}

std::unique_ptr<BotPolicy> makePolicyForDifficulty(int difficulty, std::uint32_t seed) {
    int d = std::clamp(difficulty, rules::MIN_DIFFICULTY, rules::MAX_DIFFICULTY);

    std::unique_ptr<BotPolicy> base;
    if (d <= 2) {
        base = std::make_unique<RandomPolicy>(seed);
    } else if (d <= 4) {
        base = std::make_unique<GreedyPolicy>(seed);
    } else if (d <= 7) {
        base = std::make_unique<SpacePolicy>(seed);
    } else {
        base = std::make_unique<MonteCarloPolicy>(16 + (d - 8) * 8, 20 + (d - 8) * 5, seed);
    }

    double rate = blunderRateForDifficulty(d);
    if (rate <= 0.0) return base;
    return std::make_unique<BlunderPolicy>(std::move(base), rate, seed + 1);
}

} // namespace copperhead
