#include "MonteCarloPolicy.hpp"
#include "BoardAnalysis.hpp"

#include <algorithm>

namespace copperhead {

MonteCarloPolicy::MonteCarloPolicy(int rollouts, int depth, std::uint32_t seed)
    : rollouts_(std::max(1, rollouts)), depth_(std::max(1, depth)), rng_(seed) {}

Direction MonteCarloPolicy::chooseMove(const GameState& state, int playerId) {
    std::vector<Direction> moves = safeMoves(state, playerId);
    if (moves.empty()) moves = legalMoves(state, playerId);
    if (moves.empty()) return Direction::Up;
    if (moves.size() == 1) return moves.front();

    EvaluatedMove best = evaluate(state, playerId, moves.front());
    for (std::size_t i = 1; i < moves.size(); ++i) {
        EvaluatedMove candidate = evaluate(state, playerId, moves[i]);
        if (candidate.avgScore > best.avgScore) best = candidate;
    }
    return best.move;
}

MonteCarloPolicy::EvaluatedMove MonteCarloPolicy::evaluate(const GameState& state, int playerId, Direction move) {
    EvaluatedMove result;
    result.move = move;
    int deaths = 0;
    double total = 0.0;
    for (int i = 0; i < rollouts_; ++i) {
        double score = rollout(state, playerId, move);
        if (score < 0.0) ++deaths;
        total += score;
    }
    result.avgScore = total / rollouts_;
    result.deathRate = static_cast<double>(deaths) / rollouts_;
    return result;
}

// Scores in [-1, -0.5) for a death (earlier is worse), 1 for outliving the
// opponent, and [0.2, 0.5] for surviving the horizon depending on growth.
double MonteCarloPolicy::rollout(GameState game, int playerId, Direction first) {
    const int opponentId = playerId == rules::PLAYER_ONE ? rules::PLAYER_TWO : rules::PLAYER_ONE;
    game.setRunning(true);
    const std::size_t startLength = game.snake(playerId)->length();

    for (int t = 0; t < depth_; ++t) {
        Direction mine = t == 0 ? first : randomSafeMove(game, playerId);
        game.snake(playerId)->queueDirection(mine);
        Snake* opponent = game.snake(opponentId);
        if (opponent && opponent->alive()) {
            opponent->queueDirection(randomSafeMove(game, opponentId));
        }

        game.update();

        if (!game.snake(playerId)->alive()) {
            return -1.0 + 0.5 * static_cast<double>(t) / depth_;
        }
        if (!game.running()) return 1.0;
    }

    std::size_t grown = game.snake(playerId)->length() - startLength;
    return 0.2 + 0.1 * static_cast<double>(std::min<std::size_t>(grown, 3));
}

Direction MonteCarloPolicy::randomSafeMove(const GameState& game, int playerId) {
    std::vector<Direction> moves = safeMoves(game, playerId);
    if (moves.empty()) moves = legalMoves(game, playerId);
    if (moves.empty()) return Direction::Up;
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    return moves[pick(rng_)];
}

} // namespace copperhead
