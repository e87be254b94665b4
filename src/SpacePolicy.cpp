#include "SpacePolicy.hpp"
#include "BoardAnalysis.hpp"

#include <algorithm>

namespace copperhead {

namespace {

constexpr double TRAPPED_PENALTY = 1000.0;
constexpr double CONTESTED_PENALTY = 400.0;
constexpr double FOOD_WEIGHT = 50.0;
constexpr double EAT_BONUS = 60.0;

} // namespace

SpacePolicy::SpacePolicy(std::uint32_t seed) : fallback_(seed) {}

Direction SpacePolicy::chooseMove(const GameState& state, int playerId) {
    std::vector<Direction> moves = safeMoves(state, playerId);
    if (moves.empty()) return fallback_.chooseMove(state, playerId);

    Direction best = moves.front();
    double bestScore = scoreMove(state, playerId, best);
    for (std::size_t i = 1; i < moves.size(); ++i) {
        double score = scoreMove(state, playerId, moves[i]);
        if (score > bestScore) {
            best = moves[i];
            bestScore = score;
        }
    }
    return best;
}

double SpacePolicy::scoreMove(const GameState& state, int playerId, Direction dir) const {
    const Snake* me = state.snake(playerId);
    Point next = step(me->head(), dir);
    bool eats = state.food() && *state.food() == next;

    OccupancyGrid grid(state);
    if (!eats && me->length() > 1) grid.release(me->body().back());
    grid.release(next);

    const int needed = static_cast<int>(me->length()) + 2;
    const int cap = needed * 4;
    int area = floodArea(grid, next, cap);

    double score = 0.0;
    if (area < needed) {
        score -= TRAPPED_PENALTY - area * 10.0;
    } else {
        score += std::min(area, cap);
    }

    if (state.food()) {
        grid.block(next);
        if (auto distance = pathDistance(grid, next, *state.food())) {
            score += FOOD_WEIGHT / (1.0 + *distance);
        }
        if (eats) score += EAT_BONUS;
    }

    for (const auto& [id, other] : state.snakes()) {
        if (id == playerId || !other.alive()) continue;
        if (manhattan(other.head(), next) == 1 && other.length() >= me->length()) {
            score -= CONTESTED_PENALTY;
        }
    }
    return score;
}

} // namespace copperhead
