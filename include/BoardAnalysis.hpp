#pragma once

#include "GameState.hpp"
#include <optional>
#include <vector>

namespace copperhead {

// Flat map of blocked cells used by the search helpers below.
class OccupancyGrid {
public:
    explicit OccupancyGrid(const GameState& game);

    int width() const { return width_; }
    int height() const { return height_; }

    bool free(const Point& p) const;
    void block(const Point& p);
    void release(const Point& p);

private:
    std::size_t index(const Point& p) const;

    int width_;
    int height_;
    std::vector<char> blocked_;
};

// Every direction except a reversal.
std::vector<Direction> legalMoves(const GameState& game, int playerId);

// Legal moves whose target cell is inside the grid and not covered by a snake.
// The mover's own tail counts as free unless the move eats food.
std::vector<Direction> safeMoves(const GameState& game, int playerId);

// Number of free cells reachable from start (start included), capped at limit.
int floodArea(const OccupancyGrid& grid, const Point& start, int limit);

// BFS step count between two cells through free cells. `to` may be blocked.
std::optional<int> pathDistance(const OccupancyGrid& grid, const Point& from, const Point& to);

// First move of a shortest path from the player's head to target.
std::optional<Direction> firstStepToward(const GameState& game, int playerId, const Point& target);

int manhattan(const Point& a, const Point& b);

} // namespace copperhead
