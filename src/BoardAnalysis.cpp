#include "BoardAnalysis.hpp"

#include <cstdlib>
#include <queue>

namespace copperhead {

OccupancyGrid::OccupancyGrid(const GameState& game)
    : width_(game.width()),
      height_(game.height()),
      blocked_(static_cast<std::size_t>(game.width() * game.height()), 0) {
    for (const auto& [id, snake] : game.snakes()) {
        for (const Point& p : snake.body()) block(p);
    }
}

std::size_t OccupancyGrid::index(const Point& p) const {
    return static_cast<std::size_t>(p.y * width_ + p.x);
}

bool OccupancyGrid::free(const Point& p) const {
    if (p.x < 0 || p.x >= width_ || p.y < 0 || p.y >= height_) return false;
    return blocked_[index(p)] == 0;
}

void OccupancyGrid::block(const Point& p) {
    if (p.x < 0 || p.x >= width_ || p.y < 0 || p.y >= height_) return;
    blocked_[index(p)] = 1;
}

void OccupancyGrid::release(const Point& p) {
    if (p.x < 0 || p.x >= width_ || p.y < 0 || p.y >= height_) return;
    blocked_[index(p)] = 0;
}

int manhattan(const Point& a, const Point& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

std::vector<Direction> legalMoves(const GameState& game, int playerId) {
    std::vector<Direction> moves;
    const Snake* snake = game.snake(playerId);
    if (!snake) return moves;
    for (Direction dir : ALL_DIRECTIONS) {
        if (dir != opposite(snake->direction())) moves.push_back(dir);
    }
    return moves;
}

std::vector<Direction> safeMoves(const GameState& game, int playerId) {
    std::vector<Direction> moves;
    const Snake* snake = game.snake(playerId);
    if (!snake || !snake->alive()) return moves;

    OccupancyGrid grid(game);
    for (Direction dir : legalMoves(game, playerId)) {
        Point next = step(snake->head(), dir);
        if (!game.inBounds(next)) continue;
        bool eats = game.food() && *game.food() == next;
        bool ownTail = snake->length() > 1 && next == snake->body().back();
        if (grid.free(next) || (ownTail && !eats)) moves.push_back(dir);
    }
    return moves;
}

int floodArea(const OccupancyGrid& grid, const Point& start, int limit) {
    if (!grid.free(start)) return 0;
    std::vector<char> seen(static_cast<std::size_t>(grid.width() * grid.height()), 0);
    auto mark = [&](const Point& p) { seen[static_cast<std::size_t>(p.y * grid.width() + p.x)] = 1; };
    auto marked = [&](const Point& p) { return seen[static_cast<std::size_t>(p.y * grid.width() + p.x)] != 0; };

    std::queue<Point> frontier;
    frontier.push(start);
    mark(start);
    int count = 0;
    while (!frontier.empty() && count < limit) {
        Point p = frontier.front();
        frontier.pop();
        ++count;
        for (Direction dir : ALL_DIRECTIONS) {
            Point next = step(p, dir);
            if (grid.free(next) && !marked(next)) {
                mark(next);
                frontier.push(next);
            }
        }
    }
    return count;
}

std::optional<int> pathDistance(const OccupancyGrid& grid, const Point& from, const Point& to) {
    if (from == to) return 0;
    const int w = grid.width();
    std::vector<int> dist(static_cast<std::size_t>(w * grid.height()), -1);
    auto at = [&](const Point& p) -> int& { return dist[static_cast<std::size_t>(p.y * w + p.x)]; };

    std::queue<Point> frontier;
    frontier.push(from);
    at(from) = 0;
    while (!frontier.empty()) {
        Point p = frontier.front();
        frontier.pop();
        for (Direction dir : ALL_DIRECTIONS) {
            Point next = step(p, dir);
            if (next == to) return at(p) + 1;
            if (grid.free(next) && at(next) < 0) {
                at(next) = at(p) + 1;
                frontier.push(next);
            }
        }
    }
    return std::nullopt;
}

std::optional<Direction> firstStepToward(const GameState& game, int playerId, const Point& target) {
    const Snake* snake = game.snake(playerId);
    if (!snake) return std::nullopt;

    OccupancyGrid grid(game);
    std::optional<Direction> best;
    int bestDistance = 0;
    for (Direction dir : safeMoves(game, playerId)) {
        Point next = step(snake->head(), dir);
        if (next == target) return dir;
        OccupancyGrid after = grid;
        after.block(snake->head());
        after.release(next);
        auto distance = pathDistance(after, next, target);
        if (distance && (!best || *distance < bestDistance)) {
            best = dir;
            bestDistance = *distance;
        }
    }
    return best;
}

} // namespace copperhead
