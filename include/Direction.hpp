#pragma once

#include <array>
#include <optional>
#include <string>

namespace copperhead {

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

enum class Direction { Up, Down, Left, Right };

constexpr std::array<Direction, 4> ALL_DIRECTIONS = {
    Direction::Up, Direction::Down, Direction::Left, Direction::Right};

Direction opposite(Direction dir);
Point delta(Direction dir);
Point step(const Point& from, Direction dir);

// "up", "down", "left", "right"
std::string toString(Direction dir);
std::optional<Direction> parseDirection(const std::string& text);

} // namespace copperhead
