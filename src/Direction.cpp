#include "Direction.hpp"

#include <stdexcept>

namespace copperhead {

Direction opposite(Direction dir) {
    switch (dir) {
        case Direction::Up: return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::Left: return Direction::Right;
        case Direction::Right: return Direction::Left;
    }
    throw std::invalid_argument("unknown direction");
}

Point delta(Direction dir) {
    switch (dir) {
        case Direction::Up: return {0, -1};
        case Direction::Down: return {0, 1};
        case Direction::Left: return {-1, 0};
        case Direction::Right: return {1, 0};
    }
    throw std::invalid_argument("unknown direction");
}

Point step(const Point& from, Direction dir) {
    Point d = delta(dir);
    return {from.x + d.x, from.y + d.y};
}

std::string toString(Direction dir) {
    switch (dir) {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
    }
    throw std::invalid_argument("unknown direction");
}

std::optional<Direction> parseDirection(const std::string& text) {
    if (text == "up") return Direction::Up;
    if (text == "down") return Direction::Down;
    if (text == "left") return Direction::Left;
    if (text == "right") return Direction::Right;
    return std::nullopt;
}

} // namespace copperhead
