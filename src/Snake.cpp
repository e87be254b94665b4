#include "Snake.hpp"
#include "Rules.hpp"

#include <algorithm>

namespace copperhead {

Snake::Snake(int playerId, Point start, Direction direction)
    : playerId_(playerId),
      body_{start},
      direction_(direction),
      nextDirection_(direction) {}

Snake Snake::fromParts(int playerId, std::vector<Point> body, Direction direction, bool alive) {
    Snake snake(playerId, body.empty() ? Point{} : body.front(), direction);
    snake.body_.assign(body.begin(), body.end());
    if (snake.body_.empty()) snake.body_.push_back(Point{});
    snake.alive_ = alive;
    return snake;
}

void Snake::queueDirection(Direction dir) {
    Direction last = inputQueue_.empty() ? nextDirection_ : inputQueue_.back();
    if (dir == last || dir == opposite(last)) return;
    inputQueue_.push_back(dir);
    if (inputQueue_.size() > rules::INPUT_QUEUE_LIMIT) {
        inputQueue_.pop_front();
    }
}

void Snake::processInput() {
    if (inputQueue_.empty()) return;
    Direction candidate = inputQueue_.front();
    inputQueue_.pop_front();
    if (candidate != opposite(direction_)) {
        nextDirection_ = candidate;
    }
}

Point Snake::peekNextHead() const {
    Direction dir = nextDirection_;
    if (!inputQueue_.empty() && inputQueue_.front() != opposite(direction_)) {
        dir = inputQueue_.front();
    }
    return step(head(), dir);
}

void Snake::move(bool grow) {
    processInput();
    direction_ = nextDirection_;
    body_.push_front(step(head(), direction_));
    if (!grow) {
        body_.pop_back();
    }
}

bool Snake::occupies(const Point& p, std::size_t skip) const {
    if (skip >= body_.size()) return false;
    return std::find(body_.begin() + static_cast<std::ptrdiff_t>(skip), body_.end(), p) != body_.end();
}

} // namespace copperhead
