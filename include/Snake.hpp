#pragma once

#include "Direction.hpp"
#include <deque>
#include <vector>

namespace copperhead {

class Snake {
public:
    Snake(int playerId, Point start, Direction direction);

    int playerId() const { return playerId_; }
    const std::deque<Point>& body() const { return body_; }
    const Point& head() const { return body_.front(); }
    std::size_t length() const { return body_.size(); }

    Direction direction() const { return direction_; }
    Direction nextDirection() const { return nextDirection_; }
    const std::deque<Direction>& pendingInputs() const { return inputQueue_; }

    bool alive() const { return alive_; }
    void kill() { alive_ = false; }

    // Queue a turn. Repeats and reversals of the most recent intent are dropped,
    // and only the newest INPUT_QUEUE_LIMIT entries are kept.
    void queueDirection(Direction dir);

    // Where the head lands on the next move, without consuming input.
    Point peekNextHead() const;

    void move(bool grow);

    // True if p is a body cell, skipping the first `skip` cells.
    bool occupies(const Point& p, std::size_t skip = 0) const;

    // Rebuild a snake from a serialized snapshot.
    static Snake fromParts(int playerId, std::vector<Point> body, Direction direction, bool alive);

private:
    void processInput();

    int playerId_;
    std::deque<Point> body_;
    Direction direction_;
    Direction nextDirection_;
    std::deque<Direction> inputQueue_;
    bool alive_ = true;
};

} // namespace copperhead
