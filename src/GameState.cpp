#include "GameState.hpp"

#include <stdexcept>
#include <vector>

namespace copperhead {

std::string toString(GameMode mode) {
    return mode == GameMode::VsAi ? "vs_ai" : "two_player";
}

std::optional<GameMode> parseGameMode(const std::string& text) {
    if (text == "two_player") return GameMode::TwoPlayer;
    if (text == "vs_ai") return GameMode::VsAi;
    return std::nullopt;
}

GameState::GameState(int width, int height, std::uint32_t seed)
    : width_(width), height_(height), rng_(seed) {
    if (width_ < 12 || height_ < 2) {
        throw std::invalid_argument("grid must be at least 12x2");
    }
    reset();
}

void GameState::reset() {
    snakes_.clear();
    auto p1 = rules::playerOneStart(width_, height_);
    auto p2 = rules::playerTwoStart(width_, height_);
    snakes_.emplace(rules::PLAYER_ONE, Snake(rules::PLAYER_ONE, {p1.x, p1.y}, Direction::Right));
    snakes_.emplace(rules::PLAYER_TWO, Snake(rules::PLAYER_TWO, {p2.x, p2.y}, Direction::Left));
    food_.reset();
    running_ = false;
    winner_.reset();
    ticks_ = 0;
    spawnFood();
}

void GameState::spawnFood() {
    std::vector<Point> available;
    available.reserve(static_cast<std::size_t>(width_ * height_));
    for (int x = 0; x < width_; ++x) {
        for (int y = 0; y < height_; ++y) {
            Point p{x, y};
            bool occupied = false;
            for (const auto& [id, snake] : snakes_) {
                if (snake.occupies(p)) {
                    occupied = true;
                    break;
                }
            }
            if (!occupied) available.push_back(p);
        }
    }
    if (available.empty()) return;
    std::uniform_int_distribution<std::size_t> pick(0, available.size() - 1);
    food_ = available[pick(rng_)];
}

void GameState::update() {
    if (!running_) return;
    ++ticks_;

    for (auto& [id, snake] : snakes_) {
        if (!snake.alive()) continue;
        bool grow = food_.has_value() && snake.peekNextHead() == *food_;
        snake.move(grow);
        if (grow) spawnFood();
    }

    for (auto& [id, snake] : snakes_) {
        if (!snake.alive()) continue;
        const Point& head = snake.head();
        if (!inBounds(head)) snake.kill();
        if (snake.occupies(head, 1)) snake.kill();
        for (const auto& [otherId, other] : snakes_) {
            if (otherId != id && other.occupies(head)) snake.kill();
        }
    }

    std::vector<int> alive;
    for (const auto& [id, snake] : snakes_) {
        if (snake.alive()) alive.push_back(id);
    }
    if (alive.size() <= 1) {
        running_ = false;
        if (alive.size() == 1) {
            winner_ = alive.front();
        } else {
            winner_.reset();
        }
    }
}

Snake* GameState::snake(int playerId) {
    auto it = snakes_.find(playerId);
    return it == snakes_.end() ? nullptr : &it->second;
}

const Snake* GameState::snake(int playerId) const {
    auto it = snakes_.find(playerId);
    return it == snakes_.end() ? nullptr : &it->second;
}

void GameState::setSnake(Snake snake) {
    int id = snake.playerId();
    snakes_.insert_or_assign(id, std::move(snake));
}

bool GameState::inBounds(const Point& p) const {
    return p.x >= 0 && p.x < width_ && p.y >= 0 && p.y < height_;
}

bool GameState::blocked(const Point& p) const {
    if (!inBounds(p)) return true;
    for (const auto& [id, snake] : snakes_) {
        if (snake.occupies(p)) return true;
    }
    return false;
}

} // namespace copperhead
