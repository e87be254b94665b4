#pragma once

#include "Rules.hpp"
#include "Snake.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>

namespace copperhead {

enum class GameMode { TwoPlayer, VsAi };

std::string toString(GameMode mode);
std::optional<GameMode> parseGameMode(const std::string& text);

class GameState {
public:
    explicit GameState(int width = rules::GRID_WIDTH,
                       int height = rules::GRID_HEIGHT,
                       std::uint32_t seed = std::random_device{}());

    void reset();

    // Advance the simulation by one tick. Does nothing while not running.
    void update();

    void spawnFood();

    int width() const { return width_; }
    int height() const { return height_; }
    GameMode mode() const { return mode_; }
    void setMode(GameMode mode) { mode_ = mode; }

    bool running() const { return running_; }
    void setRunning(bool running) { running_ = running; }
    std::optional<int> winner() const { return winner_; }
    std::uint64_t ticks() const { return ticks_; }

    const std::optional<Point>& food() const { return food_; }
    void setFood(std::optional<Point> food) { food_ = food; }

    // Snakes keyed by player id (1 and 2).
    const std::map<int, Snake>& snakes() const { return snakes_; }
    Snake* snake(int playerId);
    const Snake* snake(int playerId) const;
    void setSnake(Snake snake);

    bool inBounds(const Point& p) const;
    // True if p is outside the grid or covered by any snake.
    bool blocked(const Point& p) const;

private:
    int width_;
    int height_;
    GameMode mode_ = GameMode::TwoPlayer;
    std::map<int, Snake> snakes_;
    std::optional<Point> food_;
    bool running_ = false;
    std::optional<int> winner_;
    std::uint64_t ticks_ = 0;
    std::mt19937 rng_;
};

} // namespace copperhead
