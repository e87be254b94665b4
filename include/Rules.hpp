#pragma once

#include <chrono>
#include <cstddef>

namespace copperhead::rules {

// Grid dimensions
constexpr int GRID_WIDTH = 30;
constexpr int GRID_HEIGHT = 20;

// Time between game updates
constexpr std::chrono::milliseconds TICK_INTERVAL{150};

// Pending direction changes kept per snake
constexpr std::size_t INPUT_QUEUE_LIMIT = 3;

constexpr int PLAYER_ONE = 1;
constexpr int PLAYER_TWO = 2;

constexpr int MAX_ROOMS = 10;

// CopperBot difficulty range
constexpr int MIN_DIFFICULTY = 1;
constexpr int MAX_DIFFICULTY = 10;
constexpr int DEFAULT_DIFFICULTY = 5;

// Difficulties drawn for bot-vs-bot matches shown to observers
constexpr int SHOWCASE_MIN_DIFFICULTY = 3;
constexpr int SHOWCASE_MAX_DIFFICULTY = 8;

// WebSocket close codes
constexpr int CLOSE_INVALID_PLAYER = 4000;
constexpr int CLOSE_SERVER_FULL = 4002;

struct StartPosition {
  int x;
  int y;
};

inline StartPosition playerOneStart(int /*width*/, int height) {
  return {.x = 5, .y = height / 2};
}

inline StartPosition playerTwoStart(int width, int height) {
  return {.x = width - 6, .y = height / 2};
}

}  // namespace copperhead::rules
