#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "Arena.hpp"
#include "BotPolicy.hpp"
#include "GameState.hpp"
#include "Protocol.hpp"

namespace py = pybind11;
using copperhead::GameState;

// ----------------- Handle-based game engine -----------------
struct Engine {
  GameState game;
  Engine(uint32_t seed, int width, int height) : game(width, height, seed) {
    game.setRunning(true);
  }
};

static std::unordered_map<uint64_t, std::unique_ptr<Engine>> g_engines;
static uint64_t g_next_handle = 1;

static Engine& engine_at(uint64_t handle) {
  auto it = g_engines.find(handle);
  if (it == g_engines.end()) throw std::runtime_error("invalid engine handle");
  return *it->second;
}

GameState& engine_game(uint64_t handle) {
  return engine_at(handle).game;
}

uint64_t create_engine(uint32_t seed, int width, int height) {
  uint64_t h = g_next_handle++;
  // GameState validates the grid size and throws std::invalid_argument (ValueError in Python)
  g_engines[h] = std::make_unique<Engine>(seed, width, height);
  return h;
}

void destroy_engine(uint64_t handle) {
  g_engines.erase(handle);
}

void engine_reset(uint64_t handle) {
  GameState& game = engine_game(handle);
  game.reset();
  game.setRunning(true);
}

bool engine_queue_move(uint64_t handle, int player_id, const std::string& direction) {
  auto dir = copperhead::parseDirection(direction);
  if (!dir) throw std::invalid_argument("unknown direction: " + direction);
  copperhead::Snake* snake = engine_game(handle).snake(player_id);
  if (!snake) throw std::invalid_argument("unknown player id: " + std::to_string(player_id));
  if (!snake->alive()) return false;
  snake->queueDirection(*dir);
  return true;
}

py::tuple engine_step(uint64_t handle) {
  GameState& game = engine_game(handle);
  game.update();
  py::object winner = py::none();
  if (game.winner()) winner = py::int_(*game.winner());
  return py::make_tuple(game.running(), winner);
}

std::string engine_state_json(uint64_t handle) {
  return copperhead::encodeGame(engine_game(handle)).dump();
}

std::string bot_choose_move(uint64_t handle, int player_id, int difficulty, uint32_t seed) {
  const GameState& game = engine_game(handle);
  if (!game.snake(player_id)) throw std::invalid_argument("unknown player id: " + std::to_string(player_id));
  auto policy = copperhead::makePolicyForDifficulty(difficulty, seed);
  return copperhead::toString(policy->chooseMove(game, player_id));
}

py::dict play_matches(uint32_t seed, int difficulty1, int difficulty2, uint64_t games, uint64_t max_ticks) {
  copperhead::Arena arena(copperhead::makePolicyForDifficulty(difficulty1, seed),
                          copperhead::makePolicyForDifficulty(difficulty2, seed ^ 0x9e3779b9u));
  copperhead::ArenaStats stats;
  {
    // Pure C++ from here on; other Python threads may run.
    py::gil_scoped_release release;
    stats = arena.run(games, seed, max_ticks);
  }
  py::dict out;
  out["games"] = stats.games;
  out["wins_1"] = stats.winsOne;
  out["wins_2"] = stats.winsTwo;
  out["draws"] = stats.draws;
  out["average_ticks"] = stats.averageTicks();
  return out;
}
