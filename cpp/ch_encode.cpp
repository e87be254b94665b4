#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "GameState.hpp"

namespace py = pybind11;

// Defined in ch_engine.cpp
copperhead::GameState& engine_game(uint64_t handle);

// Encoding layout, planes of shape (H, W), 1.0 where set:
// 0: own body (head included)
// 1: own head
// 2: opponent body
// 3: food
py::array_t<float> encode_state(uint64_t handle, int player_id) {
  const copperhead::GameState& game = engine_game(handle);
  const copperhead::Snake* own = game.snake(player_id);
  if (!own) throw std::invalid_argument("unknown player id: " + std::to_string(player_id));
  const copperhead::Snake* other = nullptr;
  for (const auto& [id, snake] : game.snakes()) {
    if (id != player_id) other = &snake;
  }

  const ssize_t H = game.height();
  const ssize_t W = game.width();
  auto out = py::array_t<float>({(ssize_t)4, H, W});
  auto O = out.mutable_unchecked<3>();
  for (ssize_t c=0;c<4;++c)
    for (ssize_t y=0;y<H;++y)
      for (ssize_t x=0;x<W;++x) O(c,y,x) = 0.0f;

  auto mark = [&](int plane, const copperhead::Point& p) {
    if (game.inBounds(p)) O(plane, p.y, p.x) = 1.0f;
  };
  for (const auto& p : own->body()) mark(0, p);
  if (own->length() > 0) mark(1, own->head());
  if (other) {
    for (const auto& p : other->body()) mark(2, p);
  }
  if (game.food()) mark(3, *game.food());
  return out;
}
