#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <cstdint>
#include <string>

namespace py = pybind11;

// Forward decl from ch_engine.cpp
uint64_t create_engine(uint32_t seed, int width, int height);
void destroy_engine(uint64_t handle);
void engine_reset(uint64_t handle);
bool engine_queue_move(uint64_t handle, int player_id, const std::string& direction);
py::tuple engine_step(uint64_t handle);
std::string engine_state_json(uint64_t handle);
std::string bot_choose_move(uint64_t handle, int player_id, int difficulty, uint32_t seed);
py::dict play_matches(uint32_t seed, int difficulty1, int difficulty2, uint64_t games, uint64_t max_ticks);
// Forward decl: encoding
py::array_t<float> encode_state(uint64_t handle, int player_id);

PYBIND11_MODULE(copperhead_cpp, m) {
  m.doc() = "CopperHead snake simulation for Python bots";

  m.def("create_engine", &create_engine,
        py::arg("seed"), py::arg("width") = 30, py::arg("height") = 20,
        "Create a running game; returns handle (uint64).");
  m.def("destroy_engine", &destroy_engine, py::arg("handle"),
        "Destroy engine by handle.");
  m.def("engine_reset", &engine_reset, py::arg("handle"),
        "Put both snakes back on their start cells and start a new game.");
  m.def("engine_queue_move", &engine_queue_move,
        py::arg("handle"), py::arg("player_id"), py::arg("direction"),
        "Queue 'up'/'down'/'left'/'right' for a player. Returns False if that snake is dead.");
  m.def("engine_step", &engine_step, py::arg("handle"),
        "Advance one tick; returns (running, winner) with winner None for a draw or unfinished game.");
  m.def("engine_state_json", &engine_state_json, py::arg("handle"),
        "Game object as the server sends it in 'state' messages (JSON text).");
  m.def("encode_state", &encode_state, py::arg("handle"), py::arg("player_id"),
        "Encode the board from player_id's view as float32 [4,H,W]: own body, own head, opponent body, food.");
  m.def("bot_choose_move", &bot_choose_move,
        py::arg("handle"), py::arg("player_id"), py::arg("difficulty") = 5, py::arg("seed") = 0,
        "Move the built-in bot of the given difficulty would play.");
  m.def("play_matches", &play_matches,
        py::arg("seed"), py::arg("difficulty1"), py::arg("difficulty2"),
        py::arg("games"), py::arg("max_ticks") = 5000,
        "Play headless bot-vs-bot games; returns {games, wins_1, wins_2, draws, average_ticks}.");
}
