#pragma once

#include "GameState.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace copperhead {

using json = nlohmann::json;

using WinTable = std::map<int, int>;
using NameTable = std::map<int, std::string>;

struct RoomSummary {
    int roomId = 0;
    NameTable names;
    WinTable wins;
};

json encodePoint(const Point& p);
json encodeSnake(const Snake& snake);
json encodeGame(const GameState& game);

// Inverse of encodeGame. Throws std::invalid_argument on malformed input.
GameState decodeGame(const json& data);

json encodeWins(const WinTable& wins);
json encodeNames(const NameTable& names);
json encodeRoomSummary(const RoomSummary& summary);

// Parses a client frame. Returns nullopt unless the text is a JSON object.
std::optional<json> parseMessage(const std::string& text);

// Field lookups that fall back instead of throwing on missing or mistyped values.
std::string stringField(const json& data, const char* key, const std::string& fallback);
std::optional<int> intField(const json& data, const char* key);

namespace message {

json joined(int roomId, int playerId);
json state(const GameState& game, const WinTable& wins, const NameTable& names, int roomId);
json start(GameMode mode, int roomId);
json gameover(std::optional<int> winner, const WinTable& wins, const NameTable& names, int roomId);
json waiting(const std::string& text);
json observerJoined(int roomId, const GameState& game, const WinTable& wins, const NameTable& names);
json observerLobby(const std::string& text);
json roomList(const std::vector<RoomSummary>& rooms, std::optional<int> currentRoom);
json error(const std::string& text);

// Client -> server
json move(Direction dir);
json ready(GameMode mode, const std::string& name, std::optional<int> aiDifficulty = std::nullopt);

} // namespace message

} // namespace copperhead
