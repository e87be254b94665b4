#include "Protocol.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace copperhead {

namespace {

json optionalInt(std::optional<int> value) {
    return value ? json(*value) : json(nullptr);
}

Point decodePoint(const json& data) {
    if (!data.is_array() || data.size() != 2 || !data[0].is_number_integer() ||
        !data[1].is_number_integer()) {
        throw std::invalid_argument("cell must be an [x, y] integer pair");
    }
    return {data[0].get<int>(), data[1].get<int>()};
}

} // namespace

json encodePoint(const Point& p) {
    return json::array({p.x, p.y});
}

json encodeSnake(const Snake& snake) {
    json body = json::array();
    for (const Point& p : snake.body()) body.push_back(encodePoint(p));
    return {
        {"player_id", snake.playerId()},
        {"body", std::move(body)},
        {"direction", toString(snake.direction())},
        {"alive", snake.alive()},
    };
}

json encodeGame(const GameState& game) {
    json snakes = json::object();
    for (const auto& [id, snake] : game.snakes()) {
        snakes[std::to_string(id)] = encodeSnake(snake);
    }
    return {
        {"mode", toString(game.mode())},
        {"grid", {{"width", game.width()}, {"height", game.height()}}},
        {"snakes", std::move(snakes)},
        {"food", game.food() ? encodePoint(*game.food()) : json(nullptr)},
        {"running", game.running()},
        {"winner", optionalInt(game.winner())},
    };
}

GameState decodeGame(const json& data) {
    if (!data.is_object()) throw std::invalid_argument("game must be an object");
    try {
        const json& grid = data.at("grid");
        GameState game(grid.at("width").get<int>(), grid.at("height").get<int>(), 0);
        if (auto mode = parseGameMode(stringField(data, "mode", "two_player"))) {
            game.setMode(*mode);
        }
        for (const auto& [key, entry] : data.at("snakes").items()) {
            std::vector<Point> body;
            for (const json& cell : entry.at("body")) body.push_back(decodePoint(cell));
            auto dir = parseDirection(entry.at("direction").get<std::string>());
            if (!dir) throw std::invalid_argument("unknown direction in snake " + key);
            game.setSnake(Snake::fromParts(entry.at("player_id").get<int>(), std::move(body), *dir,
                                           entry.at("alive").get<bool>()));
        }
        const json& food = data.at("food");
        game.setFood(food.is_null() ? std::nullopt : std::optional<Point>(decodePoint(food)));
        game.setRunning(data.value("running", false));
        return game;
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed game: ") + e.what());
    }
}

json encodeWins(const WinTable& wins) {
    json out = json::object();
    for (const auto& [id, count] : wins) out[std::to_string(id)] = count;
    return out;
}

json encodeNames(const NameTable& names) {
    json out = json::object();
    for (const auto& [id, name] : names) out[std::to_string(id)] = name;
    return out;
}

json encodeRoomSummary(const RoomSummary& summary) {
    return {
        {"room_id", summary.roomId},
        {"names", encodeNames(summary.names)},
        {"wins", encodeWins(summary.wins)},
    };
}

std::optional<json> parseMessage(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) return std::nullopt;
    return data;
}

std::string stringField(const json& data, const char* key, const std::string& fallback) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::optional<int> intField(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number()) return std::nullopt;
    double value = it->get<double>();
    if (std::isnan(value)) return std::nullopt;
    // Out-of-range numbers saturate at the int limits.
    if (value >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    if (value <= static_cast<double>(std::numeric_limits<int>::min())) {
        return std::numeric_limits<int>::min();
    }
    return static_cast<int>(value);
}

namespace message {

json joined(int roomId, int playerId) {
    return {{"type", "joined"}, {"room_id", roomId}, {"player_id", playerId}};
}

json state(const GameState& game, const WinTable& wins, const NameTable& names, int roomId) {
    return {
        {"type", "state"},
        {"game", encodeGame(game)},
        {"wins", encodeWins(wins)},
        {"names", encodeNames(names)},
        {"room_id", roomId},
    };
}

json start(GameMode mode, int roomId) {
    return {{"type", "start"}, {"mode", toString(mode)}, {"room_id", roomId}};
}

json gameover(std::optional<int> winner, const WinTable& wins, const NameTable& names, int roomId) {
    return {
        {"type", "gameover"},
        {"winner", optionalInt(winner)},
        {"wins", encodeWins(wins)},
        {"names", encodeNames(names)},
        {"room_id", roomId},
    };
}

json waiting(const std::string& text) {
    return {{"type", "waiting"}, {"message", text}};
}

json observerJoined(int roomId, const GameState& game, const WinTable& wins, const NameTable& names) {
    return {
        {"type", "observer_joined"},
        {"room_id", roomId},
        {"game", encodeGame(game)},
        {"wins", encodeWins(wins)},
        {"names", encodeNames(names)},
    };
}

json observerLobby(const std::string& text) {
    return {{"type", "observer_lobby"}, {"message", text}};
}

json roomList(const std::vector<RoomSummary>& rooms, std::optional<int> currentRoom) {
    json list = json::array();
    for (const auto& room : rooms) list.push_back(encodeRoomSummary(room));
    return {{"type", "room_list"}, {"rooms", std::move(list)}, {"current_room", optionalInt(currentRoom)}};
}

json error(const std::string& text) {
    return {{"type", "error"}, {"message", text}};
}

json move(Direction dir) {
    return {{"action", "move"}, {"direction", toString(dir)}};
}

json ready(GameMode mode, const std::string& name, std::optional<int> aiDifficulty) {
    json out = {{"action", "ready"}, {"mode", toString(mode)}, {"name", name}};
    if (aiDifficulty) out["ai_difficulty"] = *aiDifficulty;
    return out;
}

} // namespace message

} // namespace copperhead
