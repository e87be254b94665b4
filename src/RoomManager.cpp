#include "RoomManager.hpp"
#include "Log.hpp"

#include <algorithm>

namespace copperhead {

RoomManager::RoomManager(boost::asio::io_context& io,
                         ManagerOptions options,
                         BotSpawner* spawner,
                         MatchRecorder* recorder,
                         std::uint32_t seed)
    : io_(io), options_(options), spawner_(spawner), recorder_(recorder), rng_(seed) {}

RoomManager::~RoomManager() {
    shutdown();
}

std::shared_ptr<GameRoom> RoomManager::createRoom() {
    for (int roomId = 1; roomId <= options_.maxRooms; ++roomId) {
        auto it = rooms_.find(roomId);
        if (it != rooms_.end() && !it->second->isEmpty()) continue;
        if (it != rooms_.end()) it->second->shutdown();

        auto room = std::make_shared<GameRoom>(roomId, io_, options_.room, spawner_, recorder_, rng_());
        room->setActivityCallback([this] { broadcastRoomList(); });
        rooms_[roomId] = room;

        auto active = std::count_if(rooms_.begin(), rooms_.end(),
                                    [](const auto& entry) { return !entry.second->isEmpty(); });
        log::info() << "Room " << roomId << " created (" << active << " active rooms)";
        return room;
    }
    return nullptr;
}

std::optional<PlayerSeat> RoomManager::joinPlayer(const ChannelPtr& channel) {
    PlayerSeat seat;
    if (auto waiting = findWaitingRoom()) {
        seat.room = waiting;
        seat.playerId = waiting->availableSlot().value_or(rules::PLAYER_TWO);
    } else if (auto created = createRoom()) {
        seat.room = created;
        seat.playerId = rules::PLAYER_ONE;
    } else {
        log::warn() << "Server full, rejecting player";
        channel->close(rules::CLOSE_SERVER_FULL, "Server full - no room available");
        return std::nullopt;
    }

    seat.room->connectPlayer(seat.playerId, channel);
    channel->send(message::joined(seat.room->id(), seat.playerId));
    return seat;
}

std::optional<PlayerSeat> RoomManager::joinLegacy(int requestedId, const ChannelPtr& channel) {
    if (requestedId != rules::PLAYER_ONE && requestedId != rules::PLAYER_TWO) {
        channel->close(rules::CLOSE_INVALID_PLAYER, "Invalid player_id. Use /ws/join instead.");
        return std::nullopt;
    }

    PlayerSeat seat;
    if (requestedId == rules::PLAYER_TWO) {
        seat.room = findWaitingRoom();
    }
    if (!seat.room) {
        seat.room = createRoom();
        if (!seat.room) {
            channel->close(rules::CLOSE_SERVER_FULL, "Server full");
            return std::nullopt;
        }
        seat.playerId = rules::PLAYER_ONE;
    } else {
        seat.playerId = seat.room->availableSlot().value_or(rules::PLAYER_TWO);
    }

    seat.room->connectPlayer(seat.playerId, channel);
    channel->send(message::joined(seat.room->id(), seat.playerId));
    return seat;
}

void RoomManager::leavePlayer(const PlayerSeat& seat) {
    if (!seat.room) return;
    seat.room->disconnectPlayer(seat.playerId);
    cleanupEmptyRooms();
}

void RoomManager::handlePlayerMessage(const PlayerSeat& seat, const json& data) {
    if (seat.room) seat.room->handleMessage(seat.playerId, data);
}

void RoomManager::observe(const ChannelPtr& channel) {
    if (auto active = findActiveRoom()) {
        active->connectObserver(channel);
        return;
    }
    // Nothing to watch yet: start a bot match and park the observer until it begins.
    channel->send(message::observerLobby("No active games. Launching bot-vs-bot match..."));
    log::info() << "Observer joined - spawning bot-vs-bot match";
    spawnShowcaseMatch();
    lobby_.push_back(channel);
}

void RoomManager::spawnShowcaseMatch() {
    if (!spawner_) {
        log::warn() << "No bot launcher configured, cannot start bot-vs-bot match";
        return;
    }
    std::uniform_int_distribution<int> pick(rules::SHOWCASE_MIN_DIFFICULTY, rules::SHOWCASE_MAX_DIFFICULTY);
    int first = pick(rng_);
    int second = pick(rng_);
    auto one = spawner_->spawn(first);
    auto two = spawner_->spawn(second);
    if (one && two) {
        log::info() << "Spawned bot-vs-bot match: CopperBot L" << first << " (PID: " << one->pid
                    << ") vs CopperBot L" << second << " (PID: " << two->pid << ")";
    } else {
        log::error() << "Failed to spawn bot-vs-bot match";
    }
}

void RoomManager::handleObserverMessage(const ChannelPtr& channel, const json& data) {
    std::string action = stringField(data, "action", "");
    auto current = roomOfObserver(channel);

    if (action == "switch_room") {
        if (!current) return;
        auto targetId = intField(data, "room_id");
        auto target = targetId ? room(*targetId) : nullptr;
        if (target && target->isActive()) {
            current->disconnectObserver(channel);
            target->connectObserver(channel);
            log::info() << "Observer switched to Room " << *targetId;
        } else {
            std::string label = targetId ? std::to_string(*targetId) : std::string("None");
            channel->send(message::error("Room " + label + " not available"));
        }
    } else if (action == "get_rooms") {
        channel->send(message::roomList(activeSummaries(),
                                        current ? std::optional<int>(current->id()) : std::nullopt));
    } else {
        log::warn() << "Ignoring unknown observer action '" << action << "'";
    }
}

void RoomManager::removeObserver(const ChannelPtr& channel) {
    auto it = std::find(lobby_.begin(), lobby_.end(), channel);
    if (it != lobby_.end()) {
        lobby_.erase(it);
        log::info() << "Observer left lobby";
        return;
    }
    if (auto current = roomOfObserver(channel)) {
        current->disconnectObserver(channel);
    }
}

std::shared_ptr<GameRoom> RoomManager::findWaitingRoom() const {
    for (const auto& [id, room] : rooms_) {
        if (room->isWaitingForPlayer()) return room;
    }
    return nullptr;
}

std::shared_ptr<GameRoom> RoomManager::findActiveRoom() const {
    for (const auto& [id, room] : rooms_) {
        if (room->isActive()) return room;
    }
    return nullptr;
}

std::vector<std::shared_ptr<GameRoom>> RoomManager::activeRooms() const {
    std::vector<std::shared_ptr<GameRoom>> active;
    for (const auto& [id, room] : rooms_) {
        if (room->isActive()) active.push_back(room);
    }
    return active;
}

std::shared_ptr<GameRoom> RoomManager::room(int roomId) const {
    auto it = rooms_.find(roomId);
    return it == rooms_.end() ? nullptr : it->second;
}

std::shared_ptr<GameRoom> RoomManager::roomOfObserver(const ChannelPtr& channel) const {
    for (const auto& [id, room] : rooms_) {
        if (room->hasObserver(channel)) return room;
    }
    return nullptr;
}

std::vector<RoomSummary> RoomManager::activeSummaries() const {
    std::vector<RoomSummary> summaries;
    for (const auto& room : activeRooms()) summaries.push_back(room->summary());
    return summaries;
}

void RoomManager::cleanupEmptyRooms() {
    for (auto it = rooms_.begin(); it != rooms_.end();) {
        if (!it->second->isEmpty()) {
            ++it;
            continue;
        }
        // Observers of a closed room wait in the lobby for the next game.
        for (const auto& observer : it->second->observers()) lobby_.push_back(observer);
        it->second->shutdown();
        log::info() << "Room " << it->first << " cleaned up";
        it = rooms_.erase(it);
    }
}

void RoomManager::broadcastRoomList() {
    auto summaries = activeSummaries();

    for (const auto& [id, room] : rooms_) {
        std::vector<ChannelPtr> watchers = room->observers();
        for (const auto& observer : watchers) {
            if (observer->isOpen()) observer->send(message::roomList(summaries, room->id()));
        }
    }

    if (!summaries.empty() && !lobby_.empty()) {
        auto first = activeRooms().front();
        std::vector<ChannelPtr> waiting;
        waiting.swap(lobby_);
        for (const auto& observer : waiting) {
            if (!observer->isOpen()) continue;
            first->connectObserver(observer);
            observer->send(message::roomList(summaries, first->id()));
            log::info() << "Lobby observer joined Room " << first->id();
        }
    } else if (summaries.empty()) {
        for (const auto& observer : lobby_) {
            if (observer->isOpen()) observer->send(message::roomList({}, std::nullopt));
        }
    }
}

json RoomManager::status() const {
    json rooms = json::array();
    for (const auto& [id, room] : rooms_) {
        if (room->isEmpty()) continue;
        rooms.push_back({
            {"room_id", room->id()},
            {"players", room->playerIds()},
            {"observers", room->observers().size()},
            {"game_running", room->game().running()},
            {"waiting_for_player", room->isWaitingForPlayer()},
        });
    }
    return {{"total_rooms", rooms_.size()}, {"rooms", std::move(rooms)}};
}

json RoomManager::activeRoomsJson() const {
    json rooms = json::array();
    for (const auto& summary : activeSummaries()) rooms.push_back(encodeRoomSummary(summary));
    return {{"rooms", std::move(rooms)}};
}

void RoomManager::shutdown() {
    for (auto& [id, room] : rooms_) room->shutdown();
    rooms_.clear();
    lobby_.clear();
}

} // namespace copperhead
