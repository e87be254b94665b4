#pragma once

#include "GameRoom.hpp"

#include <boost/asio/io_context.hpp>

#include <map>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace copperhead {

struct ManagerOptions {
    int maxRooms = rules::MAX_ROOMS;
    RoomOptions room;
};

struct PlayerSeat {
    std::shared_ptr<GameRoom> room;
    int playerId = 0;
};

// Owns the rooms, matches incoming players into them and routes observers.
// Everything here runs on the server's single io_context thread.
class RoomManager {
public:
    RoomManager(boost::asio::io_context& io,
                ManagerOptions options,
                BotSpawner* spawner = nullptr,
                MatchRecorder* recorder = nullptr,
                std::uint32_t seed = std::random_device{}());
    ~RoomManager();

    RoomManager(const RoomManager&) = delete;
    RoomManager& operator=(const RoomManager&) = delete;

    // Seats the player in a waiting room or a new one, then sends "joined".
    // Closes the channel with CLOSE_SERVER_FULL when no room is available.
    std::optional<PlayerSeat> joinPlayer(const ChannelPtr& channel);

    // Old /ws/<id> endpoint. Only ids 1 and 2 are accepted.
    std::optional<PlayerSeat> joinLegacy(int requestedId, const ChannelPtr& channel);

    void leavePlayer(const PlayerSeat& seat);
    void handlePlayerMessage(const PlayerSeat& seat, const json& data);

    void observe(const ChannelPtr& channel);
    void handleObserverMessage(const ChannelPtr& channel, const json& data);
    void removeObserver(const ChannelPtr& channel);

    std::shared_ptr<GameRoom> createRoom();
    std::shared_ptr<GameRoom> findWaitingRoom() const;
    std::shared_ptr<GameRoom> findActiveRoom() const;
    std::vector<std::shared_ptr<GameRoom>> activeRooms() const;
    std::shared_ptr<GameRoom> room(int roomId) const;

    void cleanupEmptyRooms();

    // Pushes the active room list to every observer and seats lobby observers.
    void broadcastRoomList();

    json status() const;
    json activeRoomsJson() const;

    std::size_t roomCount() const { return rooms_.size(); }
    std::size_t lobbySize() const { return lobby_.size(); }

    void shutdown();

private:
    std::vector<RoomSummary> activeSummaries() const;
    std::shared_ptr<GameRoom> roomOfObserver(const ChannelPtr& channel) const;
    void spawnShowcaseMatch();

    boost::asio::io_context& io_;
    ManagerOptions options_;
    BotSpawner* spawner_;
    MatchRecorder* recorder_;
    std::mt19937 rng_;

    std::map<int, std::shared_ptr<GameRoom>> rooms_;
    std::vector<ChannelPtr> lobby_;
};

} // namespace copperhead
