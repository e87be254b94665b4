#pragma once

#include "BotSpawner.hpp"
#include "Channel.hpp"
#include "GameState.hpp"
#include "MatchRecorder.hpp"
#include "Protocol.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <vector>

namespace copperhead {

struct RoomOptions {
    int gridWidth = rules::GRID_WIDTH;
    int gridHeight = rules::GRID_HEIGHT;
    std::chrono::milliseconds tickInterval = rules::TICK_INTERVAL;
};

// One match between two players plus any number of observers. Rooms are
// owned through shared_ptr so the tick timer can detect a destroyed room.
class GameRoom : public std::enable_shared_from_this<GameRoom> {
public:
    GameRoom(int roomId,
             boost::asio::io_context& io,
             RoomOptions options,
             BotSpawner* spawner = nullptr,
             MatchRecorder* recorder = nullptr,
             std::uint32_t seed = std::random_device{}());
    ~GameRoom();

    GameRoom(const GameRoom&) = delete;
    GameRoom& operator=(const GameRoom&) = delete;

    // Called whenever a game starts or ends.
    void setActivityCallback(std::function<void()> callback) { onActivity_ = std::move(callback); }

    int id() const { return roomId_; }

    bool isEmpty() const { return players_.empty(); }
    bool isWaitingForPlayer() const { return players_.size() == 1 && !game_.running(); }
    bool isFull() const { return players_.size() >= 2; }
    bool isActive() const { return game_.running(); }
    std::optional<int> availableSlot() const;

    void connectPlayer(int playerId, ChannelPtr channel);
    void disconnectPlayer(int playerId);

    // Adds the observer and sends it an observer_joined snapshot.
    void connectObserver(ChannelPtr channel);
    bool disconnectObserver(const ChannelPtr& channel);
    bool hasObserver(const ChannelPtr& channel) const;
    const std::vector<ChannelPtr>& observers() const { return observers_; }

    void handleMessage(int playerId, const json& data);

    void startGame();
    // One simulation step; driven by the room timer.
    void tick();

    void broadcast(const json& message);
    void broadcastState();

    // Stops the loop and any bot, and drops references to outside services.
    void shutdown();

    const GameState& game() const { return game_; }
    const WinTable& wins() const { return wins_; }
    const NameTable& names() const { return names_; }
    const std::set<int>& readyPlayers() const { return ready_; }
    GameMode pendingMode() const { return pendingMode_; }
    std::vector<int> playerIds() const;
    bool botRunning() const { return bot_.has_value(); }
    RoomSummary summary() const;

private:
    GameState freshGame();
    void scheduleTick(std::chrono::milliseconds delay);
    void finishGame();
    void handleReady(int playerId, const json& data);
    void spawnBot(int difficulty);
    void stopBot();
    void notifyActivity();
    std::string tag() const;

    int roomId_;
    RoomOptions options_;
    BotSpawner* spawner_;
    MatchRecorder* recorder_;
    std::mt19937 rng_;

    GameState game_;
    std::map<int, ChannelPtr> players_;
    std::vector<ChannelPtr> observers_;
    std::set<int> ready_;
    GameMode pendingMode_ = GameMode::TwoPlayer;
    std::optional<BotHandle> bot_;
    WinTable wins_;
    NameTable names_;

    boost::asio::steady_timer timer_;
    std::function<void()> onActivity_;
};

WinTable freshWins();
NameTable defaultNames();

} // namespace copperhead
