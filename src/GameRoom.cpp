#include "GameRoom.hpp"
#include "Log.hpp"

#include <algorithm>

namespace copperhead {

WinTable freshWins() {
    return {{rules::PLAYER_ONE, 0}, {rules::PLAYER_TWO, 0}};
}

NameTable defaultNames() {
    return {{rules::PLAYER_ONE, "Player 1"}, {rules::PLAYER_TWO, "Player 2"}};
}

GameRoom::GameRoom(int roomId,
                   boost::asio::io_context& io,
                   RoomOptions options,
                   BotSpawner* spawner,
                   MatchRecorder* recorder,
                   std::uint32_t seed)
    : roomId_(roomId),
      options_(options),
      spawner_(spawner),
      recorder_(recorder),
      rng_(seed),
      game_(freshGame()),
      wins_(freshWins()),
      names_(defaultNames()),
      timer_(io) {}

GameRoom::~GameRoom() {
    shutdown();
}

GameState GameRoom::freshGame() {
    return GameState(options_.gridWidth, options_.gridHeight, rng_());
}

std::string GameRoom::tag() const {
    return "[Room " + std::to_string(roomId_) + "] ";
}

std::optional<int> GameRoom::availableSlot() const {
    if (!players_.count(rules::PLAYER_ONE)) return rules::PLAYER_ONE;
    if (!players_.count(rules::PLAYER_TWO)) return rules::PLAYER_TWO;
    return std::nullopt;
}

std::vector<int> GameRoom::playerIds() const {
    std::vector<int> ids;
    for (const auto& [id, channel] : players_) ids.push_back(id);
    return ids;
}

RoomSummary GameRoom::summary() const {
    return RoomSummary{roomId_, names_, wins_};
}

void GameRoom::connectPlayer(int playerId, ChannelPtr channel) {
    players_[playerId] = std::move(channel);
    log::info() << tag() << "Player " << playerId << " connected (" << players_.size() << " player(s))";
    broadcastState();
}

void GameRoom::disconnectPlayer(int playerId) {
    if (!players_.erase(playerId)) return;
    ready_.erase(playerId);
    if (game_.running()) {
        log::info() << tag() << "Game stopped (player disconnected)";
    }
    timer_.cancel();
    stopBot();
    game_ = freshGame();
    pendingMode_ = GameMode::TwoPlayer;
    wins_ = freshWins();
    names_ = defaultNames();
    log::info() << tag() << "Player " << playerId << " disconnected (" << players_.size() << " player(s))";
}

void GameRoom::connectObserver(ChannelPtr channel) {
    observers_.push_back(channel);
    log::info() << tag() << "Observer connected (" << observers_.size() << " observer(s))";
    channel->send(message::observerJoined(roomId_, game_, wins_, names_));
}

bool GameRoom::disconnectObserver(const ChannelPtr& channel) {
    auto it = std::find(observers_.begin(), observers_.end(), channel);
    if (it == observers_.end()) return false;
    observers_.erase(it);
    log::info() << tag() << "Observer disconnected (" << observers_.size() << " observer(s))";
    return true;
}

bool GameRoom::hasObserver(const ChannelPtr& channel) const {
    return std::find(observers_.begin(), observers_.end(), channel) != observers_.end();
}

void GameRoom::handleMessage(int playerId, const json& data) {
    std::string action = stringField(data, "action", "");
    if (action == "move") {
        if (!game_.running()) return;
        auto dir = parseDirection(stringField(data, "direction", ""));
        if (!dir) return;
        if (Snake* snake = game_.snake(playerId)) {
            snake->queueDirection(*dir);
        }
    } else if (action == "ready") {
        handleReady(playerId, data);
    } else {
        log::warn() << tag() << "Ignoring unknown action '" << action << "' from player " << playerId;
    }
}

void GameRoom::handleReady(int playerId, const json& data) {
    std::string modeText = stringField(data, "mode", "two_player");
    auto mode = parseGameMode(modeText);
    // The first ready player picks the mode; a bot joining later does not.
    if (ready_.empty() && mode) {
        pendingMode_ = *mode;
    }

    std::string name = stringField(data, "name", "Player " + std::to_string(playerId));
    names_[playerId] = name;

    if (mode == GameMode::VsAi && !bot_) {
        int difficulty = intField(data, "ai_difficulty").value_or(rules::DEFAULT_DIFFICULTY);
        spawnBot(std::clamp(difficulty, rules::MIN_DIFFICULTY, rules::MAX_DIFFICULTY));
    }

    ready_.insert(playerId);
    log::info() << tag() << name << " ready (mode: " << toString(pendingMode_) << ", ready: " << ready_.size() << ")";

    if (ready_.size() >= 2 && !game_.running()) {
        startGame();
    } else if (ready_.size() < 2) {
        auto it = players_.find(playerId);
        if (it != players_.end()) {
            it->second->send(message::waiting(pendingMode_ == GameMode::VsAi ? "Launching CopperBot..."
                                                                             : "Waiting for Player 2..."));
        }
    }
}

void GameRoom::spawnBot(int difficulty) {
    stopBot();
    if (!spawner_) {
        log::warn() << tag() << "No bot launcher configured, cannot start CopperBot";
        return;
    }
    bot_ = spawner_->spawn(difficulty);
    if (bot_) {
        log::info() << tag() << "CopperBot L" << difficulty << " launched for this room";
    }
}

void GameRoom::stopBot() {
    if (!bot_) return;
    if (spawner_) spawner_->terminate(*bot_);
    bot_.reset();
}

void GameRoom::startGame() {
    game_ = freshGame();
    game_.setMode(pendingMode_);
    game_.setRunning(true);

    log::info() << tag() << "Game started! Mode: " << toString(pendingMode_);
    broadcast(message::start(pendingMode_, roomId_));
    scheduleTick(std::chrono::milliseconds(0));
    notifyActivity();
}

void GameRoom::scheduleTick(std::chrono::milliseconds delay) {
    timer_.expires_after(delay);
    timer_.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->tick();
    });
}

void GameRoom::tick() {
    if (!game_.running()) return;
    game_.update();
    broadcastState();
    if (!game_.running()) {
        finishGame();
        return;
    }
    scheduleTick(options_.tickInterval);
}

void GameRoom::finishGame() {
    auto winner = game_.winner();
    if (winner) {
        wins_[*winner] += 1;
        log::info() << tag() << "Game over! Winner: " << names_[*winner];
    } else {
        log::info() << tag() << "Game over! Draw.";
    }
    broadcast(message::gameover(winner, wins_, names_, roomId_));
    ready_.clear();

    if (recorder_) {
        MatchRecord record;
        record.roomId = roomId_;
        record.mode = game_.mode();
        record.winner = winner;
        record.playerOne = names_[rules::PLAYER_ONE];
        record.playerTwo = names_[rules::PLAYER_TWO];
        if (const Snake* one = game_.snake(rules::PLAYER_ONE)) record.lengthOne = one->length();
        if (const Snake* two = game_.snake(rules::PLAYER_TWO)) record.lengthTwo = two->length();
        record.ticks = game_.ticks();
        try {
            recorder_->record(record);
        } catch (const std::exception& e) {
            log::warn() << tag() << "Failed to record match: " << e.what();
        }
    }
    notifyActivity();
}

void GameRoom::broadcastState() {
    broadcast(message::state(game_, wins_, names_, roomId_));
}

void GameRoom::broadcast(const json& message) {
    for (const auto& [id, channel] : players_) {
        if (channel->isOpen()) channel->send(message);
    }
    for (const auto& channel : observers_) {
        if (channel->isOpen()) channel->send(message);
    }
}

void GameRoom::notifyActivity() {
    if (onActivity_) onActivity_();
}

void GameRoom::shutdown() {
    timer_.cancel();
    stopBot();
    players_.clear();
    observers_.clear();
    spawner_ = nullptr;
    recorder_ = nullptr;
    onActivity_ = nullptr;
}

} // namespace copperhead
