#pragma once

#include "BotPolicy.hpp"
#include "Protocol.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace copperhead {

struct ServerAddress {
    std::string host;
    std::string port;
    std::string path;
};

// Accepts ws://host[:port][/path]. A path ending in '/' gets "join" appended,
// so the URL printed by the server can be used as is.
// Throws std::invalid_argument for other schemes or malformed URLs.
ServerAddress parseServerUrl(const std::string& url);

struct BotOptions {
    std::string serverUrl = "ws://localhost:8000/ws/";
    int difficulty = rules::DEFAULT_DIFFICULTY;
    std::string name;
    std::optional<std::uint64_t> maxGames;
};

// CopperBot: joins a room, readies up, and answers every running state with a move.
class BotClient {
public:
    BotClient(BotOptions options, std::unique_ptr<BotPolicy> policy);

    // Plays until the server closes the connection or maxGames is reached.
    // Throws boost::system::system_error on connection failures.
    void run();

    // Frames to send in response to one server message.
    std::vector<json> handleMessage(const json& message);

    std::optional<int> playerId() const { return playerId_; }
    std::optional<int> roomId() const { return roomId_; }
    std::uint64_t gamesPlayed() const { return gamesPlayed_; }
    std::uint64_t gamesWon() const { return gamesWon_; }
    bool finished() const { return finished_; }
    const std::string& name() const { return name_; }

private:
    json readyMessage() const;

    BotOptions options_;
    std::unique_ptr<BotPolicy> policy_;
    std::string name_;
    std::optional<int> playerId_;
    std::optional<int> roomId_;
    std::uint64_t gamesPlayed_ = 0;
    std::uint64_t gamesWon_ = 0;
    bool finished_ = false;
};

} // namespace copperhead
