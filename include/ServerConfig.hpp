#pragma once

#include "Rules.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace copperhead {

using EnvLookup = std::function<const char*(const char*)>;

// Reads the process environment.
const char* systemEnv(const char* name);

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 8000;
    int gridWidth = rules::GRID_WIDTH;
    int gridHeight = rules::GRID_HEIGHT;
    std::chrono::milliseconds tickInterval = rules::TICK_INTERVAL;
    int maxRooms = rules::MAX_ROOMS;
    std::string botPath;
    std::string resultsLog;
    std::optional<std::uint32_t> seed;
    bool quiet = false;
    // Set by a launcher that already printed the connection details.
    bool quietStartup = false;
    bool showHelp = false;

    // GitHub Codespaces forwarding
    std::string codespaceName;
    std::string codespaceDomain = "app.github.dev";

    // URL players paste into the client.
    std::string publicUrl() const;
    // URL handed to spawned bots; always loopback.
    std::string botServerUrl() const;
    bool inCodespace() const { return !codespaceName.empty(); }
};

// Parses command-line arguments (args[0] is the program path) and the
// environment. Throws std::invalid_argument on bad input.
ServerConfig loadServerConfig(const std::vector<std::string>& args, const EnvLookup& env = systemEnv);

std::string serverUsage(const std::string& program);

// copperbot command line. With arenaGames set the bot plays offline
// against a policy of opponentDifficulty instead of connecting.
struct BotConfig {
    std::string serverUrl = "ws://localhost:8000/ws/";
    int difficulty = rules::DEFAULT_DIFFICULTY;
    std::string name;
    std::optional<std::uint32_t> seed;
    std::optional<std::uint64_t> maxGames;
    bool quiet = false;
    bool showHelp = false;

    std::optional<std::uint64_t> arenaGames;
    int opponentDifficulty = rules::DEFAULT_DIFFICULTY;
    std::uint64_t maxTicks = 5000;
    int gridWidth = rules::GRID_WIDTH;
    int gridHeight = rules::GRID_HEIGHT;
    std::string resultsLog;
};

// Out-of-range difficulties are clamped like the server clamps ai_difficulty.
BotConfig loadBotConfig(const std::vector<std::string>& args);

std::string botUsage(const std::string& program);

// Startup text with the connection URL, shown unless quiet or quietStartup.
std::string connectionBanner(const ServerConfig& config);

} // namespace copperhead
