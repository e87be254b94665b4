#include "ServerConfig.hpp"

#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>

using namespace copperhead;

namespace {

// Environment backed by a map instead of the process environment.
EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    auto shared = std::make_shared<std::map<std::string, std::string>>(std::move(vars));
    return [shared](const char* name) -> const char* {
        auto it = shared->find(name);
        return it == shared->end() ? nullptr : it->second.c_str();
    };
}

ServerConfig load(std::vector<std::string> args, std::map<std::string, std::string> env = {}) {
    args.insert(args.begin(), "/opt/copperhead/bin/copperhead_server");
    return loadServerConfig(args, fakeEnv(std::move(env)));
}

} // namespace

TEST(ServerConfigTest, Defaults) {
    ServerConfig config = load({});
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.gridWidth, 30);
    EXPECT_EQ(config.gridHeight, 20);
    EXPECT_EQ(config.tickInterval, std::chrono::milliseconds(150));
    EXPECT_EQ(config.maxRooms, 10);
    EXPECT_EQ(config.botPath, "/opt/copperhead/bin/copperbot");
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_FALSE(config.quiet);
    EXPECT_EQ(config.publicUrl(), "ws://localhost:8000/ws/");
    EXPECT_EQ(config.botServerUrl(), "ws://127.0.0.1:8000/ws/");
}

TEST(ServerConfigTest, CommandLineOverrides) {
    ServerConfig config = load({"--host", "127.0.0.1", "--port", "9001", "--grid-width", "40",
                                "--grid-height", "25", "--tick-rate", "0.1", "--max-rooms", "3",
                                "--bot-path", "/usr/bin/copperbot", "--results-log", "games.csv",
                                "--seed", "42", "-q"});
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9001);
    EXPECT_EQ(config.gridWidth, 40);
    EXPECT_EQ(config.gridHeight, 25);
    EXPECT_EQ(config.tickInterval, std::chrono::milliseconds(100));
    EXPECT_EQ(config.maxRooms, 3);
    EXPECT_EQ(config.botPath, "/usr/bin/copperbot");
    EXPECT_EQ(config.resultsLog, "games.csv");
    EXPECT_EQ(config.seed, 42u);
    EXPECT_TRUE(config.quiet);
    EXPECT_EQ(config.botServerUrl(), "ws://127.0.0.1:9001/ws/");
}

TEST(ServerConfigTest, BotPathNextToRelativeProgram) {
    ServerConfig config = loadServerConfig({"copperhead_server"}, fakeEnv({}));
    EXPECT_EQ(config.botPath, "./copperbot");
}

TEST(ServerConfigTest, RejectsBadValues) {
    EXPECT_THROW(load({"--port"}), std::invalid_argument);
    EXPECT_THROW(load({"--port", "eighty"}), std::invalid_argument);
    EXPECT_THROW(load({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(load({"--grid-width", "11"}), std::invalid_argument);
    EXPECT_THROW(load({"--tick-rate", "0"}), std::invalid_argument);
    EXPECT_THROW(load({"--tick-rate", "fast"}), std::invalid_argument);
    EXPECT_THROW(load({"--max-rooms", "0"}), std::invalid_argument);
    EXPECT_THROW(load({"--colour"}), std::invalid_argument);
}

TEST(ServerConfigTest, HelpFlag) {
    EXPECT_TRUE(load({"--help"}).showHelp);
    EXPECT_TRUE(load({"-h"}).showHelp);
    EXPECT_NE(serverUsage("copperhead_server").find("--tick-rate"), std::string::npos);
}

TEST(ServerConfigTest, CodespaceUrl) {
    ServerConfig config = load({"--port", "8000"}, {{"CODESPACE_NAME", "fuzzy-robot"}});
    EXPECT_TRUE(config.inCodespace());
    EXPECT_EQ(config.publicUrl(), "wss://fuzzy-robot-8000.app.github.dev/ws/");
    EXPECT_EQ(config.botServerUrl(), "ws://127.0.0.1:8000/ws/");

    config = load({}, {{"CODESPACE_NAME", "fuzzy-robot"},
                       {"GITHUB_CODESPACES_PORT_FORWARDING_DOMAIN", "preview.example.dev"}});
    EXPECT_EQ(config.publicUrl(), "wss://fuzzy-robot-8000.preview.example.dev/ws/");
}

TEST(ServerConfigTest, QuietStartupFromEnvironment) {
    auto config = load({}, {{"COPPERHEAD_QUIET_STARTUP", "1"}});
    EXPECT_TRUE(config.quietStartup);
    // Only the banner is skipped; logging stays at info.
    EXPECT_FALSE(config.quiet);
    EXPECT_FALSE(load({}, {{"COPPERHEAD_QUIET_STARTUP", "0"}}).quietStartup);
    EXPECT_FALSE(load({}, {{"COPPERHEAD_QUIET_STARTUP", ""}}).quietStartup);
    EXPECT_TRUE(load({"--quiet"}, {{"COPPERHEAD_QUIET_STARTUP", "1"}}).quiet);
}

TEST(ServerConfigTest, BannerShowsConnectionUrl) {
    ServerConfig config = load({"--port", "8123"});
    std::string banner = connectionBanner(config);
    EXPECT_NE(banner.find("ws://localhost:8123/ws/"), std::string::npos);
    EXPECT_NE(banner.find("https://revodavid.github.io/copperhead-client/"), std::string::npos);
    EXPECT_EQ(banner.find("Make your port PUBLIC"), std::string::npos);

    config = load({}, {{"CODESPACE_NAME", "fuzzy-robot"}});
    EXPECT_NE(connectionBanner(config).find("Make your port PUBLIC"), std::string::npos);
}

TEST(BotConfigTest, Defaults) {
    BotConfig config = loadBotConfig({"copperbot"});
    EXPECT_EQ(config.serverUrl, "ws://localhost:8000/ws/");
    EXPECT_EQ(config.difficulty, 5);
    EXPECT_FALSE(config.arenaGames.has_value());
    EXPECT_FALSE(config.maxGames.has_value());
}

TEST(BotConfigTest, SpawnedBotArguments) {
    BotConfig config = loadBotConfig(
        {"copperbot", "--server", "ws://127.0.0.1:8000/ws/", "--difficulty", "7", "--quiet"});
    EXPECT_EQ(config.serverUrl, "ws://127.0.0.1:8000/ws/");
    EXPECT_EQ(config.difficulty, 7);
    EXPECT_TRUE(config.quiet);
}

TEST(BotConfigTest, DifficultyIsClamped) {
    EXPECT_EQ(loadBotConfig({"copperbot", "--difficulty", "15"}).difficulty, 10);
    EXPECT_EQ(loadBotConfig({"copperbot", "--difficulty", "0"}).difficulty, 1);
    EXPECT_EQ(loadBotConfig({"copperbot", "--opponent", "-2"}).opponentDifficulty, 1);
}

TEST(BotConfigTest, ArenaOptions) {
    BotConfig config = loadBotConfig({"copperbot", "--arena", "50", "--opponent", "8", "--max-ticks", "900",
                                      "--seed", "3", "--games", "2"});
    EXPECT_EQ(config.arenaGames, 50u);
    EXPECT_EQ(config.opponentDifficulty, 8);
    EXPECT_EQ(config.maxTicks, 900u);
    EXPECT_EQ(config.seed, 3u);
    EXPECT_EQ(config.maxGames, 2u);
    EXPECT_THROW(loadBotConfig({"copperbot", "--arena", "0"}), std::invalid_argument);
    EXPECT_THROW(loadBotConfig({"copperbot", "--difficulty"}), std::invalid_argument);
}
