#include "BotClient.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace copperhead;

namespace {

json runningState(const GameState& game) {
    GameState copy = game;
    copy.setRunning(true);
    return message::state(copy, {{1, 0}, {2, 0}}, {{1, "a"}, {2, "b"}}, 1);
}

} // namespace

TEST(ServerUrlTest, AppendsJoinToBasePath) {
    ServerAddress address = parseServerUrl("ws://localhost:8000/ws/");
    EXPECT_EQ(address.host, "localhost");
    EXPECT_EQ(address.port, "8000");
    EXPECT_EQ(address.path, "/ws/join");
}

TEST(ServerUrlTest, DefaultsAndExplicitPaths) {
    EXPECT_EQ(parseServerUrl("ws://example.com").port, "80");
    EXPECT_EQ(parseServerUrl("ws://example.com").path, "/ws/join");
    EXPECT_EQ(parseServerUrl("ws://127.0.0.1:9000/ws/join").path, "/ws/join");
    EXPECT_EQ(parseServerUrl("ws://127.0.0.1:9000/ws/2").path, "/ws/2");
}

TEST(ServerUrlTest, RejectsUnsupportedUrls) {
    EXPECT_THROW(parseServerUrl("wss://example.com/ws/"), std::invalid_argument);
    EXPECT_THROW(parseServerUrl("http://example.com/"), std::invalid_argument);
    EXPECT_THROW(parseServerUrl("ws:///ws/"), std::invalid_argument);
    EXPECT_THROW(parseServerUrl("ws://host:/ws/"), std::invalid_argument);
}

TEST(BotClientTest, NeedsPolicy) {
    EXPECT_THROW(BotClient(BotOptions{}, nullptr), std::invalid_argument);
}

TEST(BotClientTest, NameFollowsDifficulty) {
    BotOptions options;
    options.difficulty = 7;
    EXPECT_EQ(BotClient(options, std::make_unique<RandomPolicy>(1)).name(), "CopperBot L7");
    options.name = "Slither";
    EXPECT_EQ(BotClient(options, std::make_unique<RandomPolicy>(1)).name(), "Slither");
}

TEST(BotClientTest, ReadiesAfterJoining) {
    BotClient bot(BotOptions{}, std::make_unique<RandomPolicy>(1));
    auto replies = bot.handleMessage(message::joined(4, 2));
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0], (json{{"action", "ready"}, {"mode", "two_player"}, {"name", "CopperBot L5"}}));
    EXPECT_EQ(bot.playerId(), 2);
    EXPECT_EQ(bot.roomId(), 4);
}

TEST(BotClientTest, AnswersRunningStateWithMove) {
    BotClient bot(BotOptions{}, std::make_unique<RandomPolicy>(1));
    bot.handleMessage(message::joined(1, 1));

    GameState game(30, 20, 1);
    game.setSnake(Snake::fromParts(1, {{0, 0}, {0, 1}, {0, 2}}, Direction::Up, true));
    auto replies = bot.handleMessage(runningState(game));
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0], (json{{"action", "move"}, {"direction", "right"}}));
}

TEST(BotClientTest, IgnoresStatesItCannotPlay) {
    BotClient bot(BotOptions{}, std::make_unique<RandomPolicy>(1));
    GameState game(30, 20, 1);

    // Not joined yet.
    EXPECT_TRUE(bot.handleMessage(runningState(game)).empty());

    bot.handleMessage(message::joined(1, 2));
    // Game not running.
    EXPECT_TRUE(bot.handleMessage(message::state(game, {}, {}, 1)).empty());

    // Own snake dead.
    GameState dead(30, 20, 1);
    dead.snake(2)->kill();
    EXPECT_TRUE(bot.handleMessage(runningState(dead)).empty());

    // Malformed game.
    json broken = runningState(game);
    broken["game"]["snakes"]["2"]["body"] = "nope";
    EXPECT_TRUE(bot.handleMessage(broken).empty());
}

TEST(BotClientTest, ReadiesAgainAfterGameOver) {
    BotClient bot(BotOptions{}, std::make_unique<RandomPolicy>(1));
    bot.handleMessage(message::joined(1, 2));

    auto replies = bot.handleMessage(message::gameover(2, {{1, 0}, {2, 1}}, {}, 1));
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0]["action"], "ready");
    EXPECT_EQ(bot.gamesPlayed(), 1u);
    EXPECT_EQ(bot.gamesWon(), 1u);

    bot.handleMessage(message::gameover(std::nullopt, {}, {}, 1));
    EXPECT_EQ(bot.gamesPlayed(), 2u);
    EXPECT_EQ(bot.gamesWon(), 1u);
}

TEST(BotClientTest, StopsAfterMaxGames) {
    BotOptions options;
    options.maxGames = 1;
    BotClient bot(options, std::make_unique<RandomPolicy>(1));
    bot.handleMessage(message::joined(1, 1));
    EXPECT_TRUE(bot.handleMessage(message::gameover(2, {}, {}, 1)).empty());
    EXPECT_TRUE(bot.finished());

    GameState game(30, 20, 1);
    EXPECT_TRUE(bot.handleMessage(runningState(game)).empty());
}

TEST(BotClientTest, OtherMessagesNeedNoReply) {
    BotClient bot(BotOptions{}, std::make_unique<RandomPolicy>(1));
    EXPECT_TRUE(bot.handleMessage(message::waiting("Waiting for Player 2...")).empty());
    EXPECT_TRUE(bot.handleMessage(message::start(GameMode::TwoPlayer, 1)).empty());
    EXPECT_TRUE(bot.handleMessage(json{{"type", "mystery"}}).empty());
    EXPECT_TRUE(bot.handleMessage(json::object()).empty());
}
