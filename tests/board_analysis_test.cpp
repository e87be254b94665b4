#include "BoardAnalysis.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace copperhead;

namespace {

bool contains(const std::vector<Direction>& moves, Direction dir) {
    return std::find(moves.begin(), moves.end(), dir) != moves.end();
}

// Player 1 in the top-left corner heading up, player 2 out of the way.
GameState cornered() {
    GameState game(30, 20, 1);
    game.setSnake(Snake::fromParts(1, {{0, 0}, {0, 1}, {0, 2}}, Direction::Up, true));
    game.setFood(Point{20, 15});
    return game;
}

} // namespace

TEST(BoardAnalysisTest, LegalMovesExcludeReversal) {
    GameState game(30, 20, 1);
    auto moves = legalMoves(game, 1);
    EXPECT_EQ(moves.size(), 3u);
    EXPECT_FALSE(contains(moves, Direction::Left));
    EXPECT_TRUE(legalMoves(game, 3).empty());
}

TEST(BoardAnalysisTest, SafeMovesAvoidWallsAndBodies) {
    GameState game = cornered();
    auto moves = safeMoves(game, 1);
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_EQ(moves[0], Direction::Right);
}

TEST(BoardAnalysisTest, OwnTailIsFreeUnlessEating) {
    GameState game(30, 20, 1);
    // A 2x2 loop: the head may follow its own tail.
    game.setSnake(Snake::fromParts(1, {{5, 5}, {6, 5}, {6, 6}, {5, 6}}, Direction::Left, true));
    game.setFood(Point{20, 15});
    EXPECT_TRUE(contains(safeMoves(game, 1), Direction::Down));

    game.setFood(Point{5, 6});
    EXPECT_FALSE(contains(safeMoves(game, 1), Direction::Down));
}

TEST(BoardAnalysisTest, DeadSnakeHasNoSafeMoves) {
    GameState game(30, 20, 1);
    game.snake(1)->kill();
    EXPECT_TRUE(safeMoves(game, 1).empty());
}

TEST(BoardAnalysisTest, FloodAreaCountsReachableCells) {
    GameState game(12, 2, 1);
    game.setSnake(Snake::fromParts(1, {{3, 0}, {3, 1}}, Direction::Up, true));
    game.setSnake(Snake::fromParts(2, {{11, 1}}, Direction::Left, true));
    OccupancyGrid grid(game);

    // Left of the wall: columns 0..2 on both rows.
    EXPECT_EQ(floodArea(grid, {0, 0}, 1000), 6);
    // Right of the wall, minus player 2's head.
    EXPECT_EQ(floodArea(grid, {4, 0}, 1000), 15);
    EXPECT_EQ(floodArea(grid, {4, 0}, 5), 5);
    EXPECT_EQ(floodArea(grid, {3, 0}, 1000), 0);
}

TEST(BoardAnalysisTest, PathDistanceRoutesAroundObstacles) {
    GameState game(30, 20, 1);
    game.setSnake(Snake::fromParts(1, {{10, 4}, {10, 5}, {10, 6}}, Direction::Up, true));
    game.setSnake(Snake::fromParts(2, {{25, 18}}, Direction::Left, true));
    OccupancyGrid grid(game);

    EXPECT_EQ(pathDistance(grid, {9, 5}, {11, 5}), 6);
    EXPECT_EQ(pathDistance(grid, {9, 5}, {9, 5}), 0);
    EXPECT_EQ(pathDistance(grid, {9, 5}, {9, 8}), 3);
}

TEST(BoardAnalysisTest, PathDistanceFailsWhenWalledOff) {
    GameState game(12, 2, 1);
    game.setSnake(Snake::fromParts(1, {{3, 0}, {3, 1}}, Direction::Up, true));
    game.setSnake(Snake::fromParts(2, {{11, 1}}, Direction::Left, true));
    OccupancyGrid grid(game);
    EXPECT_FALSE(pathDistance(grid, {0, 0}, {8, 0}).has_value());
}

TEST(BoardAnalysisTest, FirstStepTowardFood) {
    GameState game(30, 20, 1);
    auto dir = firstStepToward(game, 1, {5, 5});
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, Direction::Up);

    dir = firstStepToward(game, 1, {6, 10});
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, Direction::Right);
}

TEST(BoardAnalysisTest, Manhattan) {
    EXPECT_EQ(manhattan({0, 0}, {3, 4}), 7);
    EXPECT_EQ(manhattan({5, 5}, {5, 5}), 0);
}
