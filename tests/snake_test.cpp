#include "Snake.hpp"

#include <gtest/gtest.h>

using namespace copperhead;

TEST(SnakeTest, StartsWithLengthOne) {
    Snake snake(1, {5, 10}, Direction::Right);
    EXPECT_EQ(snake.length(), 1u);
    EXPECT_EQ(snake.head(), (Point{5, 10}));
    EXPECT_TRUE(snake.alive());
    EXPECT_EQ(snake.direction(), Direction::Right);
}

TEST(SnakeTest, MoveShiftsHeadAndDropsTail) {
    Snake snake(1, {5, 10}, Direction::Right);
    snake.move(false);
    EXPECT_EQ(snake.head(), (Point{6, 10}));
    EXPECT_EQ(snake.length(), 1u);
}

TEST(SnakeTest, GrowKeepsTail) {
    Snake snake(1, {5, 10}, Direction::Right);
    snake.move(true);
    snake.move(true);
    ASSERT_EQ(snake.length(), 3u);
    EXPECT_EQ(snake.body()[0], (Point{7, 10}));
    EXPECT_EQ(snake.body()[2], (Point{5, 10}));
}

TEST(SnakeTest, RejectsRepeatAndReversal) {
    Snake snake(1, {5, 10}, Direction::Right);
    snake.queueDirection(Direction::Right);
    snake.queueDirection(Direction::Left);
    EXPECT_TRUE(snake.pendingInputs().empty());

    snake.queueDirection(Direction::Up);
    snake.queueDirection(Direction::Down);  // reverses the queued "up"
    ASSERT_EQ(snake.pendingInputs().size(), 1u);
    EXPECT_EQ(snake.pendingInputs().front(), Direction::Up);
}

TEST(SnakeTest, QueueKeepsNewestThree) {
    Snake snake(1, {5, 10}, Direction::Right);
    snake.queueDirection(Direction::Up);
    snake.queueDirection(Direction::Left);
    snake.queueDirection(Direction::Down);
    snake.queueDirection(Direction::Right);
    ASSERT_EQ(snake.pendingInputs().size(), 3u);
    EXPECT_EQ(snake.pendingInputs()[0], Direction::Left);
    EXPECT_EQ(snake.pendingInputs()[2], Direction::Right);
}

TEST(SnakeTest, QueuedTurnsApplyOnePerMove) {
    Snake snake(1, {5, 10}, Direction::Right);
    snake.queueDirection(Direction::Up);
    snake.queueDirection(Direction::Left);

    snake.move(false);
    EXPECT_EQ(snake.direction(), Direction::Up);
    EXPECT_EQ(snake.head(), (Point{5, 9}));

    snake.move(false);
    EXPECT_EQ(snake.direction(), Direction::Left);
    EXPECT_EQ(snake.head(), (Point{4, 9}));
}

TEST(SnakeTest, PeekDoesNotConsumeInput) {
    Snake snake(1, {5, 10}, Direction::Right);
    snake.queueDirection(Direction::Down);
    EXPECT_EQ(snake.peekNextHead(), (Point{5, 11}));
    EXPECT_EQ(snake.pendingInputs().size(), 1u);
    snake.move(false);
    EXPECT_EQ(snake.head(), (Point{5, 11}));
}

TEST(SnakeTest, OccupiesHonoursSkip) {
    Snake snake = Snake::fromParts(2, {{3, 3}, {3, 4}, {3, 5}}, Direction::Up, true);
    EXPECT_TRUE(snake.occupies({3, 3}));
    EXPECT_FALSE(snake.occupies({3, 3}, 1));
    EXPECT_TRUE(snake.occupies({3, 5}, 1));
    EXPECT_FALSE(snake.occupies({4, 4}));
}

TEST(SnakeTest, FromPartsRestoresState) {
    Snake snake = Snake::fromParts(2, {{1, 1}, {2, 1}}, Direction::Left, false);
    EXPECT_EQ(snake.playerId(), 2);
    EXPECT_EQ(snake.length(), 2u);
    EXPECT_EQ(snake.head(), (Point{1, 1}));
    EXPECT_FALSE(snake.alive());
}

TEST(DirectionTest, ParsesWireNames) {
    EXPECT_EQ(parseDirection("up"), Direction::Up);
    EXPECT_EQ(parseDirection("right"), Direction::Right);
    EXPECT_FALSE(parseDirection("UP").has_value());
    EXPECT_FALSE(parseDirection("").has_value());
    for (Direction dir : ALL_DIRECTIONS) {
        EXPECT_EQ(parseDirection(toString(dir)), dir);
        EXPECT_EQ(opposite(opposite(dir)), dir);
    }
}

TEST(DirectionTest, YGrowsDownwards) {
    EXPECT_EQ(step({4, 4}, Direction::Up), (Point{4, 3}));
    EXPECT_EQ(step({4, 4}, Direction::Down), (Point{4, 5}));
}
