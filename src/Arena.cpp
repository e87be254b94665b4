#include "Arena.hpp"

#include <stdexcept>

namespace copperhead {

Arena::Arena(std::unique_ptr<BotPolicy> one,
             std::unique_ptr<BotPolicy> two,
             int width,
             int height,
             MatchRecorder* recorder)
    : one_(std::move(one)), two_(std::move(two)), width_(width), height_(height), recorder_(recorder) {
    if (!one_ || !two_) throw std::invalid_argument("arena needs two policies");
}

void Arena::setRecorder(MatchRecorder* recorder) {
    recorder_ = recorder;
}

void Arena::playOut(GameState& game, std::uint64_t maxTicks) {
    game.setRunning(true);
    while (game.running() && game.ticks() < maxTicks) {
        if (Snake* snake = game.snake(rules::PLAYER_ONE); snake && snake->alive()) {
            snake->queueDirection(one_->chooseMove(game, rules::PLAYER_ONE));
        }
        if (Snake* snake = game.snake(rules::PLAYER_TWO); snake && snake->alive()) {
            snake->queueDirection(two_->chooseMove(game, rules::PLAYER_TWO));
        }
        game.update();
    }
}

ArenaStats Arena::run(std::uint64_t games, std::uint32_t seed, std::uint64_t maxTicks) {
    ArenaStats stats;
    for (std::uint64_t i = 0; i < games; ++i) {
        GameState game(width_, height_, seed + static_cast<std::uint32_t>(i));
        playOut(game, maxTicks);

        bool finished = !game.running();
        auto winner = finished ? game.winner() : std::nullopt;
        ++stats.games;
        stats.totalTicks += game.ticks();
        if (winner == rules::PLAYER_ONE) {
            ++stats.winsOne;
        } else if (winner == rules::PLAYER_TWO) {
            ++stats.winsTwo;
        } else {
            ++stats.draws;
        }

        if (recorder_) {
            MatchRecord record;
            record.roomId = 0;
            record.winner = winner;
            record.playerOne = "arena-1";
            record.playerTwo = "arena-2";
            record.lengthOne = game.snake(rules::PLAYER_ONE)->length();
            record.lengthTwo = game.snake(rules::PLAYER_TWO)->length();
            record.ticks = game.ticks();
            recorder_->record(record);
        }
    }
    return stats;
}

} // namespace copperhead
