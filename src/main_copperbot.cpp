#include "Arena.hpp"
#include "BotClient.hpp"
#include "BotPolicy.hpp"
#include "Log.hpp"
#include "MatchRecorder.hpp"
#include "ServerConfig.hpp"

#include <boost/system/system_error.hpp>

#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>

using namespace copperhead;

namespace {

int runArena(const BotConfig& config, std::uint32_t seed) {
    std::unique_ptr<MatchRecorder> recorder;
    if (!config.resultsLog.empty()) recorder = std::make_unique<MatchRecorder>(config.resultsLog);

    Arena arena(makePolicyForDifficulty(config.difficulty, seed),
                makePolicyForDifficulty(config.opponentDifficulty, seed ^ 0x9e3779b9u),
                config.gridWidth, config.gridHeight, recorder.get());
    ArenaStats stats = arena.run(*config.arenaGames, seed, config.maxTicks);

    std::cout << "L" << config.difficulty << " vs L" << config.opponentDifficulty << " over "
              << stats.games << " games\n"
              << "  player 1 wins: " << stats.winsOne << "\n"
              << "  player 2 wins: " << stats.winsTwo << "\n"
              << "  draws:         " << stats.draws << "\n"
              << "  avg ticks:     " << std::fixed << std::setprecision(1) << stats.averageTicks() << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);

    BotConfig config;
    try {
        config = loadBotConfig(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n" << botUsage(args[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << botUsage(args[0]);
        return 0;
    }

    log::setLevel(config.quiet ? log::Level::Warning : log::Level::Info);
    std::uint32_t seed = config.seed.value_or(std::random_device{}());

    try {
        if (config.arenaGames) return runArena(config, seed);

        BotOptions options;
        options.serverUrl = config.serverUrl;
        options.difficulty = config.difficulty;
        options.name = config.name;
        options.maxGames = config.maxGames;

        BotClient bot(options, makePolicyForDifficulty(config.difficulty, seed));
        bot.run();
        log::info() << bot.name() << " finished: " << bot.gamesWon() << " wins in " << bot.gamesPlayed()
                    << " games";
    } catch (const boost::system::system_error& e) {
        log::error() << "Connection failed: " << e.what();
        return 1;
    } catch (const std::exception& e) {
        log::error() << e.what();
        return 1;
    }
    return 0;
}
