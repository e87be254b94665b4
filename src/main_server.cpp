#include "BotSpawner.hpp"
#include "Log.hpp"
#include "MatchRecorder.hpp"
#include "RoomManager.hpp"
#include "Server.hpp"
#include "ServerConfig.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>

using namespace copperhead;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);

    ServerConfig config;
    try {
        config = loadServerConfig(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n" << serverUsage(args[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << serverUsage(args[0]);
        return 0;
    }

    log::setLevel(config.quiet ? log::Level::Warning : log::Level::Info);
    if (!config.quiet && !config.quietStartup) std::cout << connectionBanner(config) << std::flush;

    // Writes to a vanished client fail with EPIPE instead of raising SIGPIPE.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        boost::asio::io_context io;

        ProcessBotSpawner spawner(config.botPath, config.botServerUrl());
        std::unique_ptr<MatchRecorder> recorder;
        if (!config.resultsLog.empty()) {
            recorder = std::make_unique<MatchRecorder>(config.resultsLog);
            log::info() << "Recording results to " << config.resultsLog;
        }

        ManagerOptions options;
        options.maxRooms = config.maxRooms;
        options.room.gridWidth = config.gridWidth;
        options.room.gridHeight = config.gridHeight;
        options.room.tickInterval = config.tickInterval;

        RoomManager manager(io, options, &spawner, recorder.get(),
                            config.seed.value_or(std::random_device{}()));
        Server server(io, manager);
        server.listen(config.host, config.port);
        log::info() << "Listening on " << config.host << ":" << server.port();

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            log::info() << "Received signal " << signal << ", shutting down";
            server.stop();
            manager.shutdown();
            spawner.terminateAll();
            io.stop();
        });

        io.run();
        manager.shutdown();
    } catch (const boost::system::system_error& e) {
        log::error() << "Server failed: " << e.what();
        return 1;
    } catch (const std::runtime_error& e) {
        log::error() << e.what();
        return 1;
    }
    return 0;
}
