#include "ServerConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace copperhead {

namespace {

constexpr const char* CLIENT_URL = "https://revodavid.github.io/copperhead-client/";

long parseNumber(const std::string& flag, const std::string& text, long min, long max) {
    std::size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    if (value < min || value > max) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(min) + " and " +
                                    std::to_string(max));
    }
    return value;
}

std::chrono::milliseconds parseSeconds(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    double seconds = 0.0;
    try {
        seconds = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects seconds, got '" + text + "'");
    }
    if (used != text.size() || seconds < 0.01 || seconds > 10.0) {
        throw std::invalid_argument(flag + " must be between 0.01 and 10 seconds");
    }
    return std::chrono::milliseconds(static_cast<long>(seconds * 1000.0 + 0.5));
}

std::string siblingPath(const std::string& program, const std::string& name) {
    auto slash = program.find_last_of('/');
    if (slash == std::string::npos) return "./" + name;
    return program.substr(0, slash + 1) + name;
}

bool truthy(const char* value) {
    return value && value[0] != '\0' && std::string(value) != "0";
}

} // namespace

const char* systemEnv(const char* name) {
    return std::getenv(name);
}

std::string ServerConfig::publicUrl() const {
    if (inCodespace()) {
        return "wss://" + codespaceName + "-" + std::to_string(port) + "." + codespaceDomain + "/ws/";
    }
    return "ws://localhost:" + std::to_string(port) + "/ws/";
}

std::string ServerConfig::botServerUrl() const {
    return "ws://127.0.0.1:" + std::to_string(port) + "/ws/";
}

ServerConfig loadServerConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    ServerConfig config;
    std::string program = args.empty() ? "copperhead_server" : args.front();
    config.botPath = siblingPath(program, "copperbot");

    if (const char* name = env("CODESPACE_NAME")) config.codespaceName = name;
    if (const char* domain = env("GITHUB_CODESPACES_PORT_FORWARDING_DOMAIN")) {
        if (domain[0] != '\0') config.codespaceDomain = domain;
    }
    config.quietStartup = truthy(env("COPPERHEAD_QUIET_STARTUP"));

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw std::invalid_argument(arg + " requires a value");
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--host") {
            config.host = value();
        } else if (arg == "--port") {
            config.port = static_cast<unsigned short>(parseNumber(arg, value(), 1, 65535));
        } else if (arg == "--grid-width") {
            config.gridWidth = static_cast<int>(parseNumber(arg, value(), 12, 200));
        } else if (arg == "--grid-height") {
            config.gridHeight = static_cast<int>(parseNumber(arg, value(), 2, 200));
        } else if (arg == "--tick-rate") {
            config.tickInterval = parseSeconds(arg, value());
        } else if (arg == "--max-rooms") {
            config.maxRooms = static_cast<int>(parseNumber(arg, value(), 1, 1000));
        } else if (arg == "--bot-path") {
            config.botPath = value();
        } else if (arg == "--results-log") {
            config.resultsLog = value();
        } else if (arg == "--seed") {
            config.seed = static_cast<std::uint32_t>(parseNumber(arg, value(), 0, 4294967295L));
        } else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    return config;
}

std::string serverUsage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --host ADDR          listen address (default 0.0.0.0)\n"
        << "  --port N             listen port (default 8000)\n"
        << "  --grid-width N       grid width (default " << rules::GRID_WIDTH << ")\n"
        << "  --grid-height N      grid height (default " << rules::GRID_HEIGHT << ")\n"
        << "  --tick-rate SECONDS  time between updates (default 0.15)\n"
        << "  --max-rooms N        concurrent rooms (default " << rules::MAX_ROOMS << ")\n"
        << "  --bot-path PATH      copperbot executable (default: next to the server)\n"
        << "  --results-log PATH   append finished games to a CSV file\n"
        << "  --seed N             seed for food placement and bot matches\n"
        << "  --quiet              warnings and errors only\n";
    return out.str();
}

BotConfig loadBotConfig(const std::vector<std::string>& args) {
    BotConfig config;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw std::invalid_argument(arg + " requires a value");
            return args[++i];
        };
        auto difficulty = [&]() {
            long d = parseNumber(arg, value(), -1000000, 1000000);
            return static_cast<int>(std::clamp<long>(d, rules::MIN_DIFFICULTY, rules::MAX_DIFFICULTY));
        };

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--server") {
            config.serverUrl = value();
        } else if (arg == "--difficulty") {
            config.difficulty = difficulty();
        } else if (arg == "--name") {
            config.name = value();
        } else if (arg == "--seed") {
            config.seed = static_cast<std::uint32_t>(parseNumber(arg, value(), 0, 4294967295L));
        } else if (arg == "--games") {
            config.maxGames = static_cast<std::uint64_t>(parseNumber(arg, value(), 1, 1000000000L));
        } else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        } else if (arg == "--arena") {
            config.arenaGames = static_cast<std::uint64_t>(parseNumber(arg, value(), 1, 1000000000L));
        } else if (arg == "--opponent") {
            config.opponentDifficulty = difficulty();
        } else if (arg == "--max-ticks") {
            config.maxTicks = static_cast<std::uint64_t>(parseNumber(arg, value(), 1, 1000000000L));
        } else if (arg == "--grid-width") {
            config.gridWidth = static_cast<int>(parseNumber(arg, value(), 12, 200));
        } else if (arg == "--grid-height") {
            config.gridHeight = static_cast<int>(parseNumber(arg, value(), 2, 200));
        } else if (arg == "--results-log") {
            config.resultsLog = value();
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    return config;
}

std::string botUsage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --server URL         server to join (default ws://localhost:8000/ws/)\n"
        << "  --difficulty N       1-10 (default " << rules::DEFAULT_DIFFICULTY << ")\n"
        << "  --name NAME          display name (default CopperBot L<difficulty>)\n"
        << "  --games N            disconnect after N games\n"
        << "  --seed N             seed for the move policy\n"
        << "  --quiet              warnings and errors only\n"
        << "\nOffline arena:\n"
        << "  --arena N            play N local games instead of connecting\n"
        << "  --opponent N         opponent difficulty (default " << rules::DEFAULT_DIFFICULTY << ")\n"
        << "  --max-ticks N        ticks before a game is called a draw (default 5000)\n"
        << "  --grid-width N, --grid-height N\n"
        << "  --results-log PATH   append arena games to a CSV file\n";
    return out.str();
}

std::string connectionBanner(const ServerConfig& config) {
    const std::string rule(60, '=');
    std::ostringstream out;
    out << "\n" << rule << "\n"
        << "       COPPERHEAD SNAKE GAME SERVER\n"
        << rule << "\n\n"
        << "HOW TO PLAY:\n\n"
        << "   Step 1: Open the game client in your browser:\n"
        << "          " << CLIENT_URL << "\n\n"
        << "   Step 2: Paste this Server URL into the client:\n\n"
        << "          " << config.publicUrl() << "\n\n";
    if (config.inCodespace()) {
        out << "   Step 3: IMPORTANT - Make your port PUBLIC:\n"
            << "          * Click the Ports tab in the bottom panel\n"
            << "          * Right-click on port " << config.port << "\n"
            << "          * Select Port Visibility -> Public\n\n";
    }
    out << rule << "\n";
    return out.str();
}

} // namespace copperhead
