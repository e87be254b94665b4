#include "BotClient.hpp"
#include "Log.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace copperhead {

ServerAddress parseServerUrl(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        if (url.compare(0, 6, "wss://") == 0) {
            throw std::invalid_argument("secure websocket URLs are not supported: " + url);
        }
        throw std::invalid_argument("server URL must start with ws://: " + url);
    }

    std::string rest = url.substr(scheme.size());
    std::size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "/" : rest.substr(slash);
    if (authority.empty()) throw std::invalid_argument("server URL has no host: " + url);

    ServerAddress address;
    std::size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        address.host = authority;
        address.port = "80";
    } else {
        address.host = authority.substr(0, colon);
        address.port = authority.substr(colon + 1);
        if (address.host.empty() || address.port.empty()) {
            throw std::invalid_argument("malformed server URL: " + url);
        }
    }

    if (path == "/") path = "/ws/";
    if (path.back() == '/') path += "join";
    address.path = path;
    return address;
}

BotClient::BotClient(BotOptions options, std::unique_ptr<BotPolicy> policy)
    : options_(std::move(options)), policy_(std::move(policy)) {
    if (!policy_) throw std::invalid_argument("bot client needs a policy");
    name_ = options_.name.empty() ? "CopperBot L" + std::to_string(options_.difficulty) : options_.name;
}

json BotClient::readyMessage() const {
    return message::ready(GameMode::TwoPlayer, name_);
}

std::vector<json> BotClient::handleMessage(const json& msg) {
    std::string type = stringField(msg, "type", "");

    if (type == "joined") {
        playerId_ = intField(msg, "player_id");
        roomId_ = intField(msg, "room_id");
        log::info() << name_ << " joined room " << roomId_.value_or(0) << " as player " << playerId_.value_or(0);
        return {readyMessage()};
    }

    if (type == "state") {
        if (!playerId_ || finished_) return {};
        auto it = msg.find("game");
        if (it == msg.end() || !it->value("running", false)) return {};
        try {
            GameState game = decodeGame(*it);
            const Snake* me = game.snake(*playerId_);
            if (!me || !me->alive()) return {};
            return {message::move(policy_->chooseMove(game, *playerId_))};
        } catch (const std::invalid_argument& e) {
            log::warn() << "Ignoring state update: " << e.what();
            return {};
        }
    }

    if (type == "start") {
        log::info() << name_ << ": game started";
        return {};
    }

    if (type == "gameover") {
        ++gamesPlayed_;
        auto winner = intField(msg, "winner");
        if (winner && winner == playerId_) ++gamesWon_;
        log::info() << name_ << ": game over, "
                    << (winner ? (winner == playerId_ ? "won" : "lost") : "draw")
                    << " (" << gamesWon_ << "/" << gamesPlayed_ << ")";
        if (options_.maxGames && gamesPlayed_ >= *options_.maxGames) {
            finished_ = true;
            return {};
        }
        return {readyMessage()};
    }

    if (type == "waiting") {
        log::debug() << name_ << ": " << stringField(msg, "message", "");
    }
    return {};
}

void BotClient::run() {
    ServerAddress address = parseServerUrl(options_.serverUrl);

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    websocket::stream<tcp::socket> ws(ioc);

    auto endpoint = net::connect(ws.next_layer(), resolver.resolve(address.host, address.port));
    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " copperbot");
    }));
    ws.handshake(address.host + ":" + std::to_string(endpoint.port()), address.path);
    log::info() << name_ << " connected to " << options_.serverUrl;

    beast::flat_buffer buffer;
    while (!finished_) {
        beast::error_code ec;
        ws.read(buffer, ec);
        if (ec == websocket::error::closed) {
            log::info() << name_ << ": server closed the connection (" << ws.reason().code << " "
                        << ws.reason().reason << ")";
            return;
        }
        if (ec) throw beast::system_error(ec);

        auto data = parseMessage(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
        if (!data) continue;

        for (const json& reply : handleMessage(*data)) {
            ws.text(true);
            ws.write(net::buffer(reply.dump()));
        }
    }

    beast::error_code ec;
    ws.close(websocket::close_code::normal, ec);
    if (ec && ec != websocket::error::closed) {
        log::warn() << name_ << ": close failed: " << ec.message();
    }
}

} // namespace copperhead
