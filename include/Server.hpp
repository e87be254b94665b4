#pragma once

#include "RoomManager.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <optional>
#include <string>

namespace copperhead {

enum class SocketRoute { Join, Observe, Legacy, NotFound };

struct SocketTarget {
    SocketRoute route = SocketRoute::NotFound;
    int requestedId = 0;  // Legacy only
};

// Maps a WebSocket upgrade path (/ws/join, /ws/observe, /ws/<n>) to its handler.
SocketTarget routeSocket(const std::string& target);

struct HttpReply {
    unsigned status = 200;
    json body;
};

// GET endpoints: "/", "/status", "/rooms/active".
HttpReply routeHttp(const std::string& method, const std::string& target, const RoomManager& manager);

// Accepts TCP connections and hands them to HTTP or WebSocket sessions.
class Server {
public:
    Server(boost::asio::io_context& io, RoomManager& manager);

    // Binds and starts accepting. Throws boost::system::system_error on failure.
    void listen(const std::string& host, unsigned short port);
    void stop();

    unsigned short port() const;

private:
    class Listener;

    boost::asio::io_context& io_;
    RoomManager& manager_;
    std::shared_ptr<Listener> listener_;
};

} // namespace copperhead
