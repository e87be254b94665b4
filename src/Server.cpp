#include "Server.hpp"
#include "Log.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <cctype>
#include <deque>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace copperhead {

namespace {

constexpr const char* SERVER_NAME = "copperhead-server";
constexpr auto HTTP_TIMEOUT = std::chrono::seconds(30);

void fail(beast::error_code ec, const char* what) {
    if (ec == net::error::operation_aborted || ec == websocket::error::closed) return;
    log::debug() << what << ": " << ec.message();
}

// Base for WebSocket clients. Writes are queued so only one async_write is
// outstanding at a time.
class WebSocketSession : public Channel, public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket&& socket, RoomManager& manager)
        : manager_(manager), ws_(std::move(socket)) {}

    void run(http::request<http::string_body> req) {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) { res.set(http::field::server, SERVER_NAME); }));
        ws_.async_accept(req, beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
    }

    void send(const json& message) override {
        if (!isOpen()) return;
        queue_.push_back(message.dump());
        if (queue_.size() > 1) return;
        doWrite();
    }

    void close(int code, const std::string& reason) override {
        if (!isOpen()) return;
        closing_ = true;
        closeReason_ = websocket::close_reason(static_cast<websocket::close_code>(code), reason);
        if (queue_.empty()) doClose();
    }

    bool isOpen() const override { return open_ && !closing_; }

protected:
    virtual void onOpen() = 0;
    virtual void onText(const std::string& text) = 0;
    virtual void onClosed() = 0;

    ChannelPtr self() { return shared_from_this(); }

    RoomManager& manager_;

private:
    void onAccept(beast::error_code ec) {
        if (ec) {
            fail(ec, "websocket accept");
            return;
        }
        open_ = true;
        onOpen();
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            fail(ec, "websocket read");
            handleClosed();
            return;
        }
        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (!closing_) onText(text);
        doRead();
    }

    void doWrite() {
        ws_.text(true);
        ws_.async_write(net::buffer(queue_.front()),
                        beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            fail(ec, "websocket write");
            queue_.clear();
            handleClosed();
            return;
        }
        queue_.pop_front();
        if (!queue_.empty()) {
            doWrite();
        } else if (closing_) {
            doClose();
        }
    }

    void doClose() {
        ws_.async_close(closeReason_, [self = shared_from_this()](beast::error_code ec) {
            if (ec) fail(ec, "websocket close");
            self->handleClosed();
        });
    }

    void handleClosed() {
        if (closed_) return;
        closed_ = true;
        bool wasOpen = open_;
        open_ = false;
        if (wasOpen) onClosed();
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;
    websocket::close_reason closeReason_;
    bool open_ = false;
    bool closing_ = false;
    bool closed_ = false;
};

class PlayerSession : public WebSocketSession {
public:
    PlayerSession(tcp::socket&& socket, RoomManager& manager, std::optional<int> legacyId)
        : WebSocketSession(std::move(socket), manager), legacyId_(legacyId) {}

protected:
    void onOpen() override {
        seat_ = legacyId_ ? manager_.joinLegacy(*legacyId_, self()) : manager_.joinPlayer(self());
    }

    void onText(const std::string& text) override {
        if (!seat_) return;
        auto data = parseMessage(text);
        if (!data) {
            log::warn() << "[Room " << seat_->room->id() << "] Ignoring malformed message from player "
                        << seat_->playerId;
            return;
        }
        manager_.handlePlayerMessage(*seat_, *data);
    }

    void onClosed() override {
        if (!seat_) return;
        manager_.leavePlayer(*seat_);
        seat_.reset();
    }

private:
    std::optional<int> legacyId_;
    std::optional<PlayerSeat> seat_;
};

class ObserverSession : public WebSocketSession {
public:
    using WebSocketSession::WebSocketSession;

protected:
    void onOpen() override { manager_.observe(self()); }

    void onText(const std::string& text) override {
        auto data = parseMessage(text);
        if (!data) {
            log::warn() << "Ignoring malformed message from observer";
            return;
        }
        manager_.handleObserverMessage(self(), *data);
    }

    void onClosed() override { manager_.removeObserver(self()); }
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, RoomManager& manager)
        : stream_(std::move(socket)), manager_(manager) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        request_ = {};
        stream_.expires_after(HTTP_TIMEOUT);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        if (ec) {
            fail(ec, "http read");
            return;
        }

        std::string target(request_.target());
        if (websocket::is_upgrade(request_)) {
            SocketTarget socketTarget = routeSocket(target);
            if (socketTarget.route != SocketRoute::NotFound) {
                stream_.expires_never();
                upgrade(socketTarget);
                return;
            }
        }

        HttpReply reply = routeHttp(std::string(request_.method_string()), target, manager_);
        auto response = std::make_shared<http::response<http::string_body>>(
            static_cast<http::status>(reply.status), request_.version());
        response->set(http::field::server, SERVER_NAME);
        response->set(http::field::content_type, "application/json");
        response->set(http::field::access_control_allow_origin, "*");
        response->keep_alive(request_.keep_alive());
        response->body() = reply.body.dump();
        response->prepare_payload();

        http::async_write(stream_, *response,
                          [self = shared_from_this(), response](beast::error_code writeEc, std::size_t) {
                              self->onWrite(response->need_eof(), writeEc);
                          });
    }

    void upgrade(const SocketTarget& socketTarget) {
        tcp::socket socket = stream_.release_socket();
        switch (socketTarget.route) {
            case SocketRoute::Join:
                std::make_shared<PlayerSession>(std::move(socket), manager_, std::nullopt)->run(std::move(request_));
                break;
            case SocketRoute::Legacy:
                std::make_shared<PlayerSession>(std::move(socket), manager_, socketTarget.requestedId)
                    ->run(std::move(request_));
                break;
            case SocketRoute::Observe:
                std::make_shared<ObserverSession>(std::move(socket), manager_)->run(std::move(request_));
                break;
            case SocketRoute::NotFound:
                break;
        }
    }

    void onWrite(bool close, beast::error_code ec) {
        if (ec) {
            fail(ec, "http write");
            return;
        }
        if (close) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        doRead();
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    RoomManager& manager_;
};

} // namespace

SocketTarget routeSocket(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    if (path == "/ws/join") return {SocketRoute::Join, 0};
    if (path == "/ws/observe") return {SocketRoute::Observe, 0};

    const std::string prefix = "/ws/";
    if (path.compare(0, prefix.size(), prefix) != 0) return {};
    std::string rest = path.substr(prefix.size());
    std::size_t digitsFrom = (!rest.empty() && rest[0] == '-') ? 1 : 0;
    if (rest.size() <= digitsFrom || rest.size() > 9) return {};
    bool numeric = std::all_of(rest.begin() + static_cast<std::ptrdiff_t>(digitsFrom), rest.end(),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric) return {};
    return {SocketRoute::Legacy, std::stoi(rest)};
}

HttpReply routeHttp(const std::string& method, const std::string& target, const RoomManager& manager) {
    if (method != "GET") {
        return {405, {{"detail", "Method Not Allowed"}}};
    }
    std::string path = target.substr(0, target.find('?'));
    if (path == "/") {
        return {200, {{"name", "CopperHead Server"}, {"status", "running"}}};
    }
    if (path == "/status") {
        return {200, manager.status()};
    }
    if (path == "/rooms/active") {
        return {200, manager.activeRoomsJson()};
    }
    return {404, {{"detail", "Not Found"}}};
}

class Server::Listener : public std::enable_shared_from_this<Server::Listener> {
public:
    Listener(net::io_context& io, tcp::endpoint endpoint, RoomManager& manager)
        : io_(io), acceptor_(net::make_strand(io)), manager_(manager) {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    }

    void run() { doAccept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void doAccept() {
        acceptor_.async_accept(net::make_strand(io_),
                               beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
            fail(ec, "accept");
        } else {
            std::make_shared<HttpSession>(std::move(socket), manager_)->run();
        }
        doAccept();
    }

    net::io_context& io_;
    tcp::acceptor acceptor_;
    RoomManager& manager_;
};

Server::Server(net::io_context& io, RoomManager& manager) : io_(io), manager_(manager) {}

void Server::listen(const std::string& host, unsigned short port) {
    tcp::endpoint endpoint(net::ip::make_address(host), port);
    listener_ = std::make_shared<Listener>(io_, endpoint, manager_);
    listener_->run();
}

void Server::stop() {
    if (listener_) listener_->stop();
}

unsigned short Server::port() const {
    return listener_ ? listener_->port() : 0;
}

} // namespace copperhead
