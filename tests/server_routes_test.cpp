#include "Server.hpp"
#include "TestDoubles.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

using namespace copperhead;
using copperhead::testing::makeChannel;

TEST(SocketRouteTest, NamedEndpoints) {
    EXPECT_EQ(routeSocket("/ws/join").route, SocketRoute::Join);
    EXPECT_EQ(routeSocket("/ws/join?name=x").route, SocketRoute::Join);
    EXPECT_EQ(routeSocket("/ws/observe").route, SocketRoute::Observe);
}

TEST(SocketRouteTest, LegacyNumericIds) {
    SocketTarget one = routeSocket("/ws/1");
    EXPECT_EQ(one.route, SocketRoute::Legacy);
    EXPECT_EQ(one.requestedId, 1);

    // Any integer reaches the handler, which rejects ids other than 1 and 2.
    EXPECT_EQ(routeSocket("/ws/7").requestedId, 7);
    EXPECT_EQ(routeSocket("/ws/-3").requestedId, -3);
}

TEST(SocketRouteTest, UnknownPaths) {
    EXPECT_EQ(routeSocket("/ws/").route, SocketRoute::NotFound);
    EXPECT_EQ(routeSocket("/ws/abc").route, SocketRoute::NotFound);
    EXPECT_EQ(routeSocket("/ws/-").route, SocketRoute::NotFound);
    EXPECT_EQ(routeSocket("/ws/12345678901").route, SocketRoute::NotFound);
    EXPECT_EQ(routeSocket("/join").route, SocketRoute::NotFound);
    EXPECT_EQ(routeSocket("/").route, SocketRoute::NotFound);
}

class HttpRouteTest : public ::testing::Test {
protected:
    boost::asio::io_context io_;
    RoomManager manager_{io_, ManagerOptions{}, nullptr, nullptr, 3};
};

TEST_F(HttpRouteTest, Root) {
    HttpReply reply = routeHttp("GET", "/", manager_);
    EXPECT_EQ(reply.status, 200u);
    EXPECT_EQ(reply.body, (json{{"name", "CopperHead Server"}, {"status", "running"}}));
}

TEST_F(HttpRouteTest, StatusReflectsRooms) {
    manager_.joinPlayer(makeChannel());
    HttpReply reply = routeHttp("GET", "/status", manager_);
    EXPECT_EQ(reply.status, 200u);
    EXPECT_EQ(reply.body["total_rooms"], 1);
    EXPECT_EQ(reply.body["rooms"][0]["waiting_for_player"], true);
}

TEST_F(HttpRouteTest, ActiveRooms) {
    HttpReply reply = routeHttp("GET", "/rooms/active?x=1", manager_);
    EXPECT_EQ(reply.status, 200u);
    EXPECT_EQ(reply.body, (json{{"rooms", json::array()}}));
}

TEST_F(HttpRouteTest, NotFoundAndWrongMethod) {
    EXPECT_EQ(routeHttp("GET", "/nope", manager_).status, 404u);
    EXPECT_EQ(routeHttp("GET", "/nope", manager_).body["detail"], "Not Found");
    EXPECT_EQ(routeHttp("POST", "/", manager_).status, 405u);
}
