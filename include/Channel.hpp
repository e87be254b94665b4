#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace copperhead {

// Outbound side of a client connection, as seen by rooms.
class Channel {
public:
    virtual ~Channel() = default;

    // Queue a JSON text frame. Ignored once the channel is closed.
    virtual void send(const nlohmann::json& message) = 0;
    virtual void close(int code, const std::string& reason) = 0;
    virtual bool isOpen() const = 0;
};

using ChannelPtr = std::shared_ptr<Channel>;

} // namespace copperhead
