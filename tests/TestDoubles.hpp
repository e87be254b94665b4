#pragma once

#include "BotSpawner.hpp"
#include "Channel.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace copperhead::testing {

// Records everything sent to it instead of writing to a socket.
class FakeChannel : public Channel {
public:
    void send(const nlohmann::json& message) override {
        if (open_) sent.push_back(message);
    }

    void close(int code, const std::string& reason) override {
        open_ = false;
        closeCode = code;
        closeReason = reason;
    }

    bool isOpen() const override { return open_; }

    // Messages of one type, oldest first.
    std::vector<nlohmann::json> ofType(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (const auto& m : sent) {
            if (m.value("type", "") == type) out.push_back(m);
        }
        return out;
    }

    const nlohmann::json& last() const { return sent.back(); }

    std::vector<nlohmann::json> sent;
    int closeCode = 0;
    std::string closeReason;

private:
    bool open_ = true;
};

inline std::shared_ptr<FakeChannel> makeChannel() {
    return std::make_shared<FakeChannel>();
}

class FakeSpawner : public BotSpawner {
public:
    std::optional<BotHandle> spawn(int difficulty) override {
        spawned.push_back(difficulty);
        if (failSpawns) return std::nullopt;
        return BotHandle{static_cast<pid_t>(1000 + spawned.size())};
    }

    void terminate(const BotHandle& handle) override { terminated.push_back(handle.pid); }

    std::vector<int> spawned;
    std::vector<pid_t> terminated;
    bool failSpawns = false;
};

} // namespace copperhead::testing
