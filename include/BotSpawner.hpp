#pragma once

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace copperhead {

struct BotHandle {
    pid_t pid = -1;
};

class BotSpawner {
public:
    virtual ~BotSpawner() = default;

    virtual std::optional<BotHandle> spawn(int difficulty) = 0;
    virtual void terminate(const BotHandle& handle) = 0;
};

// Runs the copperbot executable as a child process pointed at this server.
class ProcessBotSpawner : public BotSpawner {
public:
    ProcessBotSpawner(std::string executable, std::string serverUrl);
    ~ProcessBotSpawner() override;

    std::optional<BotHandle> spawn(int difficulty) override;
    void terminate(const BotHandle& handle) override;

    // Terminate every bot still running.
    void terminateAll();

    const std::string& executable() const { return executable_; }

private:
    void reapExited();

    std::string executable_;
    std::string serverUrl_;
    std::vector<pid_t> children_;
};

} // namespace copperhead
