#include "BotSpawner.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

namespace copperhead {

namespace {

constexpr auto TERMINATE_GRACE = std::chrono::seconds(2);
constexpr auto TERMINATE_POLL = std::chrono::milliseconds(50);

} // namespace

ProcessBotSpawner::ProcessBotSpawner(std::string executable, std::string serverUrl)
    : executable_(std::move(executable)), serverUrl_(std::move(serverUrl)) {}

ProcessBotSpawner::~ProcessBotSpawner() {
    terminateAll();
}

std::optional<BotHandle> ProcessBotSpawner::spawn(int difficulty) {
    reapExited();

    std::vector<std::string> args = {
        executable_, "--server", serverUrl_, "--difficulty", std::to_string(difficulty), "--quiet"};
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        log::error() << "Failed to spawn CopperBot: " << std::strerror(errno);
        return std::nullopt;
    }
    if (pid == 0) {
        long maxFd = sysconf(_SC_OPEN_MAX);
        if (maxFd < 0 || maxFd > 4096) maxFd = 4096;
        for (int fd = 3; fd < maxFd; ++fd) close(fd);
        execv(executable_.c_str(), argv.data());
        _exit(127);
    }

    children_.push_back(pid);
    log::info() << "CopperBot L" << difficulty << " spawned (PID: " << pid << ")";
    return BotHandle{pid};
}

void ProcessBotSpawner::terminate(const BotHandle& handle) {
    auto it = std::find(children_.begin(), children_.end(), handle.pid);
    if (handle.pid <= 0 || it == children_.end()) return;
    children_.erase(it);

    if (kill(handle.pid, SIGTERM) != 0 && errno != ESRCH) {
        log::warn() << "Failed to terminate CopperBot " << handle.pid << ": " << std::strerror(errno);
    }

    auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t done = waitpid(handle.pid, &status, WNOHANG);
        if (done == handle.pid || (done < 0 && errno == ECHILD)) {
            log::info() << "CopperBot process " << handle.pid << " terminated";
            return;
        }
        std::this_thread::sleep_for(TERMINATE_POLL);
    }

    log::warn() << "CopperBot " << handle.pid << " ignored SIGTERM, killing";
    kill(handle.pid, SIGKILL);
    waitpid(handle.pid, &status, 0);
}

void ProcessBotSpawner::terminateAll() {
    std::vector<pid_t> running = children_;
    for (pid_t pid : running) terminate(BotHandle{pid});
}

void ProcessBotSpawner::reapExited() {
    children_.erase(std::remove_if(children_.begin(), children_.end(),
                                   [](pid_t pid) {
                                       int status = 0;
                                       return waitpid(pid, &status, WNOHANG) == pid;
                                   }),
                    children_.end());
}

} // namespace copperhead
