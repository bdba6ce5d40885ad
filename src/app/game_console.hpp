#pragma once

#include "app/command_context.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace matchwire::app {

// Recognizes "Connecting to <address>" and "Connecting to <name> (<address>)".
std::optional<ConnectionRecord> ParseConnectionEvent(std::string_view line);

// Removes terminal escape sequences and carriage returns from console output.
std::string StripTerminalControl(std::string_view text);

// The game process running inside a pseudo-terminal. Owned by the interactive
// thread; the master fd is polled alongside stdin and never handed to another
// thread.
class GameConsole {
public:
    GameConsole() = default;
    ~GameConsole();

    GameConsole(const GameConsole &) = delete;
    GameConsole &operator=(const GameConsole &) = delete;

    bool isRunning();

    // Starts `command` (its first word resolved against gameDir when present
    // there, else through PATH) with gameDir as working directory. Throws
    // Error(Filesystem) on failure.
    void launch(const std::filesystem::path &gameDir, const std::vector<std::string> &command);

    // Routes console output and connection events into the context.
    void attachListener(std::shared_ptr<CommandContext> context);

    int fd() const { return masterFd; }

    // Reads whatever output is available. Call when fd() is readable.
    void pump();

    bool send(const std::string &line);

    // Asks the game process to stop and closes the session.
    void terminate();

private:
    void handleLine(std::string line);
    void closeSession();

    pid_t childPid = -1;
    int masterFd = -1;
    std::string pending;
    std::shared_ptr<CommandContext> listener;
};

} // namespace matchwire::app
