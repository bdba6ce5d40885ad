#pragma once

#include "app/command_context.hpp"
#include "app/command_dispatcher.hpp"
#include "app/game_console.hpp"
#include "app/line_editor.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace matchwire::app {

// The interactive thread: owns stdin and the console fd, dispatches lines,
// and is the only place the cache file is written after startup.
class InteractiveSession {
public:
    InteractiveSession(std::shared_ptr<CommandContext> context,
                       CommandDispatcher &dispatcher,
                       GameConsole &console,
                       LineEditor &editor,
                       std::string version);

    // Runs until `quit`, end of input, or `running` is cleared by a signal.
    void run(std::atomic<bool> &running);

    // Persists the cache when a flush was requested. Returns true when a
    // write happened and succeeded.
    bool serviceFlushRequest();

    // Best effort persist used at shutdown.
    bool flushIfDirty();

    std::size_t pendingTasks() const { return pending.size(); }

private:
    bool persist();
    void handleLine(const std::string &line, std::atomic<bool> &running);
    // Returns true when every pending task has finished.
    bool reapPending(std::chrono::milliseconds wait);

    std::shared_ptr<CommandContext> context;
    CommandDispatcher &dispatcher;
    GameConsole &console;
    LineEditor &editor;
    std::string version;
    std::vector<std::future<void>> pending;
};

} // namespace matchwire::app
