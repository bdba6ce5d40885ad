#include "app/command_dispatcher.hpp"

#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace matchwire::app {

std::string FormatConnectionHistory(const std::vector<ConnectionRecord> &history) {
    if (history.empty()) {
        return "No connection history";
    }
    std::string response = "Connection history:";
    std::size_t index = 1;
    for (auto it = history.rbegin(); it != history.rend(); ++it, ++index) {
        response += "\n  " + std::to_string(index) + ". " + it->hostName;
        if (it->hostName != it->address) {
            response += " (" + it->address + ")";
        }
    }
    return response;
}

std::optional<ConnectionRecord> SelectConnection(const std::vector<ConnectionRecord> &history, std::size_t index) {
    if (index == 0 || index > history.size()) {
        return std::nullopt;
    }
    return history[history.size() - index];
}

CommandDispatcher::CommandDispatcher(std::shared_ptr<CommandContext> context,
                                     CommandServices services,
                                     GameConsole &console)
    : context(std::move(context)),
      services(std::move(services)),
      console(console) {}

CommandHandle CommandDispatcher::dispatch(const std::string &line) {
    CommandHandle handle;
    std::optional<ParsedCommand> command;
    try {
        command = ParseCommandLine(line, services.defaultLimit);
    } catch (const Error &ex) {
        handle.response = ex.what();
        return handle;
    }
    if (!command) {
        return handle;
    }

    switch (command->kind) {
    case CommandKind::Filter:
        handle.task = spawnFilter(command->criteria);
        break;
    case CommandKind::UpdateCache:
        if (!context->localDir()) {
            handle.response = "No local directory available to store the region cache";
            break;
        }
        handle.task = spawnCacheRebuild();
        break;
    case CommandKind::Reconnect:
        handle.response = reconnect(command->reconnect);
        break;
    case CommandKind::Launch:
        handle.response = launch();
        break;
    case CommandKind::DisplayLogs:
        handle.response = displayLogs();
        break;
    case CommandKind::GameDir:
        handle.response = openDirectory(context->gameDir());
        break;
    case CommandKind::LocalEnv:
        if (!context->localDir()) {
            handle.response = "No local directory available";
            break;
        }
        handle.response = openDirectory(*context->localDir());
        break;
    case CommandKind::Quit:
        handle.exit = true;
        break;
    case CommandKind::Help:
        handle.response = command->helpText;
        break;
    }
    return handle;
}

std::future<void> CommandDispatcher::spawnFilter(browser::FilterCriteria criteria) {
    auto ctx = context;
    auto favorites = services.favorites;
    return ctx->workerPool().submit([ctx, favorites, criteria = std::move(criteria)]() {
        try {
            favorites->build(ctx->gameDir(), criteria, *ctx->cache(), [ctx](std::size_t entries) {
                spdlog::debug("filter: {} new region cache entries", entries);
                ctx->markCacheDirty();
            });
        } catch (const Error &ex) {
            spdlog::error("filter: {}", DescribeError(ex));
        }
    });
}

std::future<void> CommandDispatcher::spawnCacheRebuild() {
    auto ctx = context;
    auto builder = services.cacheBuilder;
    return ctx->workerPool().submit([ctx, builder]() {
        std::vector<std::string> addresses;
        for (const auto &connection : ctx->connectionHistory()) {
            addresses.push_back(connection.address);
        }
        try {
            auto result = builder->build(addresses);
            const std::size_t entries = result.snapshot.entries.size();
            ctx->cache()->replace(std::move(result.snapshot));
            ctx->markCacheDirty();
            ctx->requestFlush();
            spdlog::info("Region cache rebuilt with {} entries", entries);
        } catch (const Error &ex) {
            spdlog::error("update-cache: {}", DescribeError(ex));
        }
    });
}

std::string CommandDispatcher::reconnect(const ReconnectArgs &args) {
    const auto history = context->connectionHistory();
    if (args.list) {
        return FormatConnectionHistory(history);
    }
    if (!console.isRunning() || !context->isConnected()) {
        return "connection closed, restart using 'launch'";
    }
    const auto selected = SelectConnection(history, args.historyIndex.value_or(1));
    if (!selected) {
        return history.empty() ? "No connection history"
                               : "History only holds " + std::to_string(history.size()) + " entries";
    }
    if (!console.send("connect " + selected->address)) {
        return "Failed to send the connect command to the game console";
    }
    return "Connecting to " + selected->hostName;
}

std::string CommandDispatcher::launch() {
    if (console.isRunning()) {
        return "The game is already running";
    }
    try {
        console.launch(context->gameDir(), services.launchCommand);
    } catch (const Error &ex) {
        return DescribeError(ex);
    }
    console.attachListener(context);
    return "Game console launched";
}

std::string CommandDispatcher::displayLogs() const {
    const auto lines = context->consoleHistory();
    if (lines.empty()) {
        return "No console output recorded";
    }
    std::string response;
    for (const auto &line : lines) {
        if (!response.empty()) {
            response += '\n';
        }
        response += line;
    }
    return response;
}

std::string CommandDispatcher::openDirectory(const std::filesystem::path &directory) const {
    // The opener runs in a grandchild so it never needs reaping here.
    const pid_t pid = ::fork();
    if (pid < 0) {
        return "Failed to start " + services.openCommand;
    }
    if (pid == 0) {
        if (::fork() != 0) {
            _exit(0);
        }
        ::setsid();
        const int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDOUT_FILENO);
            ::dup2(devNull, STDERR_FILENO);
        }
        execlp(services.openCommand.c_str(), services.openCommand.c_str(), directory.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    int status = 0;
    ::waitpid(pid, &status, 0);
    spdlog::debug("CommandDispatcher: opening {} with {}", directory.string(), services.openCommand);
    return "Opened " + directory.string();
}

} // namespace matchwire::app
