#pragma once

#include "app/command_context.hpp"
#include "app/command_parser.hpp"
#include "app/game_console.hpp"
#include "browser/favorites_builder.hpp"
#include "cache/cache_builder.hpp"

#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace matchwire::app {

// Collaborators the dispatcher hands work to.
struct CommandServices {
    std::shared_ptr<browser::FavoritesBuilder> favorites;
    std::shared_ptr<cache::CacheBuilder> cacheBuilder;
    std::vector<std::string> launchCommand;
    std::string openCommand = "xdg-open";
    std::size_t defaultLimit = 100;
};

// Result of one dispatched line. Long running commands hand back the future
// of their pool task; everything else has already run.
struct CommandHandle {
    std::optional<std::future<void>> task;
    std::string response;
    bool exit = false;
};

class CommandDispatcher {
public:
    CommandDispatcher(std::shared_ptr<CommandContext> context, CommandServices services, GameConsole &console);

    // Never throws for bad input; parse errors come back as the response.
    CommandHandle dispatch(const std::string &line);

private:
    std::future<void> spawnFilter(browser::FilterCriteria criteria);
    std::future<void> spawnCacheRebuild();
    std::string reconnect(const ReconnectArgs &args);
    std::string launch();
    std::string displayLogs() const;
    std::string openDirectory(const std::filesystem::path &directory) const;

    std::shared_ptr<CommandContext> context;
    CommandServices services;
    GameConsole &console;
};

// Formats the connection history, most recent first, numbered from 1.
std::string FormatConnectionHistory(const std::vector<ConnectionRecord> &history);

// Picks the entry `index` positions back from the most recent (1 = latest).
std::optional<ConnectionRecord> SelectConnection(const std::vector<ConnectionRecord> &history, std::size_t index);

} // namespace matchwire::app
