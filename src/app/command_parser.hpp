#pragma once

#include "browser/server_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace matchwire::app {

enum class CommandKind {
    Filter,
    Reconnect,
    Launch,
    UpdateCache,
    DisplayLogs,
    GameDir,
    LocalEnv,
    Quit,
    Help
};

struct ReconnectArgs {
    bool list = false;
    // 1 based, counted from the most recent connection.
    std::optional<std::size_t> historyIndex;
};

struct ParsedCommand {
    CommandKind kind = CommandKind::Help;
    browser::FilterCriteria criteria;
    ReconnectArgs reconnect;
    std::string helpText;
};

// Splits a line into words. Single and double quotes group words and a
// backslash escapes the next character. Throws Error(CommandParse) on an
// unterminated quote.
std::vector<std::string> SplitCommandLine(const std::string &line);

// Throws Error(CommandParse) with usage text for unknown commands and bad
// arguments. An empty line yields nullopt.
std::optional<ParsedCommand> ParseCommandLine(const std::string &line, std::size_t defaultLimit);

std::string CommandUsage();

} // namespace matchwire::app
