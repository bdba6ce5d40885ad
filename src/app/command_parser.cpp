#include "app/command_parser.hpp"

#include "common/errors.hpp"

#include "cxxopts.hpp"

#include <algorithm>
#include <cstdint>

namespace {

using matchwire::ErrorKind;

struct CommandName {
    const char *name;
    matchwire::app::CommandKind kind;
    const char *summary;
};

const CommandName kCommands[] = {
    {"filter", matchwire::app::CommandKind::Filter, "Build a new favorites list from the server directory"},
    {"reconnect", matchwire::app::CommandKind::Reconnect, "Reconnect to a server from the connection history"},
    {"launch", matchwire::app::CommandKind::Launch, "Launch the game console"},
    {"update-cache", matchwire::app::CommandKind::UpdateCache, "Rebuild the region cache"},
    {"display-logs", matchwire::app::CommandKind::DisplayLogs, "Print the game console history"},
    {"game-dir", matchwire::app::CommandKind::GameDir, "Open the game directory"},
    {"local-env", matchwire::app::CommandKind::LocalEnv, "Open the local data directory"},
    {"quit", matchwire::app::CommandKind::Quit, "Exit"},
    {"help", matchwire::app::CommandKind::Help, "Show this list"}
};

cxxopts::ParseResult parseArgs(cxxopts::Options &options, const std::vector<std::string> &words) {
    std::vector<const char *> argv;
    argv.reserve(words.size());
    for (const auto &word : words) {
        argv.push_back(word.c_str());
    }
    try {
        return options.parse(static_cast<int>(argv.size()), argv.data());
    } catch (const cxxopts::exceptions::exception &ex) {
        throw MATCHWIRE_ERROR(ErrorKind::CommandParse, std::string(ex.what()) + "\n" + options.help());
    }
}

void rejectPositionals(const cxxopts::ParseResult &result, const cxxopts::Options &options) {
    if (!result.unmatched().empty()) {
        throw MATCHWIRE_ERROR(ErrorKind::CommandParse,
                              "Unexpected argument '" + result.unmatched().front() + "'\n" + options.help());
    }
}

template <typename T>
T readOption(const cxxopts::ParseResult &result, const char *name, const cxxopts::Options &options) {
    try {
        return result[name].as<T>();
    } catch (const cxxopts::exceptions::exception &ex) {
        throw MATCHWIRE_ERROR(ErrorKind::CommandParse, std::string(ex.what()) + "\n" + options.help());
    }
}

matchwire::app::ParsedCommand parseFilter(const std::vector<std::string> &words, std::size_t defaultLimit) {
    cxxopts::Options options("filter", "Create a new favorites list");
    options.add_options()
        ("l,limit", "Maximum number of servers in the favorites list", cxxopts::value<std::size_t>())
        ("i,includes", "Keep servers whose name contains any of these (comma separated)",
         cxxopts::value<std::vector<std::string>>())
        ("e,excludes", "Drop servers whose name contains any of these (comma separated)",
         cxxopts::value<std::vector<std::string>>())
        ("p,player-min", "Minimum number of connected players", cxxopts::value<int64_t>())
        ("t,team-size-max", "Maximum team size", cxxopts::value<int64_t>())
        ("r,region", "Only keep servers in this region (NA, EU, APAC)", cxxopts::value<std::string>())
        ("h,help", "Show help");

    const auto result = parseArgs(options, words);
    rejectPositionals(result, options);

    matchwire::app::ParsedCommand command;
    if (result.count("help")) {
        command.kind = matchwire::app::CommandKind::Help;
        command.helpText = options.help();
        return command;
    }

    command.kind = matchwire::app::CommandKind::Filter;
    auto &criteria = command.criteria;
    criteria.limit = result.count("limit") ? readOption<std::size_t>(result, "limit", options) : defaultLimit;
    if (result.count("includes")) {
        criteria.includes = readOption<std::vector<std::string>>(result, "includes", options);
    }
    if (result.count("excludes")) {
        criteria.excludes = readOption<std::vector<std::string>>(result, "excludes", options);
    }
    if (result.count("player-min")) {
        criteria.playerMin = readOption<int64_t>(result, "player-min", options);
    }
    if (result.count("team-size-max")) {
        criteria.teamSizeMax = readOption<int64_t>(result, "team-size-max", options);
    }
    if (result.count("region")) {
        const auto text = readOption<std::string>(result, "region", options);
        criteria.region = matchwire::browser::ParseRegion(text);
        if (!criteria.region) {
            throw MATCHWIRE_ERROR(ErrorKind::CommandParse,
                                  "Invalid region '" + text + "', expected one of NA, EU, APAC\n" + options.help());
        }
    }
    return command;
}

matchwire::app::ParsedCommand parseReconnect(const std::vector<std::string> &words) {
    cxxopts::Options options("reconnect", "Reconnect to a previously joined server");
    options.add_options()
        ("l,list", "List the connection history")
        ("H,history", "Connect to the Nth most recent server", cxxopts::value<std::size_t>())
        ("h,help", "Show help");

    const auto result = parseArgs(options, words);
    rejectPositionals(result, options);

    matchwire::app::ParsedCommand command;
    if (result.count("help")) {
        command.kind = matchwire::app::CommandKind::Help;
        command.helpText = options.help();
        return command;
    }
    command.kind = matchwire::app::CommandKind::Reconnect;
    command.reconnect.list = result.count("list") > 0;
    if (result.count("history")) {
        const auto index = readOption<std::size_t>(result, "history", options);
        if (index == 0) {
            throw MATCHWIRE_ERROR(ErrorKind::CommandParse, "--history starts at 1\n" + options.help());
        }
        command.reconnect.historyIndex = index;
    }
    return command;
}

} // namespace

namespace matchwire::app {

std::vector<std::string> SplitCommandLine(const std::string &line) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = '\0';

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            } else if (ch == '\\' && quote == '"' && i + 1 < line.size()) {
                current.push_back(line[++i]);
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '"' || ch == '\'') {
            quote = ch;
            inWord = true;
        } else if (ch == '\\' && i + 1 < line.size()) {
            current.push_back(line[++i]);
            inWord = true;
        } else if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
            if (inWord) {
                words.push_back(std::move(current));
                current.clear();
                inWord = false;
            }
        } else {
            current.push_back(ch);
            inWord = true;
        }
    }

    if (quote != '\0') {
        throw MATCHWIRE_ERROR(ErrorKind::CommandParse, "Unterminated quote in input");
    }
    if (inWord) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string CommandUsage() {
    std::string usage = "Commands:";
    for (const auto &command : kCommands) {
        usage += "\n  ";
        usage += command.name;
        usage.append(std::max<std::size_t>(2, 16 - std::char_traits<char>::length(command.name)), ' ');
        usage += command.summary;
    }
    return usage;
}

std::optional<ParsedCommand> ParseCommandLine(const std::string &line, std::size_t defaultLimit) {
    const auto words = SplitCommandLine(line);
    if (words.empty()) {
        return std::nullopt;
    }

    const auto it = std::find_if(std::begin(kCommands), std::end(kCommands),
                                 [&](const CommandName &command) { return words.front() == command.name; });
    if (it == std::end(kCommands)) {
        throw MATCHWIRE_ERROR(ErrorKind::CommandParse, "Unknown command '" + words.front() + "'\n" + CommandUsage());
    }

    switch (it->kind) {
    case CommandKind::Filter:
        return parseFilter(words, defaultLimit);
    case CommandKind::Reconnect:
        return parseReconnect(words);
    case CommandKind::Help: {
        ParsedCommand command;
        command.kind = CommandKind::Help;
        command.helpText = CommandUsage();
        return command;
    }
    default:
        break;
    }

    if (words.size() > 1) {
        throw MATCHWIRE_ERROR(ErrorKind::CommandParse,
                              "'" + words.front() + "' takes no arguments\n" + CommandUsage());
    }
    ParsedCommand command;
    command.kind = it->kind;
    return command;
}

} // namespace matchwire::app
