#include "app/cli_options.hpp"

#include "common/version.hpp"
#include "cxxopts.hpp"

#include <cstdlib>
#include <iostream>

namespace matchwire::app {

CliOptions ParseCliOptions(int argc, char *argv[]) {
    cxxopts::Options options("matchwire", "Server browser companion for H2M");
    options.add_options()
        ("g,game-dir", "Game directory (defaults to the working directory)", cxxopts::value<std::string>())
        ("c,config", "User config file path", cxxopts::value<std::string>())
        ("single-thread", "Run every command on the interactive thread")
        ("l,log-level", "Log level (trace, debug, info, warn, err, critical, off)", cxxopts::value<std::string>())
        ("v,verbose", "Increase logging verbosity (repeatable)")
        ("timestamps", "Prefix log lines with timestamps")
        ("version", "Print the version")
        ("h,help", "Show help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }
    if (result.count("version")) {
        std::cout << "matchwire " << kVersion << std::endl;
        std::exit(0);
    }
    if (!result.unmatched().empty()) {
        std::cerr << "Error: unexpected argument '" << result.unmatched().front() << "'\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    CliOptions parsed;
    parsed.gameDirExplicit = result.count("game-dir") > 0;
    parsed.gameDir = parsed.gameDirExplicit ? result["game-dir"].as<std::string>() : std::string();
    parsed.userConfigExplicit = result.count("config") > 0;
    parsed.userConfigPath = parsed.userConfigExplicit ? result["config"].as<std::string>() : std::string();
    parsed.singleThread = result.count("single-thread") > 0;
    parsed.verbose = static_cast<int>(result.count("verbose"));
    parsed.logLevelExplicit = result.count("log-level") > 0;
    parsed.logLevel = parsed.logLevelExplicit ? result["log-level"].as<std::string>() : std::string();
    parsed.timestampLogging = result.count("timestamps") > 0;
    return parsed;
}

} // namespace matchwire::app
