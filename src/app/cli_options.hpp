#pragma once

#include <string>

namespace matchwire::app {

struct CliOptions {
    std::string gameDir;
    bool gameDirExplicit = false;
    std::string userConfigPath;
    bool userConfigExplicit = false;
    bool singleThread = false;
    int verbose = 0;
    std::string logLevel;
    bool logLevelExplicit = false;
    bool timestampLogging = false;
};

// Exits the process after printing help or a parse error.
CliOptions ParseCliOptions(int argc, char *argv[]);

} // namespace matchwire::app
