#include "app/cli_options.hpp"
#include "app/command_context.hpp"
#include "app/command_dispatcher.hpp"
#include "app/game_console.hpp"
#include "app/interactive_session.hpp"
#include "app/line_editor.hpp"
#include "app/refresh_scheduler.hpp"
#include "app/startup.hpp"
#include "browser/browser_config.hpp"
#include "browser/directory_client.hpp"
#include "browser/favorites_builder.hpp"
#include "browser/geolocation_resolver.hpp"
#include "cache/cache_builder.hpp"
#include "cache/cache_file.hpp"
#include "common/config_helpers.hpp"
#include "common/config_store.hpp"
#include "common/data_path_resolver.hpp"
#include "common/errors.hpp"
#include "common/version.hpp"
#include "common/worker_pool.hpp"
#include "net/http_client.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <unistd.h>

spdlog::level::level_enum ParseLogLevel(const std::string &level) {
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn") {
        return spdlog::level::warn;
    }
    if (level == "err") {
        return spdlog::level::err;
    }
    if (level == "critical") {
        return spdlog::level::critical;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

void ConfigureLogging(spdlog::level::level_enum level, bool includeTimestamp) {
    if (includeTimestamp) {
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    } else {
        spdlog::set_pattern("[%^%l%$] %v");
    }
    spdlog::set_level(level);
}

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

std::optional<std::filesystem::path> PrepareLocalDirectory() {
    try {
        return matchwire::data::EnsureLocalDirectory();
    } catch (const matchwire::Error &ex) {
        spdlog::error("main: {}; the region cache will not be saved", matchwire::DescribeError(ex));
        return std::nullopt;
    }
}

std::filesystem::path DefaultUserConfigPath() {
    try {
        return matchwire::data::EnsureLocalFile("config.json", "{}\n");
    } catch (const matchwire::Error &ex) {
        spdlog::warn("main: {}", matchwire::DescribeError(ex));
        return {};
    }
}

} // namespace

int main(int argc, char *argv[]) {
    using namespace matchwire;

    ConfigureLogging(spdlog::level::info, false);
    InstallCrashHandlers();

    data::SetDataPathSpec({"matchwire", "MATCHWIRE_DATA_DIR"});

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const app::CliOptions cliOptions = app::ParseCliOptions(argc, argv);

    const spdlog::level::level_enum logLevel = cliOptions.logLevelExplicit
        ? ParseLogLevel(cliOptions.logLevel)
        : (cliOptions.verbose >= 2 ? spdlog::level::trace
           : cliOptions.verbose == 1 ? spdlog::level::debug
           : spdlog::level::info);
    ConfigureLogging(logLevel, cliOptions.timestampLogging);

    const std::vector<config::ConfigFileSpec> baseConfigSpecs = {
        {"config.json", "data/config.json", spdlog::level::debug, false, true}
    };
    const std::filesystem::path userConfigPath = cliOptions.userConfigExplicit
        ? std::filesystem::path(cliOptions.userConfigPath)
        : DefaultUserConfigPath();
    config::ConfigStore::Initialize(json::Object(), baseConfigSpecs, userConfigPath);

    std::error_code ec;
    const std::filesystem::path gameDir = cliOptions.gameDirExplicit
        ? std::filesystem::absolute(cliOptions.gameDir, ec)
        : std::filesystem::current_path(ec);
    if (ec) {
        spdlog::error("main: failed to determine the game directory: {}", ec.message());
        return 1;
    }

    const auto browserConfig = browser::LoadBrowserConfig();
    const auto requiredFiles = config::ReadStringListConfig("game.RequiredFiles", {"h1_mp64_ship.exe", "h2m-mod"});
    const auto check = app::ValidateGameDirectory(gameDir, requiredFiles, browserConfig.favoritesPath.parent_path());
    if (!check.valid) {
        return 1;
    }

    const int timeoutSeconds = config::ReadIntConfig({"network.RequestTimeoutSeconds"}, 10);
    auto http = net::createDefaultHttpClient(timeoutSeconds > 0 ? timeoutSeconds : 10);

    const auto versionUrl = config::ReadStringConfig("version.Url", "");
    if (auto latest = app::CheckLatestVersion(*http, versionUrl, kVersion)) {
        std::cout << "New version available: " << *latest << " (running " << kVersion << ")" << std::endl;
    }

    const bool concurrent = !cliOptions.singleThread;
    const int configuredThreads = config::ReadIntConfig({"runtime.WorkerThreads"}, 0);
    std::size_t workerThreads = 0;
    if (concurrent) {
        workerThreads = configuredThreads > 0
            ? static_cast<std::size_t>(configuredThreads)
            : std::max(2u, std::thread::hardware_concurrency());
    }
    auto pool = std::make_shared<WorkerPool>(workerThreads);

    auto directory = std::make_shared<browser::DirectoryClient>(http, browserConfig);
    auto geolocation = std::make_shared<browser::GeolocationClient>(http, browserConfig);
    auto resolver = std::make_shared<browser::GeolocationResolver>(geolocation, browserConfig, concurrent);
    auto cacheBuilder = std::make_shared<cache::CacheBuilder>(directory, geolocation, browserConfig, concurrent);

    const auto localDir = PrepareLocalDirectory();
    std::optional<std::filesystem::path> cachePath;
    if (localDir) {
        cachePath = *localDir / cache::kCacheFileName;
    }

    std::shared_ptr<cache::RegionCache> regionCache;
    try {
        regionCache = app::LoadOrBuildCache(cachePath, *cacheBuilder, kVersion);
    } catch (const Error &ex) {
        spdlog::error("main: failed to build the region cache: {}", DescribeError(ex));
        return 1;
    }

    const int historyLimit = config::ReadIntConfig({"console.HistoryLimit"}, 5000);
    auto context = std::make_shared<app::CommandContext>(
        regionCache, gameDir, localDir, pool,
        historyLimit > 0 ? static_cast<std::size_t>(historyLimit) : 5000);

    app::CommandServices services;
    services.favorites = std::make_shared<browser::FavoritesBuilder>(directory, resolver, browserConfig);
    services.cacheBuilder = cacheBuilder;
    services.launchCommand = config::ReadStringListConfig("game.Executable", {"h2m-mod.exe"});
    services.openCommand = config::ReadStringConfig("system.OpenCommand", "xdg-open");
    services.defaultLimit = browserConfig.defaultLimit;

    app::GameConsole console;
    app::CommandDispatcher dispatcher(context, std::move(services), console);
    app::LineEditor editor(STDIN_FILENO);
    app::InteractiveSession session(context, dispatcher, console, editor, std::string(kVersion));

    const int flushInterval = config::ReadIntConfig({"cache.FlushIntervalSeconds"}, 240);
    app::RefreshScheduler scheduler(context, std::chrono::seconds(flushInterval > 0 ? flushInterval : 240));
    scheduler.start();

    std::cout << app::CommandUsage() << std::endl;
    session.run(g_running);

    spdlog::info("Shutting down...");
    scheduler.stop();
    const std::size_t abandoned = pool->shutdown(false);
    session.serviceFlushRequest();
    session.flushIfDirty();

    if (abandoned > 0) {
        // Detached workers may still be inside spdlog or libcurl; leave
        // without running static destructors and atexit handlers.
        spdlog::warn("Abandoning {} running command(s)", abandoned);
        console.terminate();
        spdlog::default_logger()->flush();
        std::cout.flush();
        std::_Exit(0);
    }
    return 0;
}
