#include "app/startup.hpp"

#include "cache/cache_file.hpp"
#include "common/errors.hpp"
#include "common/json.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace matchwire::app {

GameDirectoryCheck ValidateGameDirectory(const std::filesystem::path &gameDir,
                                         const std::vector<std::string> &requiredFiles,
                                         const std::filesystem::path &favoritesDir) {
    GameDirectoryCheck check;
    std::error_code ec;
    if (!std::filesystem::is_directory(gameDir, ec)) {
        spdlog::error("Startup: game directory not found: {}", gameDir.string());
        return check;
    }

    for (const auto &name : requiredFiles) {
        if (!std::filesystem::exists(gameDir / name, ec)) {
            check.missingFiles.push_back(name);
        }
    }
    if (!check.missingFiles.empty()) {
        for (const auto &name : check.missingFiles) {
            spdlog::error("Startup: '{}' not found in {}", name, gameDir.string());
        }
        spdlog::error("Startup: matchwire must be run from (or pointed at with -g) the game directory");
        return check;
    }

    const auto favorites = gameDir / favoritesDir;
    if (!std::filesystem::is_directory(favorites, ec)) {
        if (!std::filesystem::create_directories(favorites, ec) || ec) {
            spdlog::error("Startup: failed to create {}: {}", favorites.string(), ec.message());
            return check;
        }
        check.createdFavoritesDir = true;
        spdlog::info("{} folder is missing, a new one was created", favoritesDir.string());
    }
    check.valid = true;
    return check;
}

std::optional<std::string> CheckLatestVersion(net::IHttpClient &http,
                                              const std::string &versionUrl,
                                              std::string_view current) {
    if (versionUrl.empty()) {
        return std::nullopt;
    }
    try {
        const auto response = http.get(versionUrl);
        const auto document = json::Parse(response.body);
        const auto it = document.find("latest");
        if (it == document.end() || !it->is_string()) {
            spdlog::warn("Startup: version document has no 'latest' field");
            return std::nullopt;
        }
        const auto latest = it->get<std::string>();
        if (latest != current) {
            return latest;
        }
    } catch (const Error &ex) {
        spdlog::error("Startup: version check failed: {}", DescribeError(ex));
    } catch (const json::Value::exception &ex) {
        spdlog::error("Startup: version check failed: {}", ex.what());
    }
    return std::nullopt;
}

std::shared_ptr<cache::RegionCache> LoadOrBuildCache(const std::optional<std::filesystem::path> &cachePath,
                                                     const cache::CacheBuilder &builder,
                                                     std::string_view version) {
    if (cachePath) {
        if (auto snapshot = cache::ReadCacheFile(*cachePath, version)) {
            spdlog::info("Loaded {} cached server regions", snapshot->entries.size());
            return std::make_shared<cache::RegionCache>(std::move(snapshot->entries), snapshot->created);
        }
    }

    spdlog::info("Building region cache...");
    auto result = builder.build();
    auto regionCache = std::make_shared<cache::RegionCache>(std::move(result.snapshot.entries), result.snapshot.created);
    if (cachePath) {
        cache::PersistRegionCache(*regionCache, *cachePath, version);
    }
    return regionCache;
}

} // namespace matchwire::app
