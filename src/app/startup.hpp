#pragma once

#include "cache/cache_builder.hpp"
#include "cache/region_cache.hpp"
#include "net/http_client.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matchwire::app {

struct GameDirectoryCheck {
    bool valid = false;
    bool createdFavoritesDir = false;
    std::vector<std::string> missingFiles;
};

// Every required entry must exist in gameDir. The favorites directory is
// created when it is the only thing missing.
GameDirectoryCheck ValidateGameDirectory(const std::filesystem::path &gameDir,
                                         const std::vector<std::string> &requiredFiles,
                                         const std::filesystem::path &favoritesDir);

// Fetches {"latest": "..."} and returns the advertised version when it
// differs from `current`. Network and decode failures are logged.
std::optional<std::string> CheckLatestVersion(net::IHttpClient &http,
                                              const std::string &versionUrl,
                                              std::string_view current);

// Loads the cache file when present and current; otherwise builds a fresh
// cache and persists it. Throws Error(Transport/Deserialization) when the
// directory is needed and unreachable.
std::shared_ptr<cache::RegionCache> LoadOrBuildCache(const std::optional<std::filesystem::path> &cachePath,
                                                     const cache::CacheBuilder &builder,
                                                     std::string_view version);

} // namespace matchwire::app
