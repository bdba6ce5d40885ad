#pragma once

#include "browser/directory_client.hpp"
#include "browser/favorites_writer.hpp"
#include "browser/geolocation_resolver.hpp"
#include "browser/server_filter.hpp"
#include "cache/region_cache.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>

namespace matchwire::browser {

struct FavoritesReport {
    std::size_t matched = 0;
    std::size_t written = 0;
    std::size_t failureCount = 0;
    std::size_t newCacheEntries = 0;
};

// Called with the number of cache entries a region lookup added or changed,
// before the favorites file is written.
using CacheMergedFn = std::function<void(std::size_t)>;

// fetch -> filter -> optional region lookup -> favorites file.
class FavoritesBuilder {
public:
    FavoritesBuilder(std::shared_ptr<DirectoryClient> directory,
                     std::shared_ptr<GeolocationResolver> resolver,
                     BrowserConfig config);

    // Throws Error(Transport/Deserialization) when the directory cannot be
    // fetched and Error(Filesystem) when the favorites file cannot be written.
    // Region data discovered on the way is merged into `cache` and reported
    // through `onCacheMerged` even when the write fails afterwards.
    FavoritesReport build(const std::filesystem::path &gameDir,
                          const FilterCriteria &criteria,
                          cache::RegionCache &cache,
                          const CacheMergedFn &onCacheMerged = {}) const;

private:
    std::shared_ptr<DirectoryClient> directory;
    std::shared_ptr<GeolocationResolver> resolver;
    BrowserConfig config;
    ServerFilter filter;
};

} // namespace matchwire::browser
