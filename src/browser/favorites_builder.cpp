#include "browser/favorites_builder.hpp"

#include <spdlog/spdlog.h>

namespace matchwire::browser {

FavoritesBuilder::FavoritesBuilder(std::shared_ptr<DirectoryClient> directory,
                                   std::shared_ptr<GeolocationResolver> resolver,
                                   BrowserConfig config)
    : directory(std::move(directory)),
      resolver(std::move(resolver)),
      config(std::move(config)),
      filter(this->config.gameId) {}

FavoritesReport FavoritesBuilder::build(const std::filesystem::path &gameDir,
                                        const FilterCriteria &criteria,
                                        cache::RegionCache &cache,
                                        const CacheMergedFn &onCacheMerged) const {
    FavoritesReport report;
    if (criteria.limit >= kDefaultServerCap) {
        spdlog::warn("NOTE: Currently the in game server browser breaks when you add more than {} servers to favorites",
                     kDefaultServerCap);
    }

    auto hosts = directory->fetchDirectory();
    filter.filterHosts(hosts, criteria);

    std::vector<ServerInfo> servers;
    if (criteria.region) {
        spdlog::info("Determining region of {} servers...", CountServers(hosts));
        auto regional = resolver->filterByRegion(hosts, *criteria.region, &cache);
        if (regional.failureCount > 0) {
            spdlog::error("Failed to resolve location for {} server hoster(s)", regional.failureCount);
        }
        report.failureCount = regional.failureCount;
        report.newCacheEntries = cache.merge(regional.discovered);
        if (report.newCacheEntries > 0 && onCacheMerged) {
            onCacheMerged(report.newCacheEntries);
        }
        servers = std::move(regional.allowed);
    } else {
        servers = FlattenHosts(std::move(hosts));
    }

    report.matched = servers.size();
    spdlog::info("{} servers match the parameters in the current query", report.matched);

    FavoritesWriter writer(gameDir / config.favoritesPath);
    report.written = writer.write(std::move(servers), criteria.limit);
    spdlog::info("{} updated with {} entries", config.favoritesPath.filename().string(), report.written);
    return report;
}

} // namespace matchwire::browser
