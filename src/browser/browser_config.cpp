#include "browser/browser_config.hpp"

#include "common/config_helpers.hpp"

#include <algorithm>

namespace matchwire::browser {

std::string BrowserConfig::directoryUrl() const {
    std::string base = masterUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + directoryEndpoint;
}

std::string BrowserConfig::locationUrlFor(const std::string &ip) const {
    return locationUrl + ip + locationApiKey;
}

bool BrowserConfig::isLoopbackMarker(const std::string &ip) const {
    return std::find(loopbackMarkers.begin(), loopbackMarkers.end(), ip) != loopbackMarkers.end();
}

BrowserConfig LoadBrowserConfig() {
    BrowserConfig config;
    config.masterUrl = config::ReadStringConfig("directory.MasterUrl", config.masterUrl);
    config.directoryEndpoint = config::ReadStringConfig("directory.Endpoint", config.directoryEndpoint);
    config.locationUrl = config::ReadStringConfig("geolocation.LocationUrl", config.locationUrl);
    config.locationApiKey = config::ReadStringConfig("geolocation.ApiKey", config.locationApiKey);
    config.gameId = config::ReadStringConfig("game.Id", config.gameId);
    config.loopbackMarkers = config::ReadStringListConfig("game.LoopbackMarkers", config.loopbackMarkers);

    const auto apac = config::ReadStringListConfig("geolocation.ApacContinents", {"AS", "OC", "AF"});
    config.regions.apacCodes = std::unordered_set<std::string>(apac.begin(), apac.end());

    const int limit = config::ReadIntConfig({"favorites.DefaultLimit"}, static_cast<int>(config.defaultLimit));
    if (limit > 0) {
        config.defaultLimit = static_cast<std::size_t>(limit);
    }
    config.favoritesPath = config::ReadStringConfig("favorites.Path", config.favoritesPath.string());
    return config;
}

} // namespace matchwire::browser
