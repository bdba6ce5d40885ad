#pragma once

#include "browser/server_types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace matchwire::browser {

// Immutable settings handed to the discovery pipeline at construction.
struct BrowserConfig {
    std::string masterUrl = "https://master.iw4.zip/";
    std::string directoryEndpoint = "instance";
    std::string locationUrl = "https://api.findip.net/";
    std::string locationApiKey;
    std::string gameId = "H2M";
    std::vector<std::string> loopbackMarkers{"localhost"};
    RegionPolicy regions;
    std::size_t defaultLimit = 100;
    std::filesystem::path favoritesPath = std::filesystem::path("players2") / "favourites.json";

    std::string directoryUrl() const;
    std::string locationUrlFor(const std::string &ip) const;
    bool isLoopbackMarker(const std::string &ip) const;
};

// Reads the "directory", "geolocation", "game" and "favorites" sections of
// the configuration store.
BrowserConfig LoadBrowserConfig();

} // namespace matchwire::browser
