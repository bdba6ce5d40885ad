#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace matchwire::browser {

struct ServerInfo {
    int64_t id = 0;
    std::string ip;
    uint16_t port = 0;
    std::string hostname;
    int64_t clientnum = 0;
    int64_t maxclientnum = 0;
    std::string game;
};

struct Host {
    std::string ipAddress;
    std::string webfrontUrl;
    std::vector<ServerInfo> servers;
};

enum class Region {
    NA,
    EU,
    APAC
};

std::optional<Region> ParseRegion(std::string_view text);
std::string_view RegionName(Region region);

// Continent codes accepted for each region.
struct RegionPolicy {
    std::string naCode = "NA";
    std::string euCode = "EU";
    std::unordered_set<std::string> apacCodes{"AS", "OC", "AF"};

    bool matches(Region region, const std::string &continentCode) const;
};

struct FilterCriteria {
    std::size_t limit = 100;
    std::optional<int64_t> teamSizeMax;
    std::optional<int64_t> playerMin;
    std::optional<std::vector<std::string>> includes;
    std::optional<std::vector<std::string>> excludes;
    std::optional<Region> region;
};

// "ip:port" as written to the favorites file.
std::string ServerAddress(const ServerInfo &server);

} // namespace matchwire::browser
