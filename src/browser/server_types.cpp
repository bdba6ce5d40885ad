#include "browser/server_types.hpp"

#include <algorithm>
#include <cctype>

namespace matchwire::browser {

std::optional<Region> ParseRegion(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (upper == "NA") {
        return Region::NA;
    }
    if (upper == "EU") {
        return Region::EU;
    }
    if (upper == "APAC") {
        return Region::APAC;
    }
    return std::nullopt;
}

std::string_view RegionName(Region region) {
    switch (region) {
    case Region::NA:
        return "NA";
    case Region::EU:
        return "EU";
    case Region::APAC:
        return "APAC";
    }
    return "?";
}

bool RegionPolicy::matches(Region region, const std::string &continentCode) const {
    switch (region) {
    case Region::NA:
        return continentCode == naCode;
    case Region::EU:
        return continentCode == euCode;
    case Region::APAC:
        return apacCodes.count(continentCode) > 0;
    }
    return false;
}

std::string ServerAddress(const ServerInfo &server) {
    return server.ip + ":" + std::to_string(server.port);
}

} // namespace matchwire::browser
