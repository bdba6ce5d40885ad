#pragma once

#include "browser/browser_config.hpp"
#include "browser/directory_client.hpp"
#include "browser/geolocation_resolver.hpp"
#include "cache/region_cache.hpp"

#include <string>
#include <vector>

namespace matchwire::cache {

struct CacheBuildResult {
    CacheSnapshot snapshot;
    std::size_t failureCount = 0;
};

// Resolves every distinct host identity once. Extra addresses (e.g. servers
// the game connected to) are resolved as well when not already covered.
class CacheBuilder {
public:
    CacheBuilder(std::shared_ptr<browser::DirectoryClient> directory,
                 std::shared_ptr<browser::GeolocationClient> geolocation,
                 browser::BrowserConfig config,
                 bool concurrent);

    // Throws Error(Transport/Deserialization) when the directory cannot be fetched.
    CacheBuildResult build(const std::vector<std::string> &extraAddresses = {}) const;

    CacheBuildResult buildFromHosts(const std::vector<browser::Host> &hosts,
                                    const std::vector<std::string> &extraAddresses) const;

private:
    std::shared_ptr<browser::DirectoryClient> directory;
    std::shared_ptr<browser::GeolocationClient> geolocation;
    browser::BrowserConfig config;
    bool concurrent;
};

// "1.2.3.4:27016" -> "1.2.3.4", "[::1]:27016" -> "::1", "host" -> "host".
std::string StripPort(const std::string &address);

} // namespace matchwire::cache
