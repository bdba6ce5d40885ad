#pragma once

#include "browser/browser_config.hpp"
#include "browser/server_types.hpp"
#include "cache/region_cache.hpp"
#include "net/address_resolver.hpp"
#include "net/http_client.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace matchwire::browser {

// Thin client for the IP geolocation endpoint.
class GeolocationClient {
public:
    GeolocationClient(std::shared_ptr<net::IHttpClient> http, BrowserConfig config);

    // Returns the continent code for the address. Throws
    // Error(ResolutionFailure) with the service message when none is given.
    std::string lookupContinent(const net::IpAddress &address) const;

private:
    std::shared_ptr<net::IHttpClient> http;
    BrowserConfig config;
};

// Address a server is identified by in the region cache. Servers reporting a
// loopback marker are identified by their hoster's address.
std::string HostIdentity(const Host &host, const ServerInfo &server, const BrowserConfig &config);

// Resolves the public address of a server, substituting the hoster's address
// for loopback markers.
net::IpAddress ResolveServerAddress(const Host &host, const ServerInfo &server, const BrowserConfig &config);

enum class LookupOutcome {
    Allowed,
    Filtered,
    Error
};

struct RegionFilterResult {
    std::vector<ServerInfo> allowed;
    std::size_t failureCount = 0;
    cache::RegionMap discovered;
};

// Fans out one task per server and keeps those located in the requested
// region. Lookup failures are counted, never propagated.
class GeolocationResolver {
public:
    GeolocationResolver(std::shared_ptr<GeolocationClient> client, BrowserConfig config, bool concurrent);

    RegionFilterResult filterByRegion(const std::vector<Host> &hosts,
                                      Region region,
                                      const cache::RegionCache *cache) const;

private:
    std::shared_ptr<GeolocationClient> client;
    BrowserConfig config;
    bool concurrent;
};

} // namespace matchwire::browser
