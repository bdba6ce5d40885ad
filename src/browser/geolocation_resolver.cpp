#include "browser/geolocation_resolver.hpp"

#include "common/errors.hpp"
#include "common/task_launch.hpp"
#include "common/json.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <optional>
#include <utility>

namespace {

struct TaskResult {
    matchwire::browser::LookupOutcome outcome = matchwire::browser::LookupOutcome::Error;
    matchwire::browser::ServerInfo server;
    std::optional<std::pair<std::string, matchwire::cache::RegionCacheEntry>> discovered;
    std::string error;
};

std::string TrimmedAddress(const std::string &text) {
    return std::string(matchwire::net::TrimAddress(text));
}

} // namespace

namespace matchwire::browser {

GeolocationClient::GeolocationClient(std::shared_ptr<net::IHttpClient> http, BrowserConfig config)
    : http(std::move(http)),
      config(std::move(config)) {}

std::string GeolocationClient::lookupContinent(const net::IpAddress &address) const {
    const std::string url = config.locationUrlFor(address.text);
    const auto response = http->get(url);

    json::Value body;
    try {
        body = json::Parse(response.body);
    } catch (const std::exception &ex) {
        throw MATCHWIRE_ERROR(ErrorKind::ResolutionFailure,
                              std::string(ex.what()) + ", outbound address: " + address.text);
    }

    if (!body.is_object()) {
        throw MATCHWIRE_ERROR(ErrorKind::ResolutionFailure, "unexpected response for " + address.text);
    }
    if (const auto it = body.find("continent"); it != body.end() && it->is_string()) {
        return it->get<std::string>();
    }
    std::string message = "unknown error";
    if (const auto it = body.find("message"); it != body.end() && it->is_string()) {
        message = it->get<std::string>();
    }
    throw MATCHWIRE_ERROR(ErrorKind::ResolutionFailure, message);
}

std::string HostIdentity(const Host &host, const ServerInfo &server, const BrowserConfig &config) {
    if (!config.isLoopbackMarker(server.ip)) {
        return TrimmedAddress(server.ip);
    }
    // Follows ResolveHostAddress: the reported address when it resolves,
    // otherwise the web front host.
    std::string identity;
    try {
        net::ResolveAddress(host.ipAddress);
        identity = TrimmedAddress(host.ipAddress);
    } catch (const Error &error) {
        spdlog::debug("GeolocationResolver: hoster address '{}' unusable: {}", host.ipAddress, DescribeError(error));
    }
    if (identity.empty() && !host.webfrontUrl.empty()) {
        try {
            identity = TrimmedAddress(net::ExtractWebfrontAddress(host.webfrontUrl));
        } catch (const Error &error) {
            spdlog::debug("GeolocationResolver: {}", DescribeError(error));
        }
    }
    return identity.empty() ? TrimmedAddress(server.ip) : identity;
}

net::IpAddress ResolveServerAddress(const Host &host, const ServerInfo &server, const BrowserConfig &config) {
    if (config.isLoopbackMarker(server.ip)) {
        try {
            return net::ResolveHostAddress(host.ipAddress, host.webfrontUrl);
        } catch (const Error &error) {
            spdlog::debug("GeolocationResolver: could not recover address for server {}: {}",
                          server.id, DescribeError(error));
        }
    }
    return net::ResolveAddress(server.ip);
}

GeolocationResolver::GeolocationResolver(std::shared_ptr<GeolocationClient> client, BrowserConfig config, bool concurrent)
    : client(std::move(client)),
      config(std::move(config)),
      concurrent(concurrent) {}

RegionFilterResult GeolocationResolver::filterByRegion(const std::vector<Host> &hosts,
                                                       Region region,
                                                       const cache::RegionCache *cache) const {
    const auto policy = concurrent ? std::launch::async : std::launch::deferred;

    std::vector<std::future<TaskResult>> tasks;
    for (const auto &host : hosts) {
        for (const auto &server : host.servers) {
            tasks.push_back(LaunchOrDefer(policy, [this, &host, server, region, cache]() {
                TaskResult result;
                result.server = server;
                try {
                    const std::string identity = HostIdentity(host, server, config);
                    std::string continent;
                    if (auto cached = cache ? cache->lookup(identity) : std::nullopt) {
                        continent = cached->region;
                    } else {
                        const net::IpAddress address = ResolveServerAddress(host, server, config);
                        continent = client->lookupContinent(address);
                        result.discovered.emplace(identity,
                                                  cache::RegionCacheEntry{continent, address.text, cache::UnixNow()});
                    }
                    result.outcome = config.regions.matches(region, continent)
                        ? LookupOutcome::Allowed
                        : LookupOutcome::Filtered;
                } catch (const Error &error) {
                    result.outcome = LookupOutcome::Error;
                    result.error = DescribeError(error) + ", server id: " + std::to_string(server.id);
                }
                return result;
            }));
        }
    }

    RegionFilterResult filtered;
    for (auto &task : tasks) {
        TaskResult result;
        try {
            result = task.get();
        } catch (const std::exception &ex) {
            spdlog::error("GeolocationResolver: lookup task failed: {}", ex.what());
            ++filtered.failureCount;
            continue;
        }

        if (result.discovered) {
            filtered.discovered.insert_or_assign(result.discovered->first, result.discovered->second);
        }
        switch (result.outcome) {
        case LookupOutcome::Allowed:
            filtered.allowed.push_back(std::move(result.server));
            break;
        case LookupOutcome::Filtered:
            break;
        case LookupOutcome::Error:
            spdlog::error("GeolocationResolver: {}", result.error);
            ++filtered.failureCount;
            break;
        }
    }
    return filtered;
}

} // namespace matchwire::browser
