#include "cache/cache_builder.hpp"

#include "common/errors.hpp"
#include "common/task_launch.hpp"
#include "net/address_resolver.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <future>
#include <optional>
#include <unordered_set>

namespace matchwire::cache {

std::string StripPort(const std::string &address) {
    if (!address.empty() && address.front() == '[') {
        const auto closing = address.find(']');
        return closing == std::string::npos ? address.substr(1) : address.substr(1, closing - 1);
    }
    const auto colon = address.rfind(':');
    if (colon == std::string::npos || address.find(':') != colon) {
        // No port, or a bare IPv6 literal.
        return address;
    }
    return address.substr(0, colon);
}

CacheBuilder::CacheBuilder(std::shared_ptr<browser::DirectoryClient> directory,
                           std::shared_ptr<browser::GeolocationClient> geolocation,
                           browser::BrowserConfig config,
                           bool concurrent)
    : directory(std::move(directory)),
      geolocation(std::move(geolocation)),
      config(std::move(config)),
      concurrent(concurrent) {}

CacheBuildResult CacheBuilder::build(const std::vector<std::string> &extraAddresses) const {
    const auto hosts = directory->fetchDirectory();
    return buildFromHosts(hosts, extraAddresses);
}

CacheBuildResult CacheBuilder::buildFromHosts(const std::vector<browser::Host> &hosts,
                                              const std::vector<std::string> &extraAddresses) const {
    using Lookup = std::optional<std::pair<std::string, RegionCacheEntry>>;
    const auto policy = concurrent ? std::launch::async : std::launch::deferred;

    std::unordered_set<std::string> seen;
    std::vector<std::future<Lookup>> tasks;

    auto spawn = [&](std::string identity, std::function<net::IpAddress()> resolve) {
        if (identity.empty() || !seen.insert(identity).second) {
            return;
        }
        tasks.push_back(LaunchOrDefer(policy, [this, identity = std::move(identity), resolve = std::move(resolve)]() -> Lookup {
            try {
                const net::IpAddress address = resolve();
                const std::string continent = geolocation->lookupContinent(address);
                return std::make_pair(identity, RegionCacheEntry{continent, address.text, UnixNow()});
            } catch (const Error &error) {
                spdlog::error("CacheBuilder: {}: {}", identity, DescribeError(error));
                return std::nullopt;
            }
        }));
    };

    for (const auto &host : hosts) {
        for (const auto &server : host.servers) {
            spawn(browser::HostIdentity(host, server, config), [this, &host, &server]() {
                return browser::ResolveServerAddress(host, server, config);
            });
        }
    }
    for (const auto &address : extraAddresses) {
        const std::string identity = StripPort(address);
        spawn(identity, [identity]() { return net::ResolveAddress(identity); });
    }

    spdlog::info("Resolving region of {} distinct server hoster(s)...", tasks.size());

    CacheBuildResult result;
    result.snapshot.created = UnixNow();
    for (auto &task : tasks) {
        Lookup lookup;
        try {
            lookup = task.get();
        } catch (const std::exception &ex) {
            spdlog::error("CacheBuilder: lookup task failed: {}", ex.what());
        }
        if (lookup) {
            result.snapshot.entries.insert_or_assign(lookup->first, lookup->second);
        } else {
            ++result.failureCount;
        }
    }

    if (result.failureCount > 0) {
        spdlog::error("Failed to resolve location for {} server hoster(s)", result.failureCount);
    }
    return result;
}

} // namespace matchwire::cache
