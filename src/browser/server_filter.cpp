#include "browser/server_filter.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace {

constexpr char kColorEscape = '^';

bool containsAny(const std::string &haystack, const std::vector<std::string> &needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string &needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

template <typename T, typename Predicate>
void swapRemoveIf(std::vector<T> &items, Predicate predicate) {
    for (std::size_t i = items.size(); i-- > 0;) {
        if (predicate(items[i])) {
            if (i != items.size() - 1) {
                std::swap(items[i], items.back());
            }
            items.pop_back();
        }
    }
}

} // namespace

namespace matchwire::browser {

std::string NormalizeHostname(std::string_view name) {
    std::string hostName;
    hostName.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name[i] == kColorEscape) {
            ++i;
            continue;
        }
        hostName.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
    }
    return hostName;
}

std::vector<std::string> NormalizeTerms(const std::vector<std::string> &terms) {
    std::vector<std::string> normalized;
    normalized.reserve(terms.size());
    for (const auto &term : terms) {
        const auto first = term.find_first_not_of(" \t");
        if (first == std::string::npos) {
            normalized.emplace_back();
            continue;
        }
        const auto last = term.find_last_not_of(" \t");
        std::string value = term.substr(first, last - first + 1);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        normalized.push_back(std::move(value));
    }
    return normalized;
}

ServerFilter::ServerFilter(std::string gameId)
    : gameId(std::move(gameId)) {}

bool ServerFilter::accepts(const ServerInfo &server, const FilterCriteria &criteria) const {
    if (server.game != gameId) {
        return false;
    }
    if (criteria.teamSizeMax && server.maxclientnum > *criteria.teamSizeMax * 2) {
        return false;
    }
    if (criteria.playerMin && server.clientnum < *criteria.playerMin) {
        return false;
    }
    if (!criteria.includes && !criteria.excludes) {
        return true;
    }

    const std::string hostName = NormalizeHostname(server.hostname);
    if (criteria.includes && !containsAny(hostName, *criteria.includes)) {
        return false;
    }
    if (criteria.excludes && containsAny(hostName, *criteria.excludes)) {
        return false;
    }
    return true;
}

void ServerFilter::filterHosts(std::vector<Host> &hosts, const FilterCriteria &criteria) const {
    FilterCriteria normalized = criteria;
    if (normalized.includes) {
        normalized.includes = NormalizeTerms(*normalized.includes);
    }
    if (normalized.excludes) {
        normalized.excludes = NormalizeTerms(*normalized.excludes);
    }

    for (auto &host : hosts) {
        swapRemoveIf(host.servers, [&](const ServerInfo &server) { return !accepts(server, normalized); });
    }
    swapRemoveIf(hosts, [](const Host &host) { return host.servers.empty(); });
}

std::vector<ServerInfo> FlattenHosts(std::vector<Host> hosts) {
    std::vector<ServerInfo> servers;
    servers.reserve(CountServers(hosts));
    for (auto &host : hosts) {
        std::move(host.servers.begin(), host.servers.end(), std::back_inserter(servers));
    }
    return servers;
}

std::size_t CountServers(const std::vector<Host> &hosts) {
    std::size_t count = 0;
    for (const auto &host : hosts) {
        count += host.servers.size();
    }
    return count;
}

} // namespace matchwire::browser
