#pragma once

#include "browser/server_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace matchwire::browser {

// Strips "^<c>" color escapes and lowercases the rest.
std::string NormalizeHostname(std::string_view name);

// Trims and lowercases each filter term.
std::vector<std::string> NormalizeTerms(const std::vector<std::string> &terms);

// Applies every criterion except region. Only set membership of the result
// is meaningful; servers are removed by swapping with the last element.
class ServerFilter {
public:
    explicit ServerFilter(std::string gameId);

    // Removes rejected servers in place and drops hosts left empty.
    void filterHosts(std::vector<Host> &hosts, const FilterCriteria &criteria) const;

    bool accepts(const ServerInfo &server, const FilterCriteria &normalizedCriteria) const;

private:
    std::string gameId;
};

std::vector<ServerInfo> FlattenHosts(std::vector<Host> hosts);
std::size_t CountServers(const std::vector<Host> &hosts);

} // namespace matchwire::browser
