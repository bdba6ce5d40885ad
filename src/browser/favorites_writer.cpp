#include "browser/favorites_writer.hpp"

#include "common/file_utils.hpp"
#include "common/json.hpp"

#include <algorithm>

namespace matchwire::browser {

std::vector<ServerInfo> SelectFavorites(std::vector<ServerInfo> servers, std::size_t limit) {
    if (servers.size() > limit) {
        std::stable_sort(servers.begin(), servers.end(), [](const ServerInfo &a, const ServerInfo &b) {
            return a.clientnum < b.clientnum;
        });
    }
    std::reverse(servers.begin(), servers.end());
    if (servers.size() > limit) {
        servers.resize(limit);
    }
    return servers;
}

std::string SerializeFavorites(const std::vector<ServerInfo> &servers) {
    auto addresses = json::Array();
    for (const auto &server : servers) {
        addresses.push_back(ServerAddress(server));
    }
    return json::Dump(addresses);
}

FavoritesWriter::FavoritesWriter(std::filesystem::path favoritesPath)
    : favoritesPath(std::move(favoritesPath)) {}

std::size_t FavoritesWriter::write(std::vector<ServerInfo> servers, std::size_t limit) const {
    const auto selected = SelectFavorites(std::move(servers), limit);
    file::WriteFileAtomically(favoritesPath, SerializeFavorites(selected));
    return selected.size();
}

} // namespace matchwire::browser
