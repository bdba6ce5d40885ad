#pragma once

#include "browser/server_types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace matchwire::browser {

inline constexpr std::size_t kDefaultServerCap = 100;

// Returns the servers in the order the game browser lists favorites, back to
// front. With more than `limit` servers only the `limit` most populated are
// kept, most populated first.
std::vector<ServerInfo> SelectFavorites(std::vector<ServerInfo> servers, std::size_t limit);

// ["ip:port","ip:port"]
std::string SerializeFavorites(const std::vector<ServerInfo> &servers);

class FavoritesWriter {
public:
    explicit FavoritesWriter(std::filesystem::path favoritesPath);

    // Selects, serializes and atomically replaces the favorites file.
    // Returns the number of entries written. Throws Error(Filesystem).
    std::size_t write(std::vector<ServerInfo> servers, std::size_t limit) const;

    const std::filesystem::path &path() const { return favoritesPath; }

private:
    std::filesystem::path favoritesPath;
};

} // namespace matchwire::browser
