#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace matchwire::cache {

struct RegionCacheEntry {
    std::string region;  // continent code reported by the geolocation service
    std::string ip;      // address the lookup was made for
    int64_t created = 0; // unix seconds

    bool operator==(const RegionCacheEntry &other) const {
        return region == other.region && ip == other.ip && created == other.created;
    }
};

// Keyed by host identity.
using RegionMap = std::unordered_map<std::string, RegionCacheEntry>;

struct CacheSnapshot {
    int64_t created = 0;
    RegionMap entries;
};

int64_t UnixNow();

// Shared, lock guarded identity -> region mapping. The lock is only held for
// in-memory reads and edits; callers copy a snapshot before doing I/O.
class RegionCache {
public:
    RegionCache();
    RegionCache(RegionMap entries, int64_t created);

    RegionCache(const RegionCache &) = delete;
    RegionCache &operator=(const RegionCache &) = delete;

    std::optional<RegionCacheEntry> lookup(const std::string &identity) const;

    // Last write wins. Returns how many identities were added or changed
    // region/ip; refreshing only the timestamp does not count.
    std::size_t merge(const RegionMap &updates);

    void replace(CacheSnapshot snapshot);
    CacheSnapshot snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex;
    int64_t created;
    RegionMap entries;
};

} // namespace matchwire::cache
