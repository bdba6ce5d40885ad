#include "cache/region_cache.hpp"

#include <chrono>

namespace matchwire::cache {

int64_t UnixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

RegionCache::RegionCache()
    : created(UnixNow()) {}

RegionCache::RegionCache(RegionMap entries, int64_t created)
    : created(created),
      entries(std::move(entries)) {}

std::optional<RegionCacheEntry> RegionCache::lookup(const std::string &identity) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = entries.find(identity);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t RegionCache::merge(const RegionMap &updates) {
    std::size_t changed = 0;
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[identity, entry] : updates) {
        auto [it, inserted] = entries.try_emplace(identity, entry);
        if (inserted) {
            ++changed;
            continue;
        }
        if (it->second.region != entry.region || it->second.ip != entry.ip) {
            ++changed;
        }
        it->second = entry;
    }
    return changed;
}

void RegionCache::replace(CacheSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex);
    created = snapshot.created;
    entries = std::move(snapshot.entries);
}

CacheSnapshot RegionCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return CacheSnapshot{created, entries};
}

std::size_t RegionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

} // namespace matchwire::cache
