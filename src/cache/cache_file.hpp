#pragma once

#include "cache/region_cache.hpp"
#include "common/json.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace matchwire::cache {

inline constexpr const char *kCacheFileName = "region_cache.json";

// {"version": ..., "created": ..., "cache": {identity: {region, ip, created}}}
matchwire::json::Value CacheToJson(const CacheSnapshot &snapshot, std::string_view version);

// Returns nullopt when the document is malformed or its version differs.
std::optional<CacheSnapshot> CacheFromJson(const matchwire::json::Value &document, std::string_view expectedVersion);

// Returns nullopt when the file is missing, unreadable, malformed or written
// by a different version. Mismatched files are never migrated.
std::optional<CacheSnapshot> ReadCacheFile(const std::filesystem::path &path, std::string_view expectedVersion);

// Throws Error(Filesystem).
void WriteCacheFile(const std::filesystem::path &path, const CacheSnapshot &snapshot, std::string_view version);

// Snapshots the cache under its lock, then writes outside of it. Failures are
// logged and reported through the return value.
bool PersistRegionCache(const RegionCache &cache, const std::filesystem::path &path, std::string_view version);

} // namespace matchwire::cache
