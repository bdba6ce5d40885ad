#include "cache/cache_file.hpp"

#include "common/errors.hpp"
#include "common/file_utils.hpp"

#include <spdlog/spdlog.h>

namespace matchwire::cache {

matchwire::json::Value CacheToJson(const CacheSnapshot &snapshot, std::string_view version) {
    auto entries = json::Object();
    for (const auto &[identity, entry] : snapshot.entries) {
        entries[identity] = {
            {"region", entry.region},
            {"ip", entry.ip},
            {"created", entry.created}
        };
    }

    auto document = json::Object();
    document["version"] = std::string(version);
    document["created"] = snapshot.created;
    document["cache"] = std::move(entries);
    return document;
}

std::optional<CacheSnapshot> CacheFromJson(const matchwire::json::Value &document, std::string_view expectedVersion) {
    if (!document.is_object()) {
        spdlog::warn("RegionCache: cache document is not a JSON object");
        return std::nullopt;
    }

    const auto versionIt = document.find("version");
    if (versionIt == document.end() || !versionIt->is_string()) {
        spdlog::warn("RegionCache: cache document has no version");
        return std::nullopt;
    }
    if (versionIt->get<std::string>() != expectedVersion) {
        spdlog::info("RegionCache: cache written by version {} does not match {}, discarding",
                     versionIt->get<std::string>(), expectedVersion);
        return std::nullopt;
    }

    CacheSnapshot snapshot;
    if (const auto createdIt = document.find("created"); createdIt != document.end() && createdIt->is_number_integer()) {
        snapshot.created = createdIt->get<int64_t>();
    }

    const auto cacheIt = document.find("cache");
    if (cacheIt == document.end() || !cacheIt->is_object()) {
        spdlog::warn("RegionCache: cache document is missing the 'cache' object");
        return std::nullopt;
    }

    for (const auto &[identity, value] : cacheIt->items()) {
        if (!value.is_object()) {
            continue;
        }
        RegionCacheEntry entry;
        entry.region = value.value("region", std::string{});
        entry.ip = value.value("ip", std::string{});
        if (const auto it = value.find("created"); it != value.end() && it->is_number_integer()) {
            entry.created = it->get<int64_t>();
        }
        if (entry.region.empty()) {
            continue;
        }
        snapshot.entries.emplace(identity, std::move(entry));
    }
    return snapshot;
}

std::optional<CacheSnapshot> ReadCacheFile(const std::filesystem::path &path, std::string_view expectedVersion) {
    const auto text = file::ReadFileText(path);
    if (!text) {
        spdlog::debug("RegionCache: no cache file at {}", path.string());
        return std::nullopt;
    }
    try {
        return CacheFromJson(json::Parse(*text), expectedVersion);
    } catch (const std::exception &ex) {
        spdlog::warn("RegionCache: Failed to parse {}: {}", path.string(), ex.what());
        return std::nullopt;
    }
}

void WriteCacheFile(const std::filesystem::path &path, const CacheSnapshot &snapshot, std::string_view version) {
    file::WriteFileAtomically(path, json::Dump(CacheToJson(snapshot, version), 2));
}

bool PersistRegionCache(const RegionCache &cache, const std::filesystem::path &path, std::string_view version) {
    const CacheSnapshot snapshot = cache.snapshot();
    try {
        WriteCacheFile(path, snapshot, version);
    } catch (const Error &error) {
        spdlog::error("RegionCache: {}", DescribeError(error));
        return false;
    }
    spdlog::debug("RegionCache: wrote {} entries to {}", snapshot.entries.size(), path.string());
    return true;
}

} // namespace matchwire::cache
