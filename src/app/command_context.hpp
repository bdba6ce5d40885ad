#pragma once

#include "cache/region_cache.hpp"
#include "common/bounded_channel.hpp"
#include "common/worker_pool.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace matchwire::app {

// A server the game console reported connecting to.
struct ConnectionRecord {
    std::string hostName;
    std::string address;
};

struct FlushRequest {};

// State shared by every command invocation. Each member is synchronized on
// its own so unrelated commands never contend.
class CommandContext {
public:
    CommandContext(std::shared_ptr<cache::RegionCache> cache,
                   std::filesystem::path gameDir,
                   std::optional<std::filesystem::path> localDir,
                   std::shared_ptr<WorkerPool> workerPool,
                   std::size_t consoleHistoryLimit = 5000);

    std::shared_ptr<cache::RegionCache> cache() const { return regionCache; }
    const std::filesystem::path &gameDir() const { return gameDirectory; }
    const std::optional<std::filesystem::path> &localDir() const { return localDirectory; }
    std::optional<std::filesystem::path> cachePath() const;
    WorkerPool &workerPool() { return *pool; }

    void markCacheDirty();
    bool isCacheDirty() const;
    // Clears the flag and reports whether it was set.
    bool testAndClearCacheDirty();

    // Asks the flush owner to persist the cache. False when a request is
    // already pending.
    bool requestFlush();
    std::optional<FlushRequest> takeFlushRequest();

    void setConnected(bool connected);
    bool isConnected() const;

    void appendConsoleLine(std::string line);
    std::vector<std::string> consoleHistory() const;

    void recordConnection(ConnectionRecord record);
    std::vector<ConnectionRecord> connectionHistory() const;

private:
    std::shared_ptr<cache::RegionCache> regionCache;
    const std::filesystem::path gameDirectory;
    const std::optional<std::filesystem::path> localDirectory;
    std::shared_ptr<WorkerPool> pool;

    std::atomic<bool> cacheDirty{false};
    std::atomic<bool> connected{false};
    BoundedChannel<FlushRequest> flushChannel{1};

    const std::size_t consoleHistoryLimit;
    mutable std::mutex consoleMutex;
    std::deque<std::string> consoleLines;

    mutable std::mutex connectionMutex;
    std::vector<ConnectionRecord> connections;
};

} // namespace matchwire::app
