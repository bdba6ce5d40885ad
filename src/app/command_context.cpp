#include "app/command_context.hpp"

#include "cache/cache_file.hpp"

namespace matchwire::app {

CommandContext::CommandContext(std::shared_ptr<cache::RegionCache> cache,
                               std::filesystem::path gameDir,
                               std::optional<std::filesystem::path> localDir,
                               std::shared_ptr<WorkerPool> workerPool,
                               std::size_t consoleHistoryLimit)
    : regionCache(std::move(cache)),
      gameDirectory(std::move(gameDir)),
      localDirectory(std::move(localDir)),
      pool(std::move(workerPool)),
      consoleHistoryLimit(consoleHistoryLimit) {}

std::optional<std::filesystem::path> CommandContext::cachePath() const {
    if (!localDirectory) {
        return std::nullopt;
    }
    return *localDirectory / cache::kCacheFileName;
}

void CommandContext::markCacheDirty() {
    cacheDirty.store(true, std::memory_order_release);
}

bool CommandContext::isCacheDirty() const {
    return cacheDirty.load(std::memory_order_acquire);
}

bool CommandContext::testAndClearCacheDirty() {
    return cacheDirty.exchange(false, std::memory_order_acq_rel);
}

bool CommandContext::requestFlush() {
    return flushChannel.trySend(FlushRequest{});
}

std::optional<FlushRequest> CommandContext::takeFlushRequest() {
    return flushChannel.tryReceive();
}

void CommandContext::setConnected(bool value) {
    connected.store(value, std::memory_order_release);
}

bool CommandContext::isConnected() const {
    return connected.load(std::memory_order_acquire);
}

void CommandContext::appendConsoleLine(std::string line) {
    std::lock_guard<std::mutex> lock(consoleMutex);
    consoleLines.push_back(std::move(line));
    while (consoleHistoryLimit > 0 && consoleLines.size() > consoleHistoryLimit) {
        consoleLines.pop_front();
    }
}

std::vector<std::string> CommandContext::consoleHistory() const {
    std::lock_guard<std::mutex> lock(consoleMutex);
    return {consoleLines.begin(), consoleLines.end()};
}

void CommandContext::recordConnection(ConnectionRecord record) {
    std::lock_guard<std::mutex> lock(connectionMutex);
    connections.push_back(std::move(record));
}

std::vector<ConnectionRecord> CommandContext::connectionHistory() const {
    std::lock_guard<std::mutex> lock(connectionMutex);
    return connections;
}

} // namespace matchwire::app
