#include "app/refresh_scheduler.hpp"

#include <spdlog/spdlog.h>

namespace matchwire::app {

RefreshScheduler::RefreshScheduler(std::shared_ptr<CommandContext> context, std::chrono::seconds interval)
    : context(std::move(context)),
      interval(interval) {}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::start() {
    if (worker.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = false;
    }
    worker = std::thread(&RefreshScheduler::workerProc, this);
}

void RefreshScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = true;
    }
    cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

bool RefreshScheduler::tick() {
    if (!context->testAndClearCacheDirty()) {
        return false;
    }
    if (!context->requestFlush()) {
        spdlog::trace("RefreshScheduler: flush already pending");
        return false;
    }
    spdlog::debug("RefreshScheduler: cache flush requested");
    return true;
}

void RefreshScheduler::workerProc() {
    std::unique_lock<std::mutex> lock(mutex);
    while (!stopRequested) {
        if (cv.wait_for(lock, interval, [&]() { return stopRequested; })) {
            return;
        }
        lock.unlock();
        tick();
        lock.lock();
    }
}

} // namespace matchwire::app
