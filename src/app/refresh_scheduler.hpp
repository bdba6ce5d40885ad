#pragma once

#include "app/command_context.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace matchwire::app {

// Periodically converts the cache dirty flag into a flush request for the
// single consumer that owns cache file I/O.
class RefreshScheduler {
public:
    RefreshScheduler(std::shared_ptr<CommandContext> context, std::chrono::seconds interval);
    ~RefreshScheduler();

    void start();
    void stop();

    // One scheduler wake-up. Returns true when a flush was requested.
    bool tick();

private:
    void workerProc();

    std::shared_ptr<CommandContext> context;
    std::chrono::seconds interval;
    std::mutex mutex;
    std::condition_variable cv;
    std::thread worker;
    bool stopRequested = false;
};

} // namespace matchwire::app
