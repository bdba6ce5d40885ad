#include "common/worker_pool.hpp"

#include <spdlog/spdlog.h>

namespace matchwire {

WorkerPool::WorkerPool(std::size_t threadCount)
    : state(std::make_shared<State>()) {
    threads.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        threads.emplace_back(&WorkerPool::workerProc, state);
    }
    spdlog::debug("WorkerPool: started with {} thread(s)", threadCount);
}

WorkerPool::~WorkerPool() {
    shutdown(true);
}

std::size_t WorkerPool::shutdown(bool waitForRunning) {
    std::size_t running = 0;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->stopRequested && threads.empty()) {
            return 0;
        }
        state->stopRequested = true;
        state->tasks.clear();
        running = state->running;
    }
    state->cv.notify_all();

    for (auto &thread : threads) {
        if (!thread.joinable()) {
            continue;
        }
        if (waitForRunning) {
            thread.join();
        } else {
            thread.detach();
        }
    }
    threads.clear();
    return waitForRunning ? 0 : running;
}

void WorkerPool::workerProc(std::shared_ptr<State> state) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&]() { return state->stopRequested || !state->tasks.empty(); });
            if (state->stopRequested) {
                return;
            }
            task = std::move(state->tasks.front());
            state->tasks.pop_front();
            ++state->running;
        }
        task();
        std::lock_guard<std::mutex> lock(state->mutex);
        --state->running;
    }
}

} // namespace matchwire
