#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace matchwire {

// Fixed size pool for long running command work. A pool created with zero
// threads runs every task inline on the submitting thread.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> submit(Fn &&fn) {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        if (threads.empty()) {
            (*task)();
            return future;
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->tasks.emplace_back([task]() { (*task)(); });
        }
        state->cv.notify_one();
        return future;
    }

    std::size_t threadCount() const { return threads.size(); }
    bool isInline() const { return threads.empty(); }

    // Stops accepting work. Queued tasks are dropped; running tasks are left
    // to finish on detached threads when waitForRunning is false. Returns the
    // number of tasks still running when the threads were detached.
    std::size_t shutdown(bool waitForRunning);

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::function<void()>> tasks;
        std::size_t running = 0;
        bool stopRequested = false;
    };

    static void workerProc(std::shared_ptr<State> state);

    std::shared_ptr<State> state;
    std::vector<std::thread> threads;
};

} // namespace matchwire
