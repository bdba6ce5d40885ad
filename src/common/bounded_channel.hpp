#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace matchwire {

// Multi-producer queue with a fixed capacity. trySend never blocks; a full
// channel rejects the value.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity) : capacity(capacity == 0 ? 1 : capacity) {}

    bool trySend(T value) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.size() >= capacity) {
            return false;
        }
        queue.push_back(std::move(value));
        return true;
    }

    std::optional<T> tryReceive() {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue.front());
        queue.pop_front();
        return value;
    }

private:
    const std::size_t capacity;
    std::mutex mutex;
    std::deque<T> queue;
};

} // namespace matchwire
