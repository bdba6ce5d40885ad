#pragma once

#include <spdlog/spdlog.h>

#include <future>
#include <system_error>
#include <type_traits>
#include <utility>

namespace matchwire {

// Starts `task` through `launcher`, which receives the task by reference and
// returns its future. When no thread can be started the task is deferred and
// runs on the thread that calls get().
template <typename Launcher, typename Task>
std::future<std::invoke_result_t<Task &>> LaunchWithFallback(Launcher &&launcher, Task task) {
    try {
        return launcher(task);
    } catch (const std::system_error &error) {
        spdlog::warn("TaskLaunch: could not start a thread ({}), running deferred", error.what());
        return std::async(std::launch::deferred, std::move(task));
    }
}

template <typename Task>
std::future<std::invoke_result_t<Task &>> LaunchOrDefer(std::launch policy, Task task) {
    return LaunchWithFallback([policy](Task &pending) { return std::async(policy, pending); }, std::move(task));
}

} // namespace matchwire
