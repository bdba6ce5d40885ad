#include "app/interactive_session.hpp"

#include "cache/cache_file.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <poll.h>

namespace {

constexpr int kPollTimeoutMs = 250;
constexpr std::chrono::milliseconds kJoinSlice{50};

} // namespace

namespace matchwire::app {

InteractiveSession::InteractiveSession(std::shared_ptr<CommandContext> context,
                                       CommandDispatcher &dispatcher,
                                       GameConsole &console,
                                       LineEditor &editor,
                                       std::string version)
    : context(std::move(context)),
      dispatcher(dispatcher),
      console(console),
      editor(editor),
      version(std::move(version)) {}

void InteractiveSession::run(std::atomic<bool> &running) {
    editor.renderPrompt();
    bool awaitingPrompt = false;

    while (running.load()) {
        // Input is not read while spawned work is outstanding, so the prompt
        // is only drawn once the last command has fully completed.
        const bool acceptInput = pending.empty();

        std::vector<pollfd> fds;
        if (acceptInput) {
            fds.push_back({editor.fd(), POLLIN, 0});
        }
        if (console.fd() >= 0) {
            fds.push_back({console.fd(), POLLIN, 0});
        }

        const int timeout = acceptInput ? kPollTimeoutMs : 0;
        const int ready = fds.empty() ? 0 : ::poll(fds.data(), fds.size(), timeout);
        if (ready < 0 && errno != EINTR) {
            spdlog::error("InteractiveSession: poll failed: {}", std::strerror(errno));
            break;
        }

        for (const auto &fd : fds) {
            if (fd.revents == 0) {
                continue;
            }
            if (fd.fd == console.fd()) {
                console.pump();
            } else if (fd.fd == editor.fd()) {
                // One read per readiness; further lines come from the buffer.
                auto line = editor.poll();
                while (line && running.load()) {
                    handleLine(*line, running);
                    awaitingPrompt = true;
                    if (!pending.empty()) {
                        break;
                    }
                    line = editor.nextBufferedLine();
                }
                if (editor.closed()) {
                    running = false;
                }
            }
        }

        serviceFlushRequest();

        if (!pending.empty() && !reapPending(kJoinSlice)) {
            continue;
        }
        // Lines typed while a task was running are handled before prompting.
        while (running.load() && pending.empty()) {
            auto line = editor.nextBufferedLine();
            if (!line) {
                break;
            }
            handleLine(*line, running);
            awaitingPrompt = true;
        }
        if (awaitingPrompt && pending.empty() && running.load()) {
            editor.renderPrompt();
            awaitingPrompt = false;
        }
    }

    if (!pending.empty()) {
        spdlog::info("InteractiveSession: abandoning {} running command(s)", pending.size());
        pending.clear();
    }
}

void InteractiveSession::handleLine(const std::string &line, std::atomic<bool> &running) {
    auto handle = dispatcher.dispatch(line);
    if (!handle.response.empty()) {
        std::cout << handle.response << std::endl;
    }
    if (handle.task) {
        pending.push_back(std::move(*handle.task));
    }
    if (handle.exit) {
        running = false;
    }
}

bool InteractiveSession::reapPending(std::chrono::milliseconds wait) {
    for (auto it = pending.begin(); it != pending.end();) {
        if (it->wait_for(wait) != std::future_status::ready) {
            ++it;
            continue;
        }
        try {
            it->get();
        } catch (const std::exception &ex) {
            spdlog::error("InteractiveSession: command failed: {}", ex.what());
        }
        it = pending.erase(it);
    }
    return pending.empty();
}

bool InteractiveSession::serviceFlushRequest() {
    if (!context->takeFlushRequest()) {
        return false;
    }
    context->testAndClearCacheDirty();
    return persist();
}

bool InteractiveSession::flushIfDirty() {
    if (!context->testAndClearCacheDirty()) {
        return false;
    }
    return persist();
}

bool InteractiveSession::persist() {
    const auto path = context->cachePath();
    if (!path) {
        return false;
    }
    if (!cache::PersistRegionCache(*context->cache(), *path, version)) {
        // Raise the flag again so the next scheduler tick retries.
        context->markCacheDirty();
        return false;
    }
    spdlog::debug("InteractiveSession: region cache saved to {}", path->string());
    return true;
}

} // namespace matchwire::app
