#pragma once

#include "common/errors.hpp"
#include "net/http_client.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

// Canned responses keyed by URL. Unknown URLs fail with a transport error.
class FakeHttpClient final : public matchwire::net::IHttpClient {
public:
    void respond(const std::string &url, std::string body) {
        std::lock_guard<std::mutex> lock(mutex);
        responses[url] = std::move(body);
    }

    matchwire::net::HttpResponse get(const std::string &url) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls[url];
        const auto it = responses.find(url);
        if (it == responses.end()) {
            throw MATCHWIRE_ERROR(matchwire::ErrorKind::Transport, "no route to " + url);
        }
        return {200, it->second};
    }

    std::size_t callCount(const std::string &url) const {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = calls.find(url);
        return it == calls.end() ? 0 : it->second;
    }

    std::size_t totalCalls() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t total = 0;
        for (const auto &[url, count] : calls) {
            total += count;
        }
        return total;
    }

private:
    mutable std::mutex mutex;
    std::map<std::string, std::string> responses;
    std::map<std::string, std::size_t> calls;
};
