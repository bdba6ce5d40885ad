#include "common/curl_global.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <curl/curl.h>
#include <mutex>

namespace matchwire::net {

bool EnsureCurlGlobalInit() {
    static std::once_flag flag;
    static bool initialized = false;
    std::call_once(flag, []() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        initialized = (code == CURLE_OK);
        if (!initialized) {
            spdlog::error("CurlHttpClient: curl_global_init failed: {}", curl_easy_strerror(code));
            return;
        }
        std::atexit([]() { curl_global_cleanup(); });
    });
    return initialized;
}

} // namespace matchwire::net
