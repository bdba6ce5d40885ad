#include "net/curl_http_client.hpp"

#include "common/curl_global.hpp"
#include "common/errors.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace {
size_t AppendResponse(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<std::string *>(userdata);
    const size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}
} // namespace

namespace matchwire::net {

CurlHttpClient::CurlHttpClient(long timeoutSeconds)
    : timeoutSeconds(timeoutSeconds) {
    if (!EnsureCurlGlobalInit()) {
        spdlog::warn("CurlHttpClient: HTTP requests will fail");
    }
}

HttpResponse CurlHttpClient::get(const std::string &url) {
    if (!EnsureCurlGlobalInit()) {
        throw MATCHWIRE_ERROR(ErrorKind::Transport, "cURL is not initialized");
    }

    CURL *curlHandle = curl_easy_init();
    if (!curlHandle) {
        throw MATCHWIRE_ERROR(ErrorKind::Transport, "curl_easy_init failed");
    }

    HttpResponse response;
    char errorBuffer[CURL_ERROR_SIZE];
    errorBuffer[0] = '\0';
    curl_easy_setopt(curlHandle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_USERAGENT, "matchwire");
    if (timeoutSeconds > 0) {
        curl_easy_setopt(curlHandle, CURLOPT_TIMEOUT, timeoutSeconds);
    }
    curl_easy_setopt(curlHandle, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, AppendResponse);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &response.body);

    const CURLcode result = curl_easy_perform(curlHandle);
    if (result == CURLE_OK) {
        curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_easy_cleanup(curlHandle);

    if (result != CURLE_OK) {
        const std::string reason = errorBuffer[0] != '\0' ? std::string(errorBuffer) : curl_easy_strerror(result);
        throw MATCHWIRE_ERROR(ErrorKind::Transport, "Request to " + url + " failed: " + reason);
    }
    if (response.status < 200 || response.status >= 300) {
        throw MATCHWIRE_ERROR(ErrorKind::Transport,
                              url + " returned HTTP status " + std::to_string(response.status));
    }
    return response;
}

std::shared_ptr<IHttpClient> createDefaultHttpClient(long timeoutSeconds) {
    return std::make_shared<CurlHttpClient>(timeoutSeconds);
}

} // namespace matchwire::net
