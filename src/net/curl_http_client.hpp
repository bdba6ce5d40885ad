#pragma once

#include "net/http_client.hpp"

namespace matchwire::net {

// libcurl easy-handle client. Each call owns its own handle, so one instance
// may be shared by any number of threads.
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(long timeoutSeconds);

    HttpResponse get(const std::string &url) override;

private:
    long timeoutSeconds;
};

} // namespace matchwire::net
