#pragma once

#include <memory>
#include <string>

namespace matchwire::net {

struct HttpResponse {
    long status = 0;
    std::string body;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Performs a blocking GET. Throws Error(Transport) when the request
    // cannot complete or the server answers outside the 2xx range.
    virtual HttpResponse get(const std::string &url) = 0;
};

std::shared_ptr<IHttpClient> createDefaultHttpClient(long timeoutSeconds);

} // namespace matchwire::net
