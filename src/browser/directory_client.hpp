#pragma once

#include "browser/browser_config.hpp"
#include "browser/server_types.hpp"
#include "net/http_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace matchwire::browser {

class DirectoryClient {
public:
    DirectoryClient(std::shared_ptr<net::IHttpClient> http, BrowserConfig config);

    // One GET against the master endpoint. Throws Error(Transport) or
    // Error(Deserialization).
    std::vector<Host> fetchDirectory() const;

    static std::vector<Host> parseDirectory(const std::string &body);

private:
    std::shared_ptr<net::IHttpClient> http;
    BrowserConfig config;
};

} // namespace matchwire::browser
