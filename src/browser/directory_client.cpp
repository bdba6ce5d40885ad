#include "browser/directory_client.hpp"

#include "common/errors.hpp"
#include "common/json.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <stdexcept>

namespace {

int64_t parseIntegerField(const matchwire::json::Value &object, const char *key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::logic_error &) {
            return 0;
        }
    }
    return 0;
}

std::string parseStringField(const matchwire::json::Value &object, const char *key) {
    const auto it = object.find(key);
    if (it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

matchwire::browser::ServerInfo parseServer(const matchwire::json::Value &server) {
    matchwire::browser::ServerInfo info;
    info.id = parseIntegerField(server, "id");
    info.ip = parseStringField(server, "ip");
    info.hostname = parseStringField(server, "hostname");
    info.game = parseStringField(server, "game");
    info.clientnum = parseIntegerField(server, "clientnum");
    info.maxclientnum = parseIntegerField(server, "maxclientnum");

    const int64_t port = parseIntegerField(server, "port");
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw MATCHWIRE_ERROR(matchwire::ErrorKind::Deserialization,
                              "Server " + std::to_string(info.id) + " has invalid port " + std::to_string(port));
    }
    info.port = static_cast<uint16_t>(port);
    return info;
}

} // namespace

namespace matchwire::browser {

DirectoryClient::DirectoryClient(std::shared_ptr<net::IHttpClient> http, BrowserConfig config)
    : http(std::move(http)),
      config(std::move(config)) {}

std::vector<Host> DirectoryClient::fetchDirectory() const {
    const std::string url = config.directoryUrl();
    spdlog::debug("DirectoryClient: fetching {}", url);
    const auto response = http->get(url);
    auto hosts = parseDirectory(response.body);
    spdlog::debug("DirectoryClient: {} host(s) listed", hosts.size());
    return hosts;
}

std::vector<Host> DirectoryClient::parseDirectory(const std::string &body) {
    json::Value jsonData;
    try {
        jsonData = json::Parse(body);
    } catch (const std::exception &ex) {
        throw MATCHWIRE_ERROR(ErrorKind::Deserialization, std::string("Failed to parse server directory: ") + ex.what());
    }

    if (!jsonData.is_array()) {
        throw MATCHWIRE_ERROR(ErrorKind::Deserialization, "Server directory is not a JSON array");
    }

    std::vector<Host> hosts;
    hosts.reserve(jsonData.size());
    for (const auto &entry : jsonData) {
        if (!entry.is_object()) {
            spdlog::warn("DirectoryClient: Skipping non-object host entry");
            continue;
        }

        Host host;
        host.ipAddress = parseStringField(entry, "ip_address");
        host.webfrontUrl = parseStringField(entry, "webfront_url");

        const auto serversIt = entry.find("servers");
        if (serversIt == entry.end() || !serversIt->is_array()) {
            throw MATCHWIRE_ERROR(ErrorKind::Deserialization,
                                  "Host " + host.webfrontUrl + " is missing a 'servers' array");
        }
        host.servers.reserve(serversIt->size());
        for (const auto &server : *serversIt) {
            if (!server.is_object()) {
                continue;
            }
            host.servers.push_back(parseServer(server));
        }
        hosts.push_back(std::move(host));
    }
    return hosts;
}

} // namespace matchwire::browser
