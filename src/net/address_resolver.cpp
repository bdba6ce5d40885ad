#include "net/address_resolver.hpp"

#include "common/errors.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace {

bool IsUnspecified(const matchwire::net::IpAddress &address) {
    if (address.family == AF_INET) {
        in_addr raw{};
        return inet_pton(AF_INET, address.text.c_str(), &raw) == 1 && raw.s_addr == htonl(INADDR_ANY);
    }
    in6_addr raw{};
    return inet_pton(AF_INET6, address.text.c_str(), &raw) == 1 && IN6_IS_ADDR_UNSPECIFIED(&raw);
}

std::optional<matchwire::net::IpAddress> FromSockaddr(const sockaddr *addr) {
    char buffer[INET6_ADDRSTRLEN] = {};
    if (addr->sa_family == AF_INET) {
        const auto *v4 = reinterpret_cast<const sockaddr_in *>(addr);
        if (inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer))) {
            return matchwire::net::IpAddress{AF_INET, buffer};
        }
    } else if (addr->sa_family == AF_INET6) {
        const auto *v6 = reinterpret_cast<const sockaddr_in6 *>(addr);
        if (inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer))) {
            return matchwire::net::IpAddress{AF_INET6, buffer};
        }
    }
    return std::nullopt;
}

} // namespace

namespace matchwire::net {

bool IpAddress::isV6() const {
    return family == AF_INET6;
}

std::string_view TrimAddress(std::string_view text) {
    auto trimSet = [](std::string_view value, std::string_view chars) {
        const auto first = value.find_first_not_of(chars);
        if (first == std::string_view::npos) {
            return std::string_view{};
        }
        const auto last = value.find_last_not_of(chars);
        return value.substr(first, last - first + 1);
    };
    text = trimSet(text, " \t\r\n");
    text = trimSet(text, "/");
    // Colons only frame hostnames and IPv4; "::1" must stay intact.
    if (ParseIpLiteral(text)) {
        return text;
    }
    return trimSet(text, ":");
}

std::optional<IpAddress> ParseIpLiteral(std::string_view text) {
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        text = text.substr(1, text.size() - 2);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string value(text);
    char buffer[INET6_ADDRSTRLEN] = {};

    in_addr v4{};
    if (inet_pton(AF_INET, value.c_str(), &v4) == 1 && inet_ntop(AF_INET, &v4, buffer, sizeof(buffer))) {
        return IpAddress{AF_INET, buffer};
    }
    in6_addr v6{};
    if (inet_pton(AF_INET6, value.c_str(), &v6) == 1 && inet_ntop(AF_INET6, &v6, buffer, sizeof(buffer))) {
        return IpAddress{AF_INET6, buffer};
    }
    return std::nullopt;
}

IpAddress ResolveAddress(std::string_view input) {
    const std::string_view trimmed = TrimAddress(input);
    if (trimmed.empty()) {
        throw MATCHWIRE_ERROR(ErrorKind::InvalidAddress, "Ip can not be empty");
    }

    if (auto literal = ParseIpLiteral(trimmed)) {
        if (IsUnspecified(*literal)) {
            throw MATCHWIRE_ERROR(ErrorKind::InvalidAddress, "Addr: " + literal->text + ", is not valid");
        }
        return *literal;
    }

    const std::string host(trimmed);
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *results = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0 || !results) {
        throw MATCHWIRE_ERROR(ErrorKind::InvalidAddress,
                              "Hostname " + host + " could not be resolved: " + gai_strerror(rc));
    }

    std::optional<IpAddress> resolved;
    for (const addrinfo *entry = results; entry && !resolved; entry = entry->ai_next) {
        if (entry->ai_addr) {
            resolved = FromSockaddr(entry->ai_addr);
        }
    }
    freeaddrinfo(results);

    if (!resolved || IsUnspecified(*resolved)) {
        throw MATCHWIRE_ERROR(ErrorKind::InvalidAddress, "Hostname " + host + " could not be resolved");
    }
    return *resolved;
}

std::string ExtractWebfrontAddress(std::string_view webfrontUrl) {
    constexpr std::string_view kSchemeEnding = "//";
    const auto schemePos = webfrontUrl.find(kSchemeEnding);
    if (schemePos == std::string_view::npos) {
        throw MATCHWIRE_ERROR(ErrorKind::InvalidAddress,
                              "Web front url has no scheme: " + std::string(webfrontUrl));
    }

    std::string_view remainder = webfrontUrl.substr(schemePos + kSchemeEnding.size());
    if (const auto pathPos = remainder.find('/'); pathPos != std::string_view::npos) {
        remainder = remainder.substr(0, pathPos);
    }

    if (!remainder.empty() && remainder.front() == '[') {
        const auto closing = remainder.find(']');
        if (closing == std::string_view::npos) {
            throw MATCHWIRE_ERROR(ErrorKind::InvalidAddress, "Failed to parse ip from " + std::string(webfrontUrl));
        }
        return std::string(remainder.substr(1, closing - 1));
    }

    const auto portPos = remainder.rfind(':');
    if (portPos == std::string_view::npos) {
        return std::string(remainder);
    }
    if (portPos == 0) {
        throw MATCHWIRE_ERROR(ErrorKind::InvalidAddress, "Failed to parse ip from " + std::string(webfrontUrl));
    }

    const std::string_view withoutPort = remainder.substr(0, portPos);
    if (!ParseIpLiteral(TrimAddress(withoutPort)) && ParseIpLiteral(remainder)) {
        return std::string(remainder);
    }
    return std::string(withoutPort);
}

IpAddress ResolveHostAddress(const std::string &ipAddress, const std::string &webfrontUrl) {
    try {
        return ResolveAddress(ipAddress);
    } catch (const Error &) {
        if (webfrontUrl.empty()) {
            throw;
        }
        return ResolveAddress(ExtractWebfrontAddress(webfrontUrl));
    }
}

} // namespace matchwire::net
