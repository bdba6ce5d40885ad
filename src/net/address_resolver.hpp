#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace matchwire::net {

struct IpAddress {
    int family = 0;    // AF_INET or AF_INET6
    std::string text;  // canonical presentation form

    bool isV6() const;
    bool operator==(const IpAddress &other) const { return family == other.family && text == other.text; }
};

// Parses a literal IPv4 or IPv6 address (brackets allowed). No DNS.
std::optional<IpAddress> ParseIpLiteral(std::string_view text);

// Strips surrounding whitespace and '/'. Surrounding ':' is stripped too
// unless the text is an IP literal, so "::1" stays intact.
std::string_view TrimAddress(std::string_view text);

// Accepts a literal address or a hostname resolved through DNS. Leading and
// trailing '/' and ':' are ignored. Throws Error(InvalidAddress) for empty
// input, an unspecified address (0.0.0.0, ::) or a name that does not resolve.
IpAddress ResolveAddress(std::string_view input);

// Returns the host part of a web front URL: the text after "//" up to the last
// ':' (port) or the end. Bracket-free IPv6 literals are kept whole when the
// port split would break them. Throws Error(InvalidAddress) without "//".
std::string ExtractWebfrontAddress(std::string_view webfrontUrl);

// Resolves a hoster's reported address, falling back to its web front URL.
IpAddress ResolveHostAddress(const std::string &ipAddress, const std::string &webfrontUrl);

} // namespace matchwire::net
