/*
Address resolution and host identity tests.
*/
#include "browser/browser_config.hpp"
#include "browser/geolocation_resolver.hpp"
#include "common/errors.hpp"
#include "net/address_resolver.hpp"

#include <stdio.h>
#include <string>

using namespace matchwire;

static int g_failures = 0;

#define TEST_CHECK(cond) \
    do { \
        if (!(cond)) { \
            printf("FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond); \
            g_failures += 1; \
        } \
    } while (0)

static bool resolve_fails_with_invalid_address(const std::string &input) {
    try {
        net::ResolveAddress(input);
    } catch (const Error &error) {
        return error.kind() == ErrorKind::InvalidAddress;
    }
    return false;
}

static void test_resolve_literals(void) {
    TEST_CHECK(net::ResolveAddress("127.0.0.1").text == "127.0.0.1");
    TEST_CHECK(net::ResolveAddress("/127.0.0.1:").text == "127.0.0.1");
    TEST_CHECK(net::ResolveAddress(" 10.1.2.3 ").text == "10.1.2.3");

    const auto v6 = net::ResolveAddress("::1");
    TEST_CHECK(v6.isV6());
    TEST_CHECK(v6.text == "::1");
    TEST_CHECK(net::ResolveAddress("[2001:db8::5]").text == "2001:db8::5");
}

static void test_resolve_rejects(void) {
    TEST_CHECK(resolve_fails_with_invalid_address(""));
    TEST_CHECK(resolve_fails_with_invalid_address("//::"));
    TEST_CHECK(resolve_fails_with_invalid_address("0.0.0.0"));
    TEST_CHECK(resolve_fails_with_invalid_address("::"));
}

static void test_unspecified_message(void) {
    try {
        net::ResolveAddress("0.0.0.0");
        TEST_CHECK(false);
    } catch (const Error &error) {
        TEST_CHECK(std::string(error.what()) == "Addr: 0.0.0.0, is not valid");
    }
}

static void test_parse_literal(void) {
    TEST_CHECK(net::ParseIpLiteral("1.2.3.4").has_value());
    TEST_CHECK(!net::ParseIpLiteral("1.2.3").has_value());
    TEST_CHECK(!net::ParseIpLiteral("example.com").has_value());
    TEST_CHECK(net::ParseIpLiteral("[::1]")->text == "::1");
    TEST_CHECK(net::ParseIpLiteral("2001:0db8:0000::1")->text == "2001:db8::1");
}

static void test_webfront_extraction(void) {
    TEST_CHECK(net::ExtractWebfrontAddress("http://1.2.3.4:1624") == "1.2.3.4");
    TEST_CHECK(net::ExtractWebfrontAddress("https://host.example:8080/admin") == "host.example");
    TEST_CHECK(net::ExtractWebfrontAddress("http://host.example") == "host.example");
    TEST_CHECK(net::ExtractWebfrontAddress("http://2001:db8::1:1624") == "2001:db8::1");
    TEST_CHECK(net::ExtractWebfrontAddress("http://2001:db8::1") == "2001:db8::1");
    TEST_CHECK(net::ExtractWebfrontAddress("http://[2001:db8::7]:1624") == "2001:db8::7");

    bool threw = false;
    try {
        net::ExtractWebfrontAddress("1.2.3.4:1624");
    } catch (const Error &error) {
        threw = error.kind() == ErrorKind::InvalidAddress;
    }
    TEST_CHECK(threw);
}

static void test_host_address_fallback(void) {
    TEST_CHECK(net::ResolveHostAddress("8.8.4.4", "http://1.1.1.1:1624").text == "8.8.4.4");
    TEST_CHECK(net::ResolveHostAddress("0.0.0.0", "http://1.1.1.1:1624").text == "1.1.1.1");
    TEST_CHECK(net::ResolveHostAddress("", "http://[2001:db8::2]:1624").text == "2001:db8::2");

    bool threw = false;
    try {
        net::ResolveHostAddress("0.0.0.0", "");
    } catch (const Error &error) {
        threw = error.kind() == ErrorKind::InvalidAddress;
    }
    TEST_CHECK(threw);
}

static void test_host_identity(void) {
    browser::BrowserConfig config;
    browser::Host host;
    host.ipAddress = "/5.6.7.8:";
    host.webfrontUrl = "http://9.9.9.9:1624";

    browser::ServerInfo local;
    local.ip = "localhost";
    browser::ServerInfo remote;
    remote.ip = "/1.2.3.4";
    browser::ServerInfo v6;
    v6.ip = "2001:db8::9";

    TEST_CHECK(browser::HostIdentity(host, local, config) == "5.6.7.8");
    TEST_CHECK(browser::HostIdentity(host, remote, config) == "1.2.3.4");
    TEST_CHECK(browser::HostIdentity(host, v6, config) == "2001:db8::9");

    host.ipAddress.clear();
    TEST_CHECK(browser::HostIdentity(host, local, config) == "9.9.9.9");

    TEST_CHECK(browser::ResolveServerAddress(host, local, config).text == "9.9.9.9");
    TEST_CHECK(browser::ResolveServerAddress(host, remote, config).text == "1.2.3.4");
}

static void test_host_identity_skips_unspecified_hoster(void) {
    browser::BrowserConfig config;
    browser::ServerInfo local;
    local.ip = "localhost";

    browser::Host first;
    first.ipAddress = "0.0.0.0";
    first.webfrontUrl = "http://20.0.0.1:1624";
    browser::Host second;
    second.ipAddress = "0.0.0.0";
    second.webfrontUrl = "http://30.0.0.1:1624";

    TEST_CHECK(browser::HostIdentity(first, local, config) == "20.0.0.1");
    TEST_CHECK(browser::HostIdentity(second, local, config) == "30.0.0.1");
    TEST_CHECK(browser::ResolveServerAddress(first, local, config).text == "20.0.0.1");
    TEST_CHECK(browser::ResolveServerAddress(second, local, config).text == "30.0.0.1");
}

static void test_trim_address(void) {
    TEST_CHECK(net::TrimAddress(" /1.2.3.4:/ ") == "1.2.3.4");
    TEST_CHECK(net::TrimAddress("::1") == "::1");
    TEST_CHECK(net::TrimAddress(":host.example:") == "host.example");
    TEST_CHECK(net::TrimAddress("//").empty());
}

int main(void) {
    test_resolve_literals();
    test_resolve_rejects();
    test_unspecified_message();
    test_parse_literal();
    test_webfront_extraction();
    test_host_address_fallback();
    test_host_identity();
    test_host_identity_skips_unspecified_hoster();
    test_trim_address();

    if (g_failures != 0) {
        printf("address_resolver_tests: %d failure(s)\n", g_failures);
        return 1;
    }
    printf("address_resolver_tests: OK\n");
    return 0;
}
