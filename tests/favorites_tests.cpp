/*
Favorites selection, serialization and build pipeline tests.
*/
#include "browser/favorites_builder.hpp"
#include "browser/favorites_writer.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/json.hpp"
#include "fake_http_client.hpp"

#include <algorithm>
#include <filesystem>
#include <stdio.h>
#include <string>
#include <unistd.h>
#include <vector>

using namespace matchwire;
using namespace matchwire::browser;

static int g_failures = 0;

#define TEST_CHECK(cond) \
    do { \
        if (!(cond)) { \
            printf("FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond); \
            g_failures += 1; \
        } \
    } while (0)

static std::filesystem::path make_temp_dir(const char *name) {
    const auto dir = std::filesystem::temp_directory_path() /
                     (std::string("matchwire_") + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

static ServerInfo make_server(int64_t id, int64_t players) {
    ServerInfo server;
    server.id = id;
    server.ip = "10.0." + std::to_string(id / 256) + "." + std::to_string(id % 256);
    server.port = static_cast<uint16_t>(20000 + id);
    server.hostname = "Server " + std::to_string(id);
    server.clientnum = players;
    server.maxclientnum = 18;
    server.game = "H2M";
    return server;
}

static void test_select_keeps_most_populated(void) {
    std::vector<ServerInfo> servers;
    for (int64_t i = 0; i < 150; ++i) {
        servers.push_back(make_server(i, i));
    }
    std::reverse(servers.begin(), servers.end());

    const auto selected = SelectFavorites(servers, 100);
    TEST_CHECK(selected.size() == 100);
    TEST_CHECK(std::all_of(selected.begin(), selected.end(), [](const ServerInfo &s) { return s.clientnum >= 50; }));
    TEST_CHECK(selected.front().clientnum == 149);
    TEST_CHECK(selected.back().clientnum == 50);
}

static void test_select_under_limit_is_reversed(void) {
    std::vector<ServerInfo> servers = {make_server(1, 5), make_server(2, 1), make_server(3, 9)};
    const auto selected = SelectFavorites(servers, 100);
    TEST_CHECK(selected.size() == 3);
    TEST_CHECK(selected[0].id == 3);
    TEST_CHECK(selected[1].id == 2);
    TEST_CHECK(selected[2].id == 1);
}

static void test_select_most_populated_first(void) {
    const std::vector<ServerInfo> servers = {make_server(1, 1), make_server(2, 2), make_server(3, 3)};
    const auto selected = SelectFavorites(servers, 2);
    TEST_CHECK(selected.size() == 2);
    TEST_CHECK(SerializeFavorites(selected) == R"(["10.0.0.3:20003","10.0.0.2:20002"])");
}

static void test_select_ties_are_stable(void) {
    std::vector<ServerInfo> servers = {make_server(1, 4), make_server(2, 4), make_server(3, 0), make_server(4, 4)};
    const auto selected = SelectFavorites(servers, 2);
    TEST_CHECK(selected.size() == 2);
    TEST_CHECK(selected[0].id == 4);
    TEST_CHECK(selected[1].id == 2);
}

static void test_serialize_exact(void) {
    ServerInfo a = make_server(1, 0);
    a.ip = "1.2.3.4";
    a.port = 27016;
    ServerInfo b = make_server(2, 0);
    b.ip = "5.6.7.8";
    b.port = 1;
    TEST_CHECK(SerializeFavorites({a, b}) == R"(["1.2.3.4:27016","5.6.7.8:1"])");
    TEST_CHECK(SerializeFavorites({}) == "[]");
}

static void test_writer_truncates_file(void) {
    const auto dir = make_temp_dir("favorites_writer");
    std::vector<ServerInfo> servers;
    for (int64_t i = 0; i < 150; ++i) {
        servers.push_back(make_server(i, i % 19));
    }

    FavoritesWriter writer(dir / "favourites.json");
    TEST_CHECK(writer.write(servers, 100) == 100);

    const auto text = file::ReadFileText(writer.path());
    TEST_CHECK(text.has_value());
    if (text) {
        const auto document = json::Parse(*text);
        TEST_CHECK(document.is_array());
        TEST_CHECK(document.size() == 100);
        TEST_CHECK(text->find(",]") == std::string::npos);
    }

    TEST_CHECK(writer.write({make_server(7, 1)}, 100) == 1);
    TEST_CHECK(file::ReadFileText(writer.path()) == std::string(R"(["10.0.0.7:20007"])"));
    std::filesystem::remove_all(dir);
}

static void test_writer_missing_directory(void) {
    FavoritesWriter writer(std::filesystem::temp_directory_path() / "matchwire_no_such_dir" / "x" / "favourites.json");
    bool threw = false;
    try {
        writer.write({make_server(1, 1)}, 100);
    } catch (const Error &error) {
        threw = error.kind() == ErrorKind::Filesystem;
    }
    TEST_CHECK(threw);
}

static std::string directory_body(void) {
    auto hosts = json::Array();
    auto host = json::Object();
    host["ip_address"] = "10.0.0.1";
    host["webfront_url"] = "http://10.0.0.1:1624";
    auto servers = json::Array();
    for (int i = 0; i < 12; ++i) {
        servers.push_back({{"id", i},
                           {"ip", "10.0.0.1"},
                           {"port", 27000 + i},
                           {"hostname", i % 2 == 0 ? "^1Even" : "^2Odd"},
                           {"clientnum", i},
                           {"maxclientnum", 18},
                           {"game", i == 11 ? "IW4" : "H2M"}});
    }
    host["servers"] = servers;
    hosts.push_back(host);
    return json::Dump(hosts);
}

static void test_builder_without_region(void) {
    const auto gameDir = make_temp_dir("favorites_builder");
    std::filesystem::create_directories(gameDir / "players2");

    BrowserConfig config;
    config.masterUrl = "http://master.test/";
    config.locationUrl = "http://geo.test/";
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("http://master.test/instance", directory_body());

    auto directory = std::make_shared<DirectoryClient>(http, config);
    auto resolver = std::make_shared<GeolocationResolver>(std::make_shared<GeolocationClient>(http, config), config, true);
    FavoritesBuilder builder(directory, resolver, config);

    cache::RegionCache regionCache;
    FilterCriteria criteria;
    criteria.limit = 3;
    criteria.includes = std::vector<std::string>{"even"};
    const auto report = builder.build(gameDir, criteria, regionCache);

    TEST_CHECK(report.matched == 6);
    TEST_CHECK(report.written == 3);
    TEST_CHECK(report.newCacheEntries == 0);
    TEST_CHECK(http->totalCalls() == 1);
    TEST_CHECK(file::ReadFileText(gameDir / "players2" / "favourites.json") ==
               std::string(R"(["10.0.0.1:27010","10.0.0.1:27008","10.0.0.1:27006"])"));
    std::filesystem::remove_all(gameDir);
}

static void test_builder_directory_failure(void) {
    BrowserConfig config;
    config.masterUrl = "http://unreachable.test/";
    auto http = std::make_shared<FakeHttpClient>();
    auto directory = std::make_shared<DirectoryClient>(http, config);
    auto resolver = std::make_shared<GeolocationResolver>(std::make_shared<GeolocationClient>(http, config), config, false);
    FavoritesBuilder builder(directory, resolver, config);

    cache::RegionCache regionCache;
    bool threw = false;
    try {
        builder.build(std::filesystem::temp_directory_path(), FilterCriteria{}, regionCache);
    } catch (const Error &error) {
        threw = error.kind() == ErrorKind::Transport;
    }
    TEST_CHECK(threw);
}

int main(void) {
    test_select_keeps_most_populated();
    test_select_under_limit_is_reversed();
    test_select_most_populated_first();
    test_select_ties_are_stable();
    test_serialize_exact();
    test_writer_truncates_file();
    test_writer_missing_directory();
    test_builder_without_region();
    test_builder_directory_failure();

    if (g_failures != 0) {
        printf("favorites_tests: %d failure(s)\n", g_failures);
        return 1;
    }
    printf("favorites_tests: OK\n");
    return 0;
}
