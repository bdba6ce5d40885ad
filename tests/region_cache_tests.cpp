/*
Region cache, cache file and cache builder tests.
*/
#include "cache/cache_builder.hpp"
#include "cache/cache_file.hpp"
#include "cache/region_cache.hpp"
#include "common/file_utils.hpp"
#include "fake_http_client.hpp"

#include <filesystem>
#include <stdio.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace matchwire;
using namespace matchwire::cache;

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

static void test_merge_counts_changes(void) {
    RegionCache regionCache;
    TEST_CHECK(regionCache.merge({{"1.1.1.1", {"NA", "1.1.1.1", 10}}, {"2.2.2.2", {"EU", "2.2.2.2", 10}}}) == 2);
    // Timestamp refresh only.
    TEST_CHECK(regionCache.merge({{"1.1.1.1", {"NA", "1.1.1.1", 20}}}) == 0);
    TEST_CHECK(regionCache.lookup("1.1.1.1")->created == 20);
    // Region change, last write wins.
    TEST_CHECK(regionCache.merge({{"2.2.2.2", {"AS", "2.2.2.2", 30}}}) == 1);
    TEST_CHECK(regionCache.lookup("2.2.2.2")->region == "AS");
    TEST_CHECK(regionCache.size() == 2);
    TEST_CHECK(!regionCache.lookup("3.3.3.3").has_value());
}

static void test_concurrent_merges(void) {
    RegionCache regionCache;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&regionCache, t]() {
            for (int i = 0; i < 200; ++i) {
                const std::string id = "10.0." + std::to_string(i % 50) + ".1";
                regionCache.merge({{id, {t % 2 == 0 ? "NA" : "EU", id, i}}});
                regionCache.snapshot();
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    const auto snapshot = regionCache.snapshot();
    TEST_CHECK(snapshot.entries.size() == 50);
    for (const auto &[identity, entry] : snapshot.entries) {
        TEST_CHECK(entry.ip == identity);
        TEST_CHECK(entry.region == "NA" || entry.region == "EU");
    }
}

static void test_file_round_trip(void) {
    const auto dir = make_temp_dir("cache_file");
    const auto path = dir / kCacheFileName;

    CacheSnapshot snapshot;
    snapshot.created = 1700000000;
    snapshot.entries["1.2.3.4"] = {"NA", "1.2.3.4", 1700000001};
    snapshot.entries["2001:db8::1"] = {"EU", "2001:db8::1", 1700000002};

    RegionCache regionCache(snapshot.entries, snapshot.created);
    TEST_CHECK(PersistRegionCache(regionCache, path, "1.0.0"));

    const auto loaded = ReadCacheFile(path, "1.0.0");
    TEST_CHECK(loaded.has_value());
    if (loaded) {
        TEST_CHECK(loaded->created == snapshot.created);
        TEST_CHECK(loaded->entries == snapshot.entries);
    }
    std::filesystem::remove_all(dir);
}

static void test_version_mismatch_discards(void) {
    const auto dir = make_temp_dir("cache_version");
    const auto path = dir / kCacheFileName;

    CacheSnapshot snapshot;
    snapshot.created = 5;
    snapshot.entries["1.2.3.4"] = {"NA", "1.2.3.4", 5};
    WriteCacheFile(path, snapshot, "0.9.0");

    TEST_CHECK(!ReadCacheFile(path, "1.0.0").has_value());
    TEST_CHECK(ReadCacheFile(path, "0.9.0").has_value());
    std::filesystem::remove_all(dir);
}

static void test_missing_and_corrupt_files(void) {
    const auto dir = make_temp_dir("cache_corrupt");
    TEST_CHECK(!ReadCacheFile(dir / "absent.json", "1.0.0").has_value());

    file::WriteFileAtomically(dir / kCacheFileName, "{\"version\": \"1.0.0\", \"cache\": ");
    TEST_CHECK(!ReadCacheFile(dir / kCacheFileName, "1.0.0").has_value());

    file::WriteFileAtomically(dir / kCacheFileName, "[]");
    TEST_CHECK(!ReadCacheFile(dir / kCacheFileName, "1.0.0").has_value());
    std::filesystem::remove_all(dir);
}

static void test_persist_failure_is_reported(void) {
    RegionCache regionCache;
    const auto path = std::filesystem::temp_directory_path() / "matchwire_missing_parent" / "deeper" / kCacheFileName;
    TEST_CHECK(!PersistRegionCache(regionCache, path, "1.0.0"));
}

static void test_json_shape(void) {
    CacheSnapshot snapshot;
    snapshot.created = 7;
    snapshot.entries["9.9.9.9"] = {"OC", "9.9.9.9", 8};
    const auto document = CacheToJson(snapshot, "2.0.0");
    TEST_CHECK(document["version"] == "2.0.0");
    TEST_CHECK(document["created"] == 7);
    TEST_CHECK(document["cache"]["9.9.9.9"]["region"] == "OC");
    TEST_CHECK(document["cache"]["9.9.9.9"]["ip"] == "9.9.9.9");
    TEST_CHECK(document["cache"]["9.9.9.9"]["created"] == 8);
}

static void test_strip_port(void) {
    TEST_CHECK(StripPort("1.2.3.4:27016") == "1.2.3.4");
    TEST_CHECK(StripPort("1.2.3.4") == "1.2.3.4");
    TEST_CHECK(StripPort("[::1]:27016") == "::1");
    TEST_CHECK(StripPort("2001:db8::1") == "2001:db8::1");
    TEST_CHECK(StripPort("host.example:28960") == "host.example");
}

static void test_builder_resolves_each_identity_once(void) {
    browser::BrowserConfig config;
    config.locationUrl = "http://geo.test/";
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("http://geo.test/50.0.0.1", R"({"continent":"NA"})");
    http->respond("http://geo.test/50.0.0.2", R"({"continent":"EU"})");
    http->respond("http://geo.test/60.0.0.1", R"({"continent":"AS"})");

    browser::Host first;
    first.ipAddress = "50.0.0.1";
    for (int i = 0; i < 5; ++i) {
        browser::ServerInfo server;
        server.id = i;
        server.ip = i < 3 ? "localhost" : "50.0.0.2";
        first.servers.push_back(server);
    }
    browser::Host broken;
    broken.ipAddress = "0.0.0.0";
    browser::ServerInfo unresolvable;
    unresolvable.ip = "0.0.0.0";
    broken.servers.push_back(unresolvable);

    auto directory = std::make_shared<browser::DirectoryClient>(http, config);
    auto geolocation = std::make_shared<browser::GeolocationClient>(http, config);
    CacheBuilder builder(directory, geolocation, config, true);

    const auto result = builder.buildFromHosts({first, broken}, {"60.0.0.1:27016", "50.0.0.2:1"});
    TEST_CHECK(result.snapshot.entries.size() == 3);
    TEST_CHECK(result.failureCount == 1);
    TEST_CHECK(http->callCount("http://geo.test/50.0.0.1") == 1);
    TEST_CHECK(http->callCount("http://geo.test/50.0.0.2") == 1);
    TEST_CHECK(http->callCount("http://geo.test/60.0.0.1") == 1);
    TEST_CHECK(result.snapshot.entries.count("60.0.0.1") == 1);
    if (result.snapshot.entries.count("50.0.0.1")) {
        TEST_CHECK(result.snapshot.entries.at("50.0.0.1").region == "NA");
    } else {
        TEST_CHECK(false);
    }
}

static void test_builder_separates_unspecified_hosters(void) {
    browser::BrowserConfig config;
    config.locationUrl = "http://geo.test/";
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("http://geo.test/20.0.0.1", R"({"continent":"NA"})");
    http->respond("http://geo.test/30.0.0.1", R"({"continent":"EU"})");

    std::vector<browser::Host> hosts;
    for (const char *webfront : {"http://20.0.0.1:1624", "http://30.0.0.1:1624"}) {
        browser::Host host;
        host.ipAddress = "0.0.0.0";
        host.webfrontUrl = webfront;
        browser::ServerInfo server;
        server.ip = "localhost";
        host.servers.push_back(server);
        hosts.push_back(host);
    }

    auto directory = std::make_shared<browser::DirectoryClient>(http, config);
    auto geolocation = std::make_shared<browser::GeolocationClient>(http, config);
    CacheBuilder builder(directory, geolocation, config, false);

    const auto result = builder.buildFromHosts(hosts, {});
    TEST_CHECK(result.failureCount == 0);
    TEST_CHECK(result.snapshot.entries.size() == 2);
    TEST_CHECK(result.snapshot.entries.count("0.0.0.0") == 0);
    if (result.snapshot.entries.count("30.0.0.1")) {
        TEST_CHECK(result.snapshot.entries.at("30.0.0.1").region == "EU");
    } else {
        TEST_CHECK(false);
    }
}

int main(void) {
    test_merge_counts_changes();
    test_concurrent_merges();
    test_file_round_trip();
    test_version_mismatch_discards();
    test_missing_and_corrupt_files();
    test_persist_failure_is_reported();
    test_json_shape();
    test_strip_port();
    test_builder_resolves_each_identity_once();
    test_builder_separates_unspecified_hosters();

    if (g_failures != 0) {
        printf("region_cache_tests: %d failure(s)\n", g_failures);
        return 1;
    }
    printf("region_cache_tests: OK\n");
    return 0;
}
