/*
Server directory parsing and filter tests.
*/
#include "browser/directory_client.hpp"
#include "browser/server_filter.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdio.h>
#include <string>
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

static ServerInfo make_server(int64_t id, const std::string &name, int64_t players, int64_t maxPlayers,
                              const std::string &game = "H2M") {
    ServerInfo server;
    server.id = id;
    server.ip = "10.0.0." + std::to_string(id);
    server.port = static_cast<uint16_t>(27000 + id);
    server.hostname = name;
    server.clientnum = players;
    server.maxclientnum = maxPlayers;
    server.game = game;
    return server;
}

static std::vector<Host> sample_hosts() {
    Host first;
    first.ipAddress = "10.0.0.1";
    first.webfrontUrl = "http://10.0.0.1:1624";
    first.servers = {
        make_server(1, "^1Red^7Team Deathmatch", 10, 18),
        make_server(2, "^2Green Hardpoint", 0, 18),
        make_server(3, "Blue Search", 4, 12),
        make_server(4, "IW4 Classic", 12, 18, "IW4")
    };
    Host second;
    second.ipAddress = "10.0.0.5";
    second.webfrontUrl = "http://10.0.0.5:1624";
    second.servers = {
        make_server(5, "^5Sniper ^3Only", 7, 24),
        make_server(6, "Red Fortress", 2, 18)
    };
    Host empty;
    empty.ipAddress = "10.0.0.9";
    empty.servers = {make_server(9, "Old Game", 3, 18, "T6")};
    return {first, second, empty};
}

static std::set<int64_t> ids_of(const std::vector<Host> &hosts) {
    std::set<int64_t> ids;
    for (const auto &host : hosts) {
        for (const auto &server : host.servers) {
            ids.insert(server.id);
        }
    }
    return ids;
}

static std::set<int64_t> filtered_ids(const FilterCriteria &criteria) {
    auto hosts = sample_hosts();
    ServerFilter("H2M").filterHosts(hosts, criteria);
    return ids_of(hosts);
}

static void test_normalize_hostname(void) {
    TEST_CHECK(NormalizeHostname("^1Red^7Team") == "redteam");
    TEST_CHECK(NormalizeHostname("Plain") == "plain");
    TEST_CHECK(NormalizeHostname("^^Caret") == "caret");
    TEST_CHECK(NormalizeHostname("Trailing^") == "trailing");
    TEST_CHECK(NormalizeHostname("") == "");
}

static void test_normalize_terms(void) {
    const auto terms = NormalizeTerms({"  Red ", "HARDPOINT", "\t"});
    TEST_CHECK(terms.size() == 3);
    TEST_CHECK(terms[0] == "red");
    TEST_CHECK(terms[1] == "hardpoint");
    TEST_CHECK(terms[2].empty());
}

static void test_game_filter_and_empty_hosts(void) {
    auto hosts = sample_hosts();
    ServerFilter("H2M").filterHosts(hosts, FilterCriteria{});
    TEST_CHECK(ids_of(hosts) == (std::set<int64_t>{1, 2, 3, 5, 6}));
    // The T6-only host is dropped entirely.
    TEST_CHECK(hosts.size() == 2);
    TEST_CHECK(std::none_of(hosts.begin(), hosts.end(), [](const Host &host) { return host.servers.empty(); }));
}

static void test_individual_predicates(void) {
    FilterCriteria team;
    team.teamSizeMax = 6;
    TEST_CHECK(filtered_ids(team) == (std::set<int64_t>{3}));

    FilterCriteria players;
    players.playerMin = 5;
    TEST_CHECK(filtered_ids(players) == (std::set<int64_t>{1, 5}));

    FilterCriteria includes;
    includes.includes = std::vector<std::string>{" RED", "sniper"};
    TEST_CHECK(filtered_ids(includes) == (std::set<int64_t>{1, 5, 6}));

    FilterCriteria excludes;
    excludes.excludes = std::vector<std::string>{"red"};
    TEST_CHECK(filtered_ids(excludes) == (std::set<int64_t>{2, 3, 5}));
}

static void test_combined_is_intersection(void) {
    FilterCriteria players;
    players.playerMin = 3;
    FilterCriteria names;
    names.excludes = std::vector<std::string>{"blue"};
    FilterCriteria both;
    both.playerMin = 3;
    both.excludes = names.excludes;

    const auto a = filtered_ids(players);
    const auto b = filtered_ids(names);
    std::set<int64_t> expected;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::inserter(expected, expected.begin()));
    TEST_CHECK(filtered_ids(both) == expected);
    TEST_CHECK(expected == (std::set<int64_t>{1, 5}));
}

static void test_result_is_subset(void) {
    const auto all = ids_of(sample_hosts());
    FilterCriteria criteria;
    criteria.playerMin = 1;
    criteria.includes = std::vector<std::string>{"e"};
    for (const auto id : filtered_ids(criteria)) {
        TEST_CHECK(all.count(id) == 1);
    }
}

static void test_flatten(void) {
    auto hosts = sample_hosts();
    const std::size_t count = CountServers(hosts);
    const auto servers = FlattenHosts(std::move(hosts));
    TEST_CHECK(count == 7);
    TEST_CHECK(servers.size() == 7);
}

static void test_parse_directory(void) {
    const std::string body = R"([
        {"ip_address": "1.2.3.4", "webfront_url": "http://1.2.3.4:1624",
         "servers": [{"id": 7, "ip": "localhost", "port": 27016, "hostname": "^3Yellow",
                      "clientnum": "4", "maxclientnum": 18, "game": "H2M"}]},
        "not a host",
        {"ip_address": "5.6.7.8", "webfront_url": "http://5.6.7.8", "servers": []}
    ])";
    const auto hosts = DirectoryClient::parseDirectory(body);
    TEST_CHECK(hosts.size() == 2);
    TEST_CHECK(hosts[0].ipAddress == "1.2.3.4");
    TEST_CHECK(hosts[0].servers.size() == 1);
    TEST_CHECK(hosts[0].servers[0].ip == "localhost");
    TEST_CHECK(hosts[0].servers[0].port == 27016);
    TEST_CHECK(hosts[0].servers[0].clientnum == 4);
    TEST_CHECK(hosts[1].servers.empty());
}

static void test_parse_directory_errors(void) {
    bool threw = false;
    try {
        DirectoryClient::parseDirectory("{not json");
    } catch (const Error &error) {
        threw = error.kind() == ErrorKind::Deserialization;
    }
    TEST_CHECK(threw);

    threw = false;
    try {
        DirectoryClient::parseDirectory(R"({"servers": []})");
    } catch (const Error &error) {
        threw = error.kind() == ErrorKind::Deserialization;
    }
    TEST_CHECK(threw);

    threw = false;
    try {
        DirectoryClient::parseDirectory(R"([{"ip_address": "1.2.3.4", "webfront_url": "x"}])");
    } catch (const Error &error) {
        threw = error.kind() == ErrorKind::Deserialization;
    }
    TEST_CHECK(threw);
}

int main(void) {
    test_normalize_hostname();
    test_normalize_terms();
    test_game_filter_and_empty_hosts();
    test_individual_predicates();
    test_combined_is_intersection();
    test_result_is_subset();
    test_flatten();
    test_parse_directory();
    test_parse_directory_errors();

    if (g_failures != 0) {
        printf("server_filter_tests: %d failure(s)\n", g_failures);
        return 1;
    }
    printf("server_filter_tests: OK\n");
    return 0;
}
