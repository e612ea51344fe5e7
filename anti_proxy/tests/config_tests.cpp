#include "config.hpp"
#include "endpoint_set.hpp"
#include "util.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <regex>
#include <set>
#include <stdexcept>

namespace {

const char* kVars[] = {
    "LISTEN_ADDR", "LISTEN_PORT", "UPSTREAM_ENDPOINTS", "USER_AGENT", "MIN_REQUEST_INTERVAL_MS",
    "CONNECT_TIMEOUT_MS", "REQUEST_TIMEOUT_MS", "WORKER_THREADS", "SERVICE_NAME", "LOG_LEVEL"
};

// Clears every variable Config reads
struct CleanEnv {
    CleanEnv() {
        for (const char* name : kVars) {
            unsetenv(name);
        }
    }
    ~CleanEnv() {
        for (const char* name : kVars) {
            unsetenv(name);
        }
    }
};

}

TEST_CASE("defaults match the upstream deployment", "[config]") {
    CleanEnv env;
    auto config = Config::from_env();

    CHECK(config.listen_addr == "127.0.0.1");
    CHECK(config.listen_port == 8965);
    REQUIRE(config.upstream_endpoints.size() == 2);
    CHECK(config.upstream_endpoints[0] == "https://cloudcode-pa.googleapis.com/v1internal:streamGenerateContent?alt=sse");
    CHECK(config.upstream_endpoints[1] == "https://daily-cloudcode-pa.sandbox.googleapis.com/v1internal:streamGenerateContent?alt=sse");
    CHECK(config.user_agent == "antigravity/1.15.8 windows/amd64");
    CHECK(config.min_request_interval_ms == 500);
    CHECK(config.connect_timeout_ms == 20000);
    CHECK(config.request_timeout_ms == 600000);
    CHECK(config.worker_threads == 16);
    CHECK(config.service_name == "anti_proxy");
    CHECK(config.log_level == "info");
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("environment overrides keep endpoint order", "[config]") {
    CleanEnv env;
    setenv("UPSTREAM_ENDPOINTS", " http://a.local/x , https://b.local/y,,http://c.local ", 1);
    setenv("MIN_REQUEST_INTERVAL_MS", "1500", 1);
    setenv("LISTEN_PORT", "9000", 1);

    auto config = Config::from_env();

    REQUIRE(config.upstream_endpoints.size() == 3);
    CHECK(config.upstream_endpoints[0] == "http://a.local/x");
    CHECK(config.upstream_endpoints[1] == "https://b.local/y");
    CHECK(config.upstream_endpoints[2] == "http://c.local");
    CHECK(config.min_request_interval_ms == 1500);
    CHECK(config.listen_port == 9000);
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("non-numeric values are reported by name", "[config]") {
    CleanEnv env;
    setenv("MIN_REQUEST_INTERVAL_MS", "soon", 1);

    CHECK_THROWS_WITH(Config::from_env(), Catch::Contains("MIN_REQUEST_INTERVAL_MS"));
}

TEST_CASE("numbers with trailing junk are rejected", "[config]") {
    CleanEnv env;

    SECTION("unit suffix") {
        setenv("MIN_REQUEST_INTERVAL_MS", "500ms", 1);
        CHECK_THROWS_WITH(Config::from_env(), Catch::Contains("MIN_REQUEST_INTERVAL_MS"));
    }
    SECTION("decimal") {
        setenv("LISTEN_PORT", "8965.5", 1);
        CHECK_THROWS_WITH(Config::from_env(), Catch::Contains("LISTEN_PORT"));
    }
    SECTION("empty") {
        setenv("WORKER_THREADS", "", 1);
        CHECK_THROWS_WITH(Config::from_env(), Catch::Contains("WORKER_THREADS"));
    }
    SECTION("plain number still parses") {
        setenv("MIN_REQUEST_INTERVAL_MS", "750", 1);
        CHECK(Config::from_env().min_request_interval_ms == 750);
    }
}

TEST_CASE("validate rejects unusable settings", "[config]") {
    CleanEnv env;
    auto base = Config::from_env();

    SECTION("no endpoints") {
        auto config = base;
        config.upstream_endpoints.clear();
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("non-http endpoint") {
        auto config = base;
        config.upstream_endpoints.push_back("ftp://mirror.local/");
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("negative interval") {
        auto config = base;
        config.min_request_interval_ms = -1;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("zero timeout") {
        auto config = base;
        config.request_timeout_ms = 0;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("single worker") {
        auto config = base;
        config.worker_threads = 1;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("port out of range") {
        auto config = base;
        config.listen_port = 70000;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
}

TEST_CASE("endpoint set keeps priority order", "[config][endpoints]") {
    EndpointSet endpoints(std::vector<std::string>{"http://primary", "http://secondary", "http://tertiary"});

    REQUIRE(endpoints.size() == 3);
    std::size_t expected = 0;
    for (const auto& endpoint : endpoints) {
        CHECK(endpoint.ordinal == expected);
        ++expected;
    }
    CHECK(endpoints.at(0).address == "http://primary");
    CHECK(endpoints.at(2).address == "http://tertiary");
}

TEST_CASE("endpoint set must not be empty", "[config][endpoints]") {
    CHECK_THROWS_AS(EndpointSet(std::vector<std::string>{}), std::invalid_argument);
}

TEST_CASE("generated uuids are random version 4", "[util]") {
    const std::regex uuid_v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = util::generate_uuid();
        CHECK(std::regex_match(id, uuid_v4));
        seen.insert(id);
    }
    CHECK(seen.size() == 200);
}
