#include "response_classifier.hpp"

#include <catch2/catch.hpp>

TEST_CASE("2xx responses are terminal successes carrying the body", "[classifier]") {
    for (int code : {200, 201, 204, 299}) {
        auto result = classify_response(UpstreamResult::response(code, "data: {\"ok\":true}\n\n"));
        REQUIRE(std::holds_alternative<outcome::Success>(result));
        CHECK(std::get<outcome::Success>(result).body == "data: {\"ok\":true}\n\n");
        CHECK(is_terminal(result));
    }
}

TEST_CASE("429 is terminal and keeps the upstream body", "[classifier]") {
    auto result = classify_response(UpstreamResult::response(429, R"({"error":{"code":429,"status":"RESOURCE_EXHAUSTED"}})"));
    REQUIRE(std::holds_alternative<outcome::RateLimited>(result));
    CHECK(std::get<outcome::RateLimited>(result).body == R"({"error":{"code":429,"status":"RESOURCE_EXHAUSTED"}})");
    CHECK(is_terminal(result));
}

TEST_CASE("400 is a terminal bad request", "[classifier]") {
    auto result = classify_response(UpstreamResult::response(400, "invalid argument"));
    REQUIRE(std::holds_alternative<outcome::BadRequest>(result));
    CHECK(std::get<outcome::BadRequest>(result).body == "invalid argument");
    CHECK(is_terminal(result));
}

TEST_CASE("401 and 403 are terminal auth errors with their code", "[classifier]") {
    for (int code : {401, 403}) {
        auto result = classify_response(UpstreamResult::response(code, "denied"));
        REQUIRE(std::holds_alternative<outcome::AuthError>(result));
        CHECK(std::get<outcome::AuthError>(result).code == code);
        CHECK(std::get<outcome::AuthError>(result).body == "denied");
        CHECK(is_terminal(result));
    }
}

TEST_CASE("5xx responses move on to the next endpoint", "[classifier]") {
    for (int code : {500, 502, 503, 504, 599}) {
        auto result = classify_response(UpstreamResult::response(code, "backend down"));
        REQUIRE(std::holds_alternative<outcome::ServerError>(result));
        CHECK(std::get<outcome::ServerError>(result).code == code);
        CHECK_FALSE(is_terminal(result));
    }
}

TEST_CASE("transport failures move on to the next endpoint", "[classifier]") {
    auto result = classify_response(UpstreamResult::transport_failure("Couldn't connect to server"));
    REQUIRE(std::holds_alternative<outcome::TransportError>(result));
    CHECK(std::get<outcome::TransportError>(result).message == "Couldn't connect to server");
    CHECK_FALSE(is_terminal(result));
}

TEST_CASE("any other status is a terminal error", "[classifier]") {
    for (int code : {301, 404, 408, 418, 422, 600}) {
        auto result = classify_response(UpstreamResult::response(code, "nope"));
        REQUIRE(std::holds_alternative<outcome::OtherError>(result));
        CHECK(std::get<outcome::OtherError>(result).code == code);
        CHECK(std::get<outcome::OtherError>(result).body == "nope");
        CHECK(is_terminal(result));
    }
}

TEST_CASE("exhaustion counts as terminal", "[classifier]") {
    Outcome result = outcome::Exhausted{};
    CHECK(is_terminal(result));
    CHECK(describe(result) == "all endpoints failed");
}
