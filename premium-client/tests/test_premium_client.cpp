#include <catch2/catch_test_macros.hpp>
#include "../src/premium_client.hpp"

using namespace premium::client;

TEST_CASE("API error decoding", "[premium_client]") {
    SECTION("Error body with code and message") {
        HttpClientError e("POST /api/v1/healths/premiums returned HTTP 422", 422,
                          R"({"code":"004","message":"Cannot calculate risk for input"})");
        PremiumApiError error = PremiumClient::to_api_error(e);

        REQUIRE(error.status() == 422);
        REQUIRE(error.code() == "004");
        REQUIRE(std::string(error.what()) == "Cannot calculate risk for input");
    }

    SECTION("Body without an error object keeps the HTTP message") {
        HttpClientError e("GET / returned HTTP 502: Bad Gateway", 502, "Bad Gateway");
        PremiumApiError error = PremiumClient::to_api_error(e);

        REQUIRE(error.status() == 502);
        REQUIRE(error.code().empty());
        REQUIRE(std::string(error.what()) == "GET / returned HTTP 502: Bad Gateway");
    }

    SECTION("Non-string code is ignored") {
        HttpClientError e("HTTP 400", 400, R"({"code":2,"message":"Invalid request"})");
        REQUIRE(PremiumClient::to_api_error(e).code().empty());
    }

    SECTION("Transport failure") {
        HttpClientError e("CURL error: Couldn't connect to server");
        PremiumApiError error = PremiumClient::to_api_error(e);

        REQUIRE(error.status() == 0);
        REQUIRE(error.code().empty());
    }
}

TEST_CASE("PremiumClient against an unreachable server", "[premium_client]") {
    PremiumClient client("http://127.0.0.1:1", 2000);

    REQUIRE_FALSE(client.health());

    try {
        client.quote("1A", "100000", "1978-06-07");
        FAIL("Expected PremiumApiError");
    } catch (const PremiumApiError& e) {
        REQUIRE(e.status() == 0);
    }

    REQUIRE_THROWS_AS(client.load(), PremiumApiError);
    REQUIRE_THROWS_AS(client.unload(), PremiumApiError);
    REQUIRE_THROWS_AS(client.check(), PremiumApiError);
}

TEST_CASE("PremiumClient exposes its HTTP client", "[premium_client]") {
    PremiumClient client("http://127.0.0.1:8000/");
    REQUIRE(client.http().base_url() == "http://127.0.0.1:8000");
}
