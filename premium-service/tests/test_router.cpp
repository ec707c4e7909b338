#include <catch2/catch_test_macros.hpp>
#include "../src/http/router.hpp"
#include "../src/store/memory_store.hpp"
#include "../src/logger.hpp"
#include <nlohmann/json.hpp>

using namespace premium;
using namespace premium::http;
using json = nlohmann::json;

namespace {

const std::string DATA_DIR = PREMIUM_DATA_DIR;

HttpRequest make_request(const std::string& method, const std::string& target,
                         const std::string& body = "",
                         const std::string& content_type = "application/json") {
    HttpRequest request;
    request.method = method;
    request.target = target;
    request.body = body;
    if (!content_type.empty()) {
        request.headers["content-type"] = content_type;
    }
    return request;
}

HttpRequest quote_request(const std::string& code, const std::string& sum,
                          const std::string& dob) {
    json body;
    body["code"] = code;
    body["sumInsured"] = sum;
    body["dateOfBirth"] = dob;
    return make_request("POST", QUOTE_PATH, body.dump());
}

std::string error_code_of(const HttpResponse& response) {
    return json::parse(response.body)["code"].get<std::string>();
}

struct RouterFixture {
    PremiumService service;
    Router router;

    RouterFixture()
        : service(std::make_unique<MemoryPremiumStore>(),
                  TableSource(DATA_DIR + "/premium_tables.xlsx", "matrix"),
                  []() { return CalendarDate(2024, 6, 7); }),
          router(service) {
        LoggerConfig config;
        config.enable_console = false;
        Logger::get_instance().configure(config);
    }
};

} // anonymous namespace

TEST_CASE("Media type detection", "[router]") {
    REQUIRE(is_json_media_type("application/json"));
    REQUIRE(is_json_media_type("Application/JSON"));
    REQUIRE(is_json_media_type("application/json; charset=utf-8"));
    REQUIRE(is_json_media_type(" application/json "));
    REQUIRE_FALSE(is_json_media_type(""));
    REQUIRE_FALSE(is_json_media_type("text/plain"));
    REQUIRE_FALSE(is_json_media_type("application/jsonp"));
}

TEST_CASE("Quote body decoding", "[router]") {
    QuoteRequest request = parse_quote_request(
        R"({"code":"1A","sumInsured":"100000","dateOfBirth":"1990-06-07","extra":1})");
    REQUIRE(request.code == "1A");
    REQUIRE(request.sum_insured == "100000");
    REQUIRE(request.date_of_birth == "1990-06-07");

    REQUIRE_THROWS_AS(parse_quote_request(""), PremiumError);
    REQUIRE_THROWS_AS(parse_quote_request("{"), PremiumError);
    REQUIRE_THROWS_AS(parse_quote_request("[]"), PremiumError);
    REQUIRE_THROWS_AS(parse_quote_request(R"({"code":"1A","sumInsured":"100000"})"), PremiumError);
    REQUIRE_THROWS_AS(
        parse_quote_request(R"({"code":"1A","sumInsured":100000,"dateOfBirth":"1990-06-07"})"),
        PremiumError);
}

TEST_CASE_METHOD(RouterFixture, "Router health and table management", "[router]") {
    SECTION("Health") {
        HttpResponse response = router.handle(make_request("GET", "/", "", ""));
        REQUIRE(response.status == 200);
        REQUIRE(response.body.empty());
    }

    SECTION("Load, check and unload") {
        HttpResponse check = router.handle(make_request("GET", CHECK_PATH, "", ""));
        REQUIRE(check.status == 200);
        REQUIRE(json::parse(check.body)["loaded"] == false);

        HttpResponse load = router.handle(make_request("POST", LOAD_PATH, "", ""));
        REQUIRE(load.status == 200);
        REQUIRE(load.content_type == "application/json");
        json loaded = json::parse(load.body);
        REQUIRE(loaded["rows"] == 63);
        REQUIRE(loaded["keys"] == 9);

        check = router.handle(make_request("GET", std::string(CHECK_PATH) + "?verbose=1", "", ""));
        REQUIRE(json::parse(check.body)["loaded"] == true);

        HttpResponse unload = router.handle(make_request("POST", UNLOAD_PATH, "", ""));
        REQUIRE(unload.status == 200);
        REQUIRE(json::parse(unload.body)["removed"] == 9);

        check = router.handle(make_request("GET", CHECK_PATH, "", ""));
        REQUIRE(json::parse(check.body)["loaded"] == false);
    }
}

TEST_CASE_METHOD(RouterFixture, "Router quotes", "[router]") {
    router.handle(make_request("POST", LOAD_PATH, "", ""));

    SECTION("Premium for age 46") {
        HttpResponse response = router.handle(quote_request("1A", "100000", "1978-06-07"));
        REQUIRE(response.status == 200);
        REQUIRE(response.content_type == "application/json");
        REQUIRE(response.body == R"({"premium":"750"})");
    }

    SECTION("Content type with charset") {
        HttpRequest request = quote_request("1A", "100000", "1990-06-07");
        request.headers["content-type"] = "application/json; charset=utf-8";
        HttpResponse response = router.handle(request);
        REQUIRE(response.status == 200);
        REQUIRE(json::parse(response.body)["premium"] == "350");
    }

    SECTION("Missing content type") {
        HttpRequest request = quote_request("1A", "100000", "1978-06-07");
        request.headers.clear();
        HttpResponse response = router.handle(request);
        REQUIRE(response.status == 415);
        REQUIRE(error_code_of(response) == "003");
        REQUIRE(json::parse(response.body)["message"] ==
                "Header content-type not provided or invalid");
    }

    SECTION("Wrong content type") {
        HttpRequest request = quote_request("1A", "100000", "1978-06-07");
        request.headers["content-type"] = "text/plain";
        REQUIRE(router.handle(request).status == 415);
    }

    SECTION("Invalid body") {
        HttpResponse response = router.handle(make_request("POST", QUOTE_PATH, "not json"));
        REQUIRE(response.status == 400);
        REQUIRE(error_code_of(response) == "002");
    }

    SECTION("Invalid date") {
        HttpResponse response = router.handle(quote_request("1A", "100000", "1978-13-01"));
        REQUIRE(response.status == 400);
        REQUIRE(error_code_of(response) == "002");
    }

    SECTION("No rate") {
        HttpResponse response = router.handle(quote_request("9Z", "100000", "1978-06-07"));
        REQUIRE(response.status == 422);
        REQUIRE(error_code_of(response) == "004");
        REQUIRE(json::parse(response.body)["message"] == "Cannot calculate risk for input");
    }
}

TEST_CASE_METHOD(RouterFixture, "Router unknown routes and methods", "[router]") {
    SECTION("Unknown path") {
        HttpResponse response = router.handle(make_request("GET", "/api/v2/premiums"));
        REQUIRE(response.status == 404);
        REQUIRE(error_code_of(response) == "005");
    }

    SECTION("Wrong method") {
        HttpResponse response = router.handle(make_request("GET", QUOTE_PATH));
        REQUIRE(response.status == 405);
        REQUIRE(error_code_of(response) == "006");
        REQUIRE(response.headers.size() == 1);
        REQUIRE(response.headers[0].first == "Allow");
        REQUIRE(response.headers[0].second == "POST");
    }
}

TEST_CASE("Router load failure", "[router]") {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);

    PremiumService service(std::make_unique<MemoryPremiumStore>(),
                           TableSource(DATA_DIR + "/missing.xlsx", "matrix"));
    Router router(service);

    HttpResponse response = router.handle(make_request("POST", LOAD_PATH, "", ""));
    REQUIRE(response.status == 500);
    REQUIRE(error_code_of(response) == "001");
    REQUIRE(json::parse(response.body)["message"] == "Internal server error");
}
