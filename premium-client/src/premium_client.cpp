#include "premium_client.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace premium {
namespace client {

namespace {

const char* const QUOTE_PATH = "/api/v1/healths/premiums";
const char* const LOAD_PATH = "/api/v1/healths/premiums/loads";
const char* const UNLOAD_PATH = "/api/v1/healths/premiums/unloads";
const char* const CHECK_PATH = "/api/v1/healths/premiums/checks";

json parse_body(const HttpResponse& response, const char* path) {
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw PremiumApiError(response.status_code, "",
                              std::string("Invalid response from ") + path + ": " + response.body);
    }
    return body;
}

template <typename T>
T required_member(const json& body, const char* member, int status) {
    try {
        return body.at(member).get<T>();
    } catch (const json::exception&) {
        throw PremiumApiError(status, "",
                              std::string("Response is missing '") + member + "': " + body.dump());
    }
}

} // anonymous namespace

PremiumClient::PremiumClient(const std::string& base_url, int timeout_ms, RetryPolicy retry)
    : http_(std::make_unique<HttpClient>(base_url, timeout_ms, std::move(retry))) {}

PremiumApiError PremiumClient::to_api_error(const HttpClientError& e) {
    if (e.status_code() == 0) {
        return PremiumApiError(0, "", e.what());
    }

    json body = json::parse(e.body(), nullptr, false);
    if (!body.is_discarded() && body.is_object() &&
        body.contains("code") && body["code"].is_string() &&
        body.contains("message") && body["message"].is_string()) {
        return PremiumApiError(e.status_code(), body["code"].get<std::string>(),
                               body["message"].get<std::string>());
    }
    return PremiumApiError(e.status_code(), "", e.what());
}

std::string PremiumClient::quote(const std::string& code,
                                 const std::string& sum_insured,
                                 const std::string& date_of_birth) {
    json request;
    request["code"] = code;
    request["sumInsured"] = sum_insured;
    request["dateOfBirth"] = date_of_birth;

    try {
        HttpResponse response = http_->post(QUOTE_PATH, request.dump());
        return required_member<std::string>(parse_body(response, QUOTE_PATH), "premium",
                                            response.status_code);
    } catch (const HttpClientError& e) {
        throw to_api_error(e);
    }
}

LoadResult PremiumClient::load() {
    try {
        HttpResponse response = http_->post(LOAD_PATH, "");
        json body = parse_body(response, LOAD_PATH);
        LoadResult result;
        result.rows = required_member<size_t>(body, "rows", response.status_code);
        result.keys = required_member<size_t>(body, "keys", response.status_code);
        return result;
    } catch (const HttpClientError& e) {
        throw to_api_error(e);
    }
}

size_t PremiumClient::unload() {
    try {
        HttpResponse response = http_->post(UNLOAD_PATH, "");
        return required_member<size_t>(parse_body(response, UNLOAD_PATH), "removed",
                                       response.status_code);
    } catch (const HttpClientError& e) {
        throw to_api_error(e);
    }
}

bool PremiumClient::check() {
    try {
        HttpResponse response = http_->get(CHECK_PATH);
        return required_member<bool>(parse_body(response, CHECK_PATH), "loaded",
                                     response.status_code);
    } catch (const HttpClientError& e) {
        throw to_api_error(e);
    }
}

bool PremiumClient::health() {
    try {
        return http_->get("/").status_code == 200;
    } catch (const HttpClientError&) {
        return false;
    }
}

} // namespace client
} // namespace premium
