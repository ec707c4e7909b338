#include "router.hpp"
#include "../logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace premium {
namespace http {

namespace {

struct Route {
    const char* path;
    const char* method;
};

const Route ROUTES[] = {
    {HEALTH_PATH, "GET"},
    {QUOTE_PATH, "POST"},
    {LOAD_PATH, "POST"},
    {UNLOAD_PATH, "POST"},
    {CHECK_PATH, "GET"},
};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string required_string(const json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_string()) {
        throw PremiumError(ErrorKind::InvalidInput,
                           std::string("Field '") + field + "' must be a string");
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

HttpResponse HttpResponse::json_response(int status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.content_type = "application/json";
    response.body = body;
    return response;
}

HttpResponse HttpResponse::error(const PremiumError& error) {
    return json_response(error.status(), error.to_json());
}

bool is_json_media_type(const std::string& content_type) {
    std::string media_type = content_type.substr(0, content_type.find(';'));
    size_t start = media_type.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return false;
    }
    size_t end = media_type.find_last_not_of(" \t");
    return to_lower(media_type.substr(start, end - start + 1)) == "application/json";
}

QuoteRequest parse_quote_request(const std::string& body) {
    json document = json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        throw PremiumError(ErrorKind::InvalidInput, "Request body is not valid JSON");
    }
    if (!document.is_object()) {
        throw PremiumError(ErrorKind::InvalidInput, "Request body must be a JSON object");
    }

    QuoteRequest request;
    request.code = required_string(document, "code");
    request.sum_insured = required_string(document, "sumInsured");
    request.date_of_birth = required_string(document, "dateOfBirth");
    return request;
}

Router::Router(PremiumService& service)
    : service_(service) {}

HttpResponse Router::handle(const HttpRequest& request) {
    std::string path = request.target.substr(0, request.target.find('?'));

    try {
        return dispatch(request, path);
    } catch (const PremiumError& e) {
        return HttpResponse::error(e);
    } catch (const std::exception& e) {
        Logger::get_instance().log_error("router", "Unhandled error for " + request.method +
                                         " " + path, e.what());
        return HttpResponse::error(PremiumError(ErrorKind::InternalServer));
    }
}

HttpResponse Router::dispatch(const HttpRequest& request, const std::string& path) {
    const Route* route = nullptr;
    for (const auto& candidate : ROUTES) {
        if (path == candidate.path) {
            route = &candidate;
            break;
        }
    }

    if (!route) {
        throw PremiumError(ErrorKind::NotFound);
    }
    if (request.method != route->method) {
        HttpResponse response = HttpResponse::error(PremiumError(ErrorKind::MethodNotAllowed));
        response.headers.emplace_back("Allow", route->method);
        return response;
    }

    if (path == HEALTH_PATH) {
        HttpResponse response;
        response.status = 200;
        return response;
    }

    if (path == QUOTE_PATH) {
        return handle_quote(request);
    }

    if (path == LOAD_PATH) {
        LoadSummary summary = service_.load_tables();
        json body;
        body["rows"] = summary.rows;
        body["keys"] = summary.keys;
        return HttpResponse::json_response(200, body.dump());
    }

    if (path == UNLOAD_PATH) {
        json body;
        body["removed"] = service_.unload_tables();
        return HttpResponse::json_response(200, body.dump());
    }

    json body;
    body["loaded"] = service_.tables_loaded();
    return HttpResponse::json_response(200, body.dump());
}

HttpResponse Router::handle_quote(const HttpRequest& request) {
    if (!is_json_media_type(request.header("content-type"))) {
        throw PremiumError::invalid_header("content-type");
    }

    Quote quote = service_.calculate_premium(parse_quote_request(request.body));

    json body;
    body["premium"] = quote.premium_text();
    return HttpResponse::json_response(200, body.dump());
}

} // namespace http
} // namespace premium
