#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace premium {

std::string error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InternalServer: return "001";
        case ErrorKind::InvalidInput: return "002";
        case ErrorKind::InvalidHeader: return "003";
        case ErrorKind::RiskCalculation: return "004";
        case ErrorKind::NotFound: return "005";
        case ErrorKind::MethodNotAllowed: return "006";
    }
    return "001";
}

int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InternalServer: return 500;
        case ErrorKind::InvalidInput: return 400;
        case ErrorKind::InvalidHeader: return 415;
        case ErrorKind::RiskCalculation: return 422;
        case ErrorKind::NotFound: return 404;
        case ErrorKind::MethodNotAllowed: return 405;
    }
    return 500;
}

std::string default_message(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InternalServer: return "Internal server error";
        case ErrorKind::InvalidInput: return "Invalid request";
        case ErrorKind::InvalidHeader: return "Header not provided or invalid";
        case ErrorKind::RiskCalculation: return "Cannot calculate risk for input";
        case ErrorKind::NotFound: return "Resource not found";
        case ErrorKind::MethodNotAllowed: return "Method not allowed";
    }
    return "Internal server error";
}

PremiumError::PremiumError(ErrorKind kind)
    : std::runtime_error(default_message(kind)), kind_(kind) {}

PremiumError::PremiumError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

PremiumError PremiumError::invalid_header(const std::string& header_name) {
    return PremiumError(ErrorKind::InvalidHeader,
                        "Header " + header_name + " not provided or invalid");
}

std::string PremiumError::to_json() const {
    json body;
    body["code"] = code();
    body["message"] = what();
    return body.dump();
}

} // namespace premium
