/**
 * @file errors.hpp
 * @brief Client-facing error kinds of the premium API
 *
 * Every failure that reaches an HTTP client is reported as a PremiumError.
 * The error kind fixes the three digit code, the HTTP status and the
 * default message. Causes (file, parse or Redis errors) are logged by the
 * layer that catches them and are never part of the response body.
 */

#ifndef PREMIUM_ERRORS_HPP
#define PREMIUM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace premium {

/**
 * @brief Error kinds with stable wire codes
 */
enum class ErrorKind {
    InternalServer,     ///< 001, 500
    InvalidInput,       ///< 002, 400
    InvalidHeader,      ///< 003, 415
    RiskCalculation,    ///< 004, 422
    NotFound,           ///< 005, 404
    MethodNotAllowed    ///< 006, 405
};

/**
 * @brief Three digit code sent in error bodies ("001" .. "006")
 */
std::string error_code(ErrorKind kind);

/**
 * @brief HTTP status for an error kind
 */
int http_status(ErrorKind kind);

/**
 * @brief Message used when none is supplied
 */
std::string default_message(ErrorKind kind);

/**
 * @brief Error returned to API clients
 */
class PremiumError : public std::runtime_error {
public:
    explicit PremiumError(ErrorKind kind);
    PremiumError(ErrorKind kind, const std::string& message);

    /**
     * @brief Missing or unsupported request header
     *
     * @param header_name Lower-case header name, e.g. "content-type"
     */
    static PremiumError invalid_header(const std::string& header_name);

    ErrorKind kind() const { return kind_; }
    std::string code() const { return error_code(kind_); }
    int status() const { return http_status(kind_); }

    /**
     * @brief JSON body {"code": "...", "message": "..."}
     */
    std::string to_json() const;

private:
    ErrorKind kind_;
};

} // namespace premium

#endif // PREMIUM_ERRORS_HPP
