#include "routekit/http-error.hpp"

#include <string>

#include "routekit/http-constants.hpp"

namespace routekit {

HttpError::HttpError(http::StatusCode statusCode, const std::string& message)
    : HttpError(statusCode, message, statusCode < http::StatusCodeInternalServerError) {}

HttpError::HttpError(http::StatusCode statusCode, const std::string& message, bool expose)
    : std::runtime_error(message), _statusCode(statusCode), _expose(expose) {}

HttpError::HttpError(http::StatusCode statusCode) : HttpError(statusCode, std::string(http::ReasonPhraseFor(statusCode))) {}

}  // namespace routekit
