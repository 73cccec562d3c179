#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "routekit/http-status-code.hpp"

namespace routekit {

// Exception carrying an HTTP status, meant to be thrown by handlers and converted to a response by the error handler
// middleware. The message is exposed to the client only if expose() is true, which defaults to status < 500.
class HttpError : public std::runtime_error {
 public:
  HttpError(http::StatusCode statusCode, const std::string& message);

  HttpError(http::StatusCode statusCode, const std::string& message, bool expose);

  // Builds an error with the canonical reason phrase of the status as message.
  explicit HttpError(http::StatusCode statusCode);

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] bool expose() const noexcept { return _expose; }

 private:
  http::StatusCode _statusCode;
  bool _expose;
};

}  // namespace routekit
