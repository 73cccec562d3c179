#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-constants.hpp"
#include "routekit/http-status-code.hpp"
#include "routekit/vector.hpp"

namespace routekit {

struct HeaderField {
  std::string name;
  std::string value;

  bool operator==(const HeaderField&) const = default;
};

// -----------------------------------------------------------------------------
// HttpResponse
// -----------------------------------------------------------------------------
// Finalized response value returned by the Dispatcher and flowing back through the middleware chain.
// It is not a builder: handlers fill a ResponseBuilder, which produces an HttpResponse once finalized.
// Middlewares may still amend the value on their way out (add a header, replace the status...).
//
// Headers keep their insertion order and duplicates are allowed (several Set-Cookie for instance).
//   addHeader(): appends, never replaces.
//   header()   : replaces the value of the first header with the same name (case-insensitive), or appends.
//
// A default constructed HttpResponse is a 200 with no headers and an empty body.
class HttpResponse {
 public:
  HttpResponse() noexcept = default;

  explicit HttpResponse(http::StatusCode statusCode) noexcept : _statusCode(statusCode) {}

  // Builds a response with given body and Content-Type header (if not empty).
  HttpResponse(http::StatusCode statusCode, std::string body, std::string_view contentType);

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  HttpResponse& status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Canonical reason phrase of the current status, empty if unknown.
  [[nodiscard]] std::string_view reason() const noexcept { return http::ReasonPhraseFor(_statusCode); }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse& body(std::string body) {
    _body = std::move(body);
    return *this;
  }

  HttpResponse& header(std::string_view name, std::string_view value);

  HttpResponse& addHeader(std::string_view name, std::string_view value);

  // Removes all headers with given name. Returns the number of removed headers.
  std::size_t removeHeader(std::string_view name);

  // Value of the first header with given name (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // All values of headers with given name, in insertion order.
  [[nodiscard]] vector<std::string_view> headerValues(std::string_view name) const;

  [[nodiscard]] const vector<HeaderField>& headers() const noexcept { return _headers; }

 private:
  vector<HeaderField> _headers;
  std::string _body;
  http::StatusCode _statusCode{http::StatusCodeOK};
};

}  // namespace routekit
