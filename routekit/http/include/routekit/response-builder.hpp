#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "routekit/cookie-options.hpp"
#include "routekit/http-response.hpp"
#include "routekit/http-status-code.hpp"
#include "routekit/json-serializer.hpp"

namespace routekit {

enum class ResponseState : std::uint8_t { Pending, Sent };

// Thrown by any ResponseBuilder mutator called once the response has been sent.
class AlreadySentError : public std::logic_error {
 public:
  AlreadySentError() : std::logic_error("Cannot set response after it has been sent") {}
};

// -----------------------------------------------------------------------------
// ResponseBuilder
// -----------------------------------------------------------------------------
// Single-assignment response accumulator given to every handler.
//
// Non-terminal mutators (status, header, headers, cookie, clearCookie, type, attachment, vary) can be called any
// number of times while the builder is Pending. Terminal mutators (json, send, html, text, redirect, end) capture the
// body and switch the state to Sent. Any mutator called once Sent throws AlreadySentError, the builder is left
// unchanged.
//
// The builder is consumed by takeResponse(), which also performs the implicit finalization: a builder still
// Pending yields its current status and headers with an empty body.
//
// Example:
//   res.status(http::StatusCodeCreated).header("X-Id", "42").json(user);
class ResponseBuilder {
 public:
  ResponseBuilder() noexcept = default;

  ResponseBuilder(const ResponseBuilder&) = delete;
  ResponseBuilder(ResponseBuilder&&) noexcept = default;
  ResponseBuilder& operator=(const ResponseBuilder&) = delete;
  ResponseBuilder& operator=(ResponseBuilder&&) noexcept = default;

  ~ResponseBuilder() = default;

  ResponseBuilder& status(http::StatusCode statusCode);

  // Sets a header, replacing any previous value of the same name (case-insensitive).
  ResponseBuilder& header(std::string_view name, std::string_view value);

  ResponseBuilder& headers(std::initializer_list<std::pair<std::string_view, std::string_view>> headers);

  // Appends a Set-Cookie header:
  //   name=value[; Max-Age=N][; Expires=<IMF-fixdate>][; Path=p][; Domain=d][; Secure][; HttpOnly][; SameSite=s]
  ResponseBuilder& cookie(std::string_view name, std::string_view value, const CookieOptions& options = {});

  // Appends a Set-Cookie header expiring the cookie immediately.
  // Only the path and domain of options are taken into account.
  ResponseBuilder& clearCookie(std::string_view name, const CookieOptions& options = {});

  // Sets the Content-Type header.
  ResponseBuilder& type(std::string_view mime);

  // Sets Content-Disposition to 'attachment', with a filename parameter if not empty.
  ResponseBuilder& attachment(std::string_view filename = {});

  // Adds a field to the Vary header, unless already present.
  ResponseBuilder& vary(std::string_view field);

  // Serializes given value to JSON with glaze.
  // Content-Type is set to application/json unless a Content-Type was already set.
  template <class T>
  ResponseBuilder& json(const T& value) {
    ensurePending();
    return finalizeBody(SerializeToJson(value), http::ContentTypeApplicationJson);
  }

  // Text payloads (strings, numbers, booleans) are sent as text/plain, other types are serialized to JSON.
  // The Content-Type is only set if not already present.
  ResponseBuilder& send(std::string_view data);

  ResponseBuilder& send(const char* data) { return send(std::string_view(data)); }

  template <class T>
    requires(!std::convertible_to<const T&, std::string_view>)
  ResponseBuilder& send(const T& data) {
    if constexpr (std::is_same_v<T, bool>) {
      return send(std::string_view(data ? "true" : "false"));
    } else if constexpr (std::is_arithmetic_v<T>) {
      char buf[64];
      const auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), data);
      return send(std::string_view(buf, errc == std::errc{} ? ptr : buf));
    } else {
      return json(data);
    }
  }

  ResponseBuilder& html(std::string_view content);

  ResponseBuilder& text(std::string_view content);

  // Sets status and Location header, with a short text body 'Redirecting to <location>'.
  ResponseBuilder& redirect(std::string_view location, http::StatusCode statusCode = http::StatusCodeFound);

  // Finalizes the response with an empty body.
  ResponseBuilder& end();

  [[nodiscard]] ResponseState state() const noexcept { return _state; }

  [[nodiscard]] bool isSent() const noexcept { return _state == ResponseState::Sent; }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _response.status(); }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _response.headerValue(name);
  }

  // Consumes the builder and returns the finalized response.
  [[nodiscard]] HttpResponse takeResponse() &&;

 private:
  void ensurePending() const;

  ResponseBuilder& finalizeBody(std::string body, std::string_view defaultContentType);

  HttpResponse _response;
  ResponseState _state{ResponseState::Pending};
};

}  // namespace routekit
