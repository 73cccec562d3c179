#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "routekit/timedef.hpp"

namespace routekit {

// Optional attributes of a Set-Cookie header. Unset attributes are not emitted.
struct CookieOptions {
  enum class SameSite : std::int8_t { Unset, Strict, Lax, None };

  CookieOptions& withMaxAge(std::int64_t seconds) {
    maxAge = seconds;
    return *this;
  }

  CookieOptions& withExpires(SysTimePoint tp) {
    expires = tp;
    return *this;
  }

  CookieOptions& withPath(std::string value) {
    path = std::move(value);
    return *this;
  }

  CookieOptions& withDomain(std::string value) {
    domain = std::move(value);
    return *this;
  }

  CookieOptions& withSecure(bool on = true) {
    secure = on;
    return *this;
  }

  CookieOptions& withHttpOnly(bool on = true) {
    httpOnly = on;
    return *this;
  }

  CookieOptions& withSameSite(SameSite value) {
    sameSite = value;
    return *this;
  }

  std::optional<std::int64_t> maxAge;  // Max-Age in seconds
  std::optional<SysTimePoint> expires;  // formatted as an IMF-fixdate
  std::string path;
  std::string domain;
  bool secure{false};
  bool httpOnly{false};
  SameSite sameSite{SameSite::Unset};
};

}  // namespace routekit
