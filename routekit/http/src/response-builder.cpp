#include "routekit/response-builder.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/cookie-options.hpp"
#include "routekit/http-constants.hpp"
#include "routekit/http-response.hpp"
#include "routekit/string-equal-ignore-case.hpp"
#include "routekit/string-trim.hpp"
#include "routekit/timestring.hpp"

namespace routekit {

namespace {

constexpr std::string_view kExpiredCookieDate = "Thu, 01 Jan 1970 00:00:00 GMT";

constexpr std::string_view SameSiteStr(CookieOptions::SameSite sameSite) {
  switch (sameSite) {
    case CookieOptions::SameSite::Strict:
      return "Strict";
    case CookieOptions::SameSite::Lax:
      return "Lax";
    case CookieOptions::SameSite::None:
      return "None";
    default:
      return {};
  }
}

void AppendPathAndDomain(std::string& cookieStr, const CookieOptions& options) {
  if (!options.path.empty()) {
    cookieStr.append("; Path=").append(options.path);
  }
  if (!options.domain.empty()) {
    cookieStr.append("; Domain=").append(options.domain);
  }
}

bool ContainsToken(std::string_view list, std::string_view token) {
  while (!list.empty()) {
    const auto commaPos = list.find(',');
    if (CaseInsensitiveEqual(TrimOws(list.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace

void ResponseBuilder::ensurePending() const {
  if (_state == ResponseState::Sent) {
    throw AlreadySentError();
  }
}

ResponseBuilder& ResponseBuilder::status(http::StatusCode statusCode) {
  ensurePending();
  _response.status(statusCode);
  return *this;
}

ResponseBuilder& ResponseBuilder::header(std::string_view name, std::string_view value) {
  ensurePending();
  _response.header(name, value);
  return *this;
}

ResponseBuilder& ResponseBuilder::headers(
    std::initializer_list<std::pair<std::string_view, std::string_view>> headers) {
  ensurePending();
  for (const auto& [name, value] : headers) {
    _response.header(name, value);
  }
  return *this;
}

ResponseBuilder& ResponseBuilder::cookie(std::string_view name, std::string_view value,
                                         const CookieOptions& options) {
  ensurePending();
  std::string cookieStr;
  cookieStr.reserve(name.size() + value.size() + 64U);
  cookieStr.append(name).push_back('=');
  cookieStr.append(value);
  if (options.maxAge) {
    cookieStr.append("; Max-Age=").append(std::to_string(*options.maxAge));
  }
  if (options.expires) {
    char buf[kRFC7231DateStrLen];
    char* end = TimeToStringRFC7231(*options.expires, buf);
    cookieStr.append("; Expires=").append(buf, end);
  }
  AppendPathAndDomain(cookieStr, options);
  if (options.secure) {
    cookieStr.append("; Secure");
  }
  if (options.httpOnly) {
    cookieStr.append("; HttpOnly");
  }
  if (options.sameSite != CookieOptions::SameSite::Unset) {
    cookieStr.append("; SameSite=").append(SameSiteStr(options.sameSite));
  }
  _response.addHeader(http::SetCookie, cookieStr);
  return *this;
}

ResponseBuilder& ResponseBuilder::clearCookie(std::string_view name, const CookieOptions& options) {
  ensurePending();
  std::string cookieStr(name);
  cookieStr.append("=; Max-Age=0; Expires=").append(kExpiredCookieDate);
  AppendPathAndDomain(cookieStr, options);
  _response.addHeader(http::SetCookie, cookieStr);
  return *this;
}

ResponseBuilder& ResponseBuilder::type(std::string_view mime) {
  ensurePending();
  _response.header(http::ContentType, mime);
  return *this;
}

ResponseBuilder& ResponseBuilder::attachment(std::string_view filename) {
  ensurePending();
  std::string disposition("attachment");
  if (!filename.empty()) {
    disposition.append("; filename=\"").append(filename).push_back('"');
  }
  _response.header(http::ContentDisposition, disposition);
  return *this;
}

ResponseBuilder& ResponseBuilder::vary(std::string_view field) {
  ensurePending();
  field = TrimOws(field);
  if (field.empty()) {
    return *this;
  }
  const auto existing = _response.headerValue(http::Vary);
  if (!existing || TrimOws(*existing).empty()) {
    _response.header(http::Vary, field);
  } else if (!ContainsToken(*existing, field)) {
    std::string newValue(*existing);
    newValue.append(", ").append(field);
    _response.header(http::Vary, newValue);
  }
  return *this;
}

ResponseBuilder& ResponseBuilder::send(std::string_view data) {
  ensurePending();
  return finalizeBody(std::string(data), http::ContentTypeTextPlain);
}

ResponseBuilder& ResponseBuilder::html(std::string_view content) {
  ensurePending();
  return finalizeBody(std::string(content), http::ContentTypeTextHtml);
}

ResponseBuilder& ResponseBuilder::text(std::string_view content) {
  ensurePending();
  return finalizeBody(std::string(content), http::ContentTypeTextPlain);
}

ResponseBuilder& ResponseBuilder::redirect(std::string_view location, http::StatusCode statusCode) {
  ensurePending();
  _response.status(statusCode);
  _response.header(http::Location, location);
  std::string body("Redirecting to ");
  body.append(location);
  return finalizeBody(std::move(body), {});
}

ResponseBuilder& ResponseBuilder::end() {
  ensurePending();
  return finalizeBody(std::string{}, {});
}

ResponseBuilder& ResponseBuilder::finalizeBody(std::string body, std::string_view defaultContentType) {
  if (!defaultContentType.empty() && !_response.headerValue(http::ContentType)) {
    _response.header(http::ContentType, defaultContentType);
  }
  _response.body(std::move(body));
  _state = ResponseState::Sent;
  return *this;
}

HttpResponse ResponseBuilder::takeResponse() && {
  if (_state == ResponseState::Pending) {
    // implicit finalization: status and headers are kept, body stays empty
    _response.body(std::string{});
    _state = ResponseState::Sent;
  }
  return std::move(_response);
}

}  // namespace routekit
