#include "routekit/http-request.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-constants.hpp"
#include "routekit/string-trim.hpp"
#include "routekit/url-decode.hpp"

namespace routekit {

HttpRequest::HttpRequest(http::Method method, std::string_view target, HeadersMap headers, std::string body)
    : _headers(std::move(headers)),
      _body(std::move(body)),
      _reqStart(std::chrono::steady_clock::now()),
      _method(method) {
  const auto queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    _path.assign(target);
  } else {
    _path.assign(target.substr(0, queryPos));
    _queryString.assign(target.substr(queryPos + 1));
  }
  if (_path.empty()) {
    _path.push_back('/');
  }
  parseQueryString();
  parseCookies();
}

void HttpRequest::parseQueryString() {
  std::string_view query(_queryString);
  while (!query.empty()) {
    const auto pairEnd = query.find('&');
    const std::string_view pair = query.substr(0, pairEnd);
    query.remove_prefix(pairEnd == std::string_view::npos ? query.size() : pairEnd + 1);
    if (pair.empty()) {
      continue;
    }
    const auto keyEnd = pair.find('=');
    if (keyEnd == std::string_view::npos) {
      _queryParams.push_back(QueryParam{url::DecodeComponent(pair), std::string{}});
    } else {
      _queryParams.push_back(
          QueryParam{url::DecodeComponent(pair.substr(0, keyEnd)), url::DecodeComponent(pair.substr(keyEnd + 1), ' ')});
    }
  }
}

void HttpRequest::parseCookies() {
  const auto cookieHeader = headerValue(http::Cookie);
  if (!cookieHeader) {
    return;
  }
  std::string_view remaining = *cookieHeader;
  while (!remaining.empty()) {
    const auto pairEnd = remaining.find(';');
    const std::string_view pair = TrimOws(remaining.substr(0, pairEnd));
    remaining.remove_prefix(pairEnd == std::string_view::npos ? remaining.size() : pairEnd + 1);
    const auto eqPos = pair.find('=');
    if (eqPos == std::string_view::npos || eqPos == 0) {
      continue;
    }
    _cookies.push_back(RequestCookie{std::string(TrimOws(pair.substr(0, eqPos))), url::DecodeComponent(TrimOws(pair.substr(eqPos + 1)))});
  }
}

std::optional<std::string_view> HttpRequest::cookieValue(std::string_view name) const noexcept {
  for (std::size_t pos = _cookies.size(); pos > 0; --pos) {
    const RequestCookie& cookie = _cookies[pos - 1U];
    if (cookie.name == name) {
      return std::string_view(cookie.value);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::queryParamValue(std::string_view key) const noexcept {
  for (const auto& [paramKey, paramValue] : _queryParams) {
    if (paramKey == key) {
      return std::string_view(paramValue);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view headerKey) const {
  auto it = _headers.find(std::string(headerKey));
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

}  // namespace routekit
