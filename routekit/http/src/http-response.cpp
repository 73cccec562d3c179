#include "routekit/http-response.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-constants.hpp"
#include "routekit/string-equal-ignore-case.hpp"

namespace routekit {

HttpResponse::HttpResponse(http::StatusCode statusCode, std::string body, std::string_view contentType)
    : _body(std::move(body)), _statusCode(statusCode) {
  if (!contentType.empty()) {
    addHeader(http::ContentType, contentType);
  }
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_headers,
                                 [name](const HeaderField& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _headers.end()) {
    return addHeader(name, value);
  }
  it->value.assign(value);
  return *this;
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) {
  _headers.push_back(HeaderField{std::string(name), std::string(value)});
  return *this;
}

std::size_t HttpResponse::removeHeader(std::string_view name) {
  const auto oldSize = _headers.size();
  auto it = std::remove_if(_headers.begin(), _headers.end(),
                           [name](const HeaderField& field) { return CaseInsensitiveEqual(field.name, name); });
  _headers.erase(it, _headers.end());
  return oldSize - _headers.size();
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  for (const auto& field : _headers) {
    if (CaseInsensitiveEqual(field.name, name)) {
      return std::string_view(field.value);
    }
  }
  return std::nullopt;
}

vector<std::string_view> HttpResponse::headerValues(std::string_view name) const {
  vector<std::string_view> values;
  for (const auto& field : _headers) {
    if (CaseInsensitiveEqual(field.name, name)) {
      values.emplace_back(field.value);
    }
  }
  return values;
}

}  // namespace routekit
