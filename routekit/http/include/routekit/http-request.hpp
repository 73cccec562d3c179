#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "routekit/flat-hash-map.hpp"
#include "routekit/http-method.hpp"
#include "routekit/path-params.hpp"
#include "routekit/string-equal-ignore-case.hpp"
#include "routekit/vector.hpp"

namespace routekit {

using HeadersMap = flat_hash_map<std::string, std::string, CaseInsensitiveHashFunc, CaseInsensitiveEqualFunc>;

struct QueryParam {
  std::string key;
  std::string value;
};

struct RequestCookie {
  std::string name;
  std::string value;
};

// Request as handed over by a transport (or the MockClient) to the Dispatcher.
// The request owns all of its data, so handlers may keep views on it for the duration of the dispatch.
class HttpRequest {
 public:
  // Builds a request from a request target (path with optional query string), e.g. '/users/42?verbose=1'.
  // An empty target is treated as '/'.
  HttpRequest(http::Method method, std::string_view target, HeadersMap headers = {}, std::string body = {});

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The raw (not percent-decoded) path, without the query string.
  // Example:
  //  GET /path               -> '/path'
  //  GET /path?key=val       -> '/path'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string, without the leading '?'. Empty if absent.
  [[nodiscard]] std::string_view queryString() const noexcept { return _queryString; }

  // Decoded query params, in order, duplicates preserved.
  // Decoding rules (application/x-www-form-urlencoded semantics for each component):
  //  - Percent escapes decoded independently for key & value; malformed escapes left verbatim.
  //  - '+' translated to space in values.
  //  - Missing '=' => value = "".
  [[nodiscard]] const vector<QueryParam>& queryParams() const noexcept { return _queryParams; }

  // Value of the first query param with given key, if any.
  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view key) const noexcept;

  // Case-insensitive header lookup.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const {
    return headerValue(headerKey).value_or(std::string_view{});
  }

  [[nodiscard]] const HeadersMap& headers() const noexcept { return _headers; }

  // Cookies of the 'Cookie' header, in header order, duplicates preserved.
  //  - Pairs are separated by ';', surrounding whitespace is ignored for names and values.
  //  - Pairs without '=' or with an empty name are skipped.
  //  - Values are percent-decoded ('+' is kept as is), malformed escapes left verbatim.
  [[nodiscard]] const vector<RequestCookie>& cookies() const noexcept { return _cookies; }

  // Value of the last cookie with given name, if any.
  [[nodiscard]] std::optional<std::string_view> cookieValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Path parameters extracted during route matching. Values are already percent-decoded.
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  [[nodiscard]] std::optional<std::string_view> pathParamValue(std::string_view key) const noexcept {
    return FindPathParam(_pathParams, key);
  }

  // Set by the Dispatcher once the route is resolved.
  void setPathParams(PathParams params) { _pathParams = std::move(params); }

  // Timestamp of the request object creation.
  [[nodiscard]] std::chrono::steady_clock::time_point reqStart() const noexcept { return _reqStart; }

 private:
  void parseQueryString();

  void parseCookies();

  std::string _path;
  std::string _queryString;
  HeadersMap _headers;
  std::string _body;
  vector<QueryParam> _queryParams;
  vector<RequestCookie> _cookies;
  PathParams _pathParams;
  std::chrono::steady_clock::time_point _reqStart;
  http::Method _method;
};

}  // namespace routekit
