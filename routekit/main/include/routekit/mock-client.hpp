#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-method.hpp"
#include "routekit/http-request.hpp"
#include "routekit/http-response.hpp"

namespace routekit {

class Dispatcher;

// In-process client building requests and handing them to a Dispatcher, without any transport.
// Mostly useful for tests.
//
//   MockClient client(dispatcher);
//   HttpResponse resp = client.get("/users/42");
class MockClient {
 public:
  explicit MockClient(Dispatcher& dispatcher) noexcept : _dispatcher(&dispatcher) {}

  // target is a path with an optional query string ('/search?q=abc').
  HttpResponse request(http::Method method, std::string_view target, std::string body = {}, HeadersMap headers = {});

  HttpResponse get(std::string_view target, std::string body = {}, HeadersMap headers = {}) {
    return request(http::Method::GET, target, std::move(body), std::move(headers));
  }

  HttpResponse post(std::string_view target, std::string body = {}, HeadersMap headers = {}) {
    return request(http::Method::POST, target, std::move(body), std::move(headers));
  }

  HttpResponse put(std::string_view target, std::string body = {}, HeadersMap headers = {}) {
    return request(http::Method::PUT, target, std::move(body), std::move(headers));
  }

  HttpResponse del(std::string_view target, std::string body = {}, HeadersMap headers = {}) {
    return request(http::Method::DELETE, target, std::move(body), std::move(headers));
  }

  HttpResponse patch(std::string_view target, std::string body = {}, HeadersMap headers = {}) {
    return request(http::Method::PATCH, target, std::move(body), std::move(headers));
  }

 private:
  Dispatcher* _dispatcher;
};

}  // namespace routekit
