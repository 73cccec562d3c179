#include "routekit/mock-client.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "routekit/dispatcher.hpp"

namespace routekit {

HttpResponse MockClient::request(http::Method method, std::string_view target, std::string body, HeadersMap headers) {
  HttpRequest req(method, target, std::move(headers), std::move(body));
  return _dispatcher->dispatch(req);
}

}  // namespace routekit
