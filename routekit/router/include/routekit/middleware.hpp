#pragma once

#include <cstddef>
#include <functional>
#include <span>

#include "routekit/http-request.hpp"
#include "routekit/http-response.hpp"
#include "routekit/response-builder.hpp"

namespace routekit {

class Next;

// Route handler. It receives the request (with its path params already set) and fills the response builder.
// If the handler does not call any terminal mutator, the response is implicitly finalized with the current status
// and headers and an empty body.
using RequestHandler = std::function<void(HttpRequest&, ResponseBuilder&)>;

// Middleware following the "onion" model:
//   - code before next() runs on the way in
//   - next() runs the rest of the chain (later middlewares, then the handler) and returns its response
//   - code after next() runs on the way out and may amend the returned response
// A middleware that does not call next() short-circuits the chain, its returned response is the final one
// (return HttpResponse{} for an empty 200).
// Exceptions are not caught, they propagate to the previous middlewares and up to the Dispatcher.
using Middleware = std::function<HttpResponse(HttpRequest&, const Next&)>;

// Continuation given to a middleware, running the remaining part of the chain.
class Next {
 public:
  HttpResponse operator()() const;

 private:
  friend class MiddlewarePipeline;

  Next(std::span<const Middleware* const> chain, const RequestHandler& handler, HttpRequest& request,
       std::size_t pos) noexcept
      : _chain(chain), _handler(handler), _request(request), _pos(pos) {}

  std::span<const Middleware* const> _chain;
  const RequestHandler& _handler;
  HttpRequest& _request;
  std::size_t _pos;
};

}  // namespace routekit
