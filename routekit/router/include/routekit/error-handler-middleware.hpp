#pragma once

#include "routekit/middleware.hpp"

namespace routekit {

struct ErrorHandlerOptions {
  // Log caught exceptions with their message (error level for server errors, debug level for client errors).
  bool logErrors{true};
};

// Returns a middleware converting exceptions thrown further down the chain into JSON error responses:
//   {"error":{"status":404,"message":"User not found"}}
// - HttpError: its status is kept, its message is only written if HttpError::expose() is true, otherwise the status
//   reason phrase is used.
// - other std::exception: 500 with the generic reason phrase, the original message is never sent to the client.
// Place it first (as a global middleware) to cover the whole chain.
[[nodiscard]] Middleware MakeErrorHandlerMiddleware(ErrorHandlerOptions options = {});

}  // namespace routekit
