#include "routekit/error-handler-middleware.hpp"

#include <exception>
#include <string>
#include <string_view>

#include "routekit/http-constants.hpp"
#include "routekit/http-error.hpp"
#include "routekit/http-request.hpp"
#include "routekit/http-response.hpp"
#include "routekit/http-status-code.hpp"
#include "routekit/json-serializer.hpp"
#include "routekit/log.hpp"

namespace routekit {

namespace detail {

// Serialized by glaze reflection, kept out of the anonymous namespace.
struct ErrorDetail {
  int status;
  std::string message;
};

struct ErrorBody {
  ErrorDetail error;
};

}  // namespace detail

namespace {

HttpResponse MakeErrorResponse(http::StatusCode statusCode, std::string_view message) {
  detail::ErrorBody body{detail::ErrorDetail{statusCode, std::string(message)}};
  return {statusCode, SerializeToJson(body), http::ContentTypeApplicationJson};
}

std::string_view ReasonOrGeneric(http::StatusCode statusCode) {
  std::string_view reason = http::ReasonPhraseFor(statusCode);
  return reason.empty() ? http::ReasonInternalServerError : reason;
}

}  // namespace

Middleware MakeErrorHandlerMiddleware(ErrorHandlerOptions options) {
  return [options](HttpRequest& request, const Next& next) -> HttpResponse {
    try {
      return next();
    } catch (const HttpError& ex) {
      const auto statusCode = ex.statusCode();
      if (options.logErrors) {
        if (statusCode >= http::StatusCodeInternalServerError) {
          log::error("{} {} failed with HTTP error {}: {}", http::MethodToStr(request.method()), request.path(),
                     statusCode, ex.what());
        } else {
          log::debug("{} {} failed with HTTP error {}: {}", http::MethodToStr(request.method()), request.path(),
                     statusCode, ex.what());
        }
      }
      return MakeErrorResponse(statusCode, ex.expose() ? std::string_view(ex.what()) : ReasonOrGeneric(statusCode));
    } catch (const std::exception& ex) {
      if (options.logErrors) {
        log::error("{} {} failed with exception: {}", http::MethodToStr(request.method()), request.path(), ex.what());
      }
      return MakeErrorResponse(http::StatusCodeInternalServerError, http::ReasonInternalServerError);
    }
  };
}

}  // namespace routekit
