#pragma once

#include <string_view>

#include "routekit/http-status-code.hpp"

namespace routekit::http {

// Header field names are case-insensitive. They are stored here in their conventional canonical form for emission,
// lookups go through CaseInsensitiveEqual.
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Vary = "Vary";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view Cookie = "Cookie";

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

// Reason Phrases
inline constexpr std::string_view ReasonOK = "OK";                                      // 200
inline constexpr std::string_view ReasonCreated = "Created";                            // 201
inline constexpr std::string_view ReasonAccepted = "Accepted";                          // 202
inline constexpr std::string_view ReasonNoContent = "No Content";                       // 204
inline constexpr std::string_view ReasonMovedPermanently = "Moved Permanently";         // 301
inline constexpr std::string_view ReasonFound = "Found";                                // 302
inline constexpr std::string_view ReasonSeeOther = "See Other";                         // 303
inline constexpr std::string_view ReasonNotModified = "Not Modified";                   // 304
inline constexpr std::string_view ReasonTemporaryRedirect = "Temporary Redirect";       // 307
inline constexpr std::string_view ReasonPermanentRedirect = "Permanent Redirect";       // 308
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                     // 400
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";                  // 401
inline constexpr std::string_view ReasonForbidden = "Forbidden";                        // 403
inline constexpr std::string_view ReasonNotFound = "Not Found";                         // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";        // 405
inline constexpr std::string_view ReasonNotAcceptable = "Not Acceptable";               // 406
inline constexpr std::string_view ReasonConflict = "Conflict";                          // 409
inline constexpr std::string_view ReasonGone = "Gone";                                  // 410
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";          // 413
inline constexpr std::string_view ReasonUnsupportedMediaType = "Unsupported Media Type";  // 415
inline constexpr std::string_view ReasonUnprocessableEntity = "Unprocessable Entity";   // 422
inline constexpr std::string_view ReasonTooManyRequests = "Too Many Requests";          // 429
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";  // 500
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";             // 501
inline constexpr std::string_view ReasonBadGateway = "Bad Gateway";                     // 502
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";     // 503
inline constexpr std::string_view ReasonGatewayTimeout = "Gateway Timeout";             // 504

// Return the canonical reason phrase for the status codes we know, empty otherwise.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeAccepted:
      return ReasonAccepted;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeMovedPermanently:
      return ReasonMovedPermanently;
    case StatusCodeFound:
      return ReasonFound;
    case StatusCodeSeeOther:
      return ReasonSeeOther;
    case StatusCodeNotModified:
      return ReasonNotModified;
    case StatusCodeTemporaryRedirect:
      return ReasonTemporaryRedirect;
    case StatusCodePermanentRedirect:
      return ReasonPermanentRedirect;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeNotAcceptable:
      return ReasonNotAcceptable;
    case StatusCodeConflict:
      return ReasonConflict;
    case StatusCodeGone:
      return ReasonGone;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeUnsupportedMediaType:
      return ReasonUnsupportedMediaType;
    case StatusCodeUnprocessableEntity:
      return ReasonUnprocessableEntity;
    case StatusCodeTooManyRequests:
      return ReasonTooManyRequests;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeBadGateway:
      return ReasonBadGateway;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    case StatusCodeGatewayTimeout:
      return ReasonGatewayTimeout;
    default:
      return {};
  }
}

}  // namespace routekit::http
