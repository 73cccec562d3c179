// routekit umbrella header
//
// Include this single header to pull in the public API:
//   - Dispatcher and its configuration
//   - Router, route groups, middlewares and the error handler middleware
//   - Request / Response primitives (HttpRequest, ResponseBuilder, HttpResponse, HttpError)
//   - Plugins (PluginBuilder, PluginContext, PluginManager)
//   - MockClient, to drive a Dispatcher without any transport
//
// If you prefer more granular control (to minimize compile time), include the specific headers instead.
#pragma once

#include "routekit/cookie-options.hpp"            // IWYU pragma: export
#include "routekit/dispatch-metrics.hpp"          // IWYU pragma: export
#include "routekit/dispatcher-config.hpp"         // IWYU pragma: export
#include "routekit/dispatcher.hpp"                // IWYU pragma: export
#include "routekit/error-handler-middleware.hpp"  // IWYU pragma: export
#include "routekit/http-constants.hpp"            // IWYU pragma: export
#include "routekit/http-error.hpp"                // IWYU pragma: export
#include "routekit/http-method.hpp"               // IWYU pragma: export
#include "routekit/http-request.hpp"              // IWYU pragma: export
#include "routekit/http-response.hpp"             // IWYU pragma: export
#include "routekit/http-status-code.hpp"          // IWYU pragma: export
#include "routekit/middleware.hpp"                // IWYU pragma: export
#include "routekit/mock-client.hpp"               // IWYU pragma: export
#include "routekit/plugin-builder.hpp"            // IWYU pragma: export
#include "routekit/plugin-context.hpp"            // IWYU pragma: export
#include "routekit/plugin-errors.hpp"             // IWYU pragma: export
#include "routekit/plugin-manager.hpp"            // IWYU pragma: export
#include "routekit/plugin.hpp"                    // IWYU pragma: export
#include "routekit/response-builder.hpp"          // IWYU pragma: export
#include "routekit/route-group.hpp"               // IWYU pragma: export
#include "routekit/router-config.hpp"             // IWYU pragma: export
#include "routekit/router.hpp"                    // IWYU pragma: export
