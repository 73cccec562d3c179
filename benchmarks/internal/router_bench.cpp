// Router benchmarks measuring route resolution performance:
//  - Literal-only paths (static routes)
//  - Patterned routes with parameters and wildcards
//  - Route match cache lookups, compared to a plain match
//  - Full dispatch through the middleware chain

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/dispatcher.hpp"
#include "routekit/http-method.hpp"
#include "routekit/http-request.hpp"
#include "routekit/response-builder.hpp"
#include "routekit/route-match-cache.hpp"
#include "routekit/router.hpp"
#include "routekit/vector.hpp"

namespace routekit {

namespace {

using http::Method;

std::mt19937_64 gen;

void OkHandler([[maybe_unused]] HttpRequest& req, ResponseBuilder& res) { res.text("OK"); }

struct MethodAndPath {
  Method method;
  std::string_view path;
};

struct RouterWithRoutes {
  void set(Method method, std::string_view pattern, std::string_view samplePath) {
    paths.push_back(MethodAndPath{method, samplePath});
    router.addRoute(method, pattern, OkHandler);
  }

  const MethodAndPath& pickRandomPath() {
    std::uniform_int_distribution<std::size_t> dist(0, paths.size() - 1);
    return paths[dist(gen)];
  }

  auto match(Method method, std::string_view path) { return router.match(method, path); }

  void clear() {
    paths.clear();
    router = Router();
  }

  vector<MethodAndPath> paths;
  Router router;
};

}  // namespace

// -----------------------------------------------------------------------------
// Fixture: Literal-only routes (e.g., /api/v1/users, /health, /metrics)
// -----------------------------------------------------------------------------
class LiteralRoutesFixture : public benchmark::Fixture {
 public:
  void SetUp(const benchmark::State& /* state */) override {
    router.set(Method::GET, "/", "/");
    router.set(Method::GET, "/health", "/health");
    router.set(Method::GET, "/metrics", "/metrics");
    router.set(Method::GET, "/api/v1/users", "/api/v1/users");
    router.set(Method::POST, "/api/v1/users", "/api/v1/users");
    router.set(Method::GET, "/api/v1/orders", "/api/v1/orders");
    router.set(Method::POST, "/api/v1/orders", "/api/v1/orders");
    router.set(Method::GET, "/api/v1/products", "/api/v1/products");
    router.set(Method::GET, "/api/v1/categories", "/api/v1/categories");
    router.set(Method::GET, "/api/v2/users", "/api/v2/users");
    router.set(Method::GET, "/static/css/main.css", "/static/css/main.css");
    router.set(Method::GET, "/admin/dashboard/settings/security", "/admin/dashboard/settings/security");
  }

  void TearDown(const benchmark::State& /* state */) override { router.clear(); }

  RouterWithRoutes router;
};

BENCHMARK_F(LiteralRoutesFixture, MatchRoot)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(Method::GET, "/");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(LiteralRoutesFixture, MatchDeepPath)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(Method::GET, "/admin/dashboard/settings/security");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(LiteralRoutesFixture, MatchNonExistent)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(Method::GET, "/does/not/exist");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(LiteralRoutesFixture, MatchRandomPaths)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    const auto& mp = router.pickRandomPath();
    auto result = router.match(mp.method, mp.path);
    benchmark::DoNotOptimize(result);
  }
}

// -----------------------------------------------------------------------------
// Fixture: Patterned routes with parameters and wildcards
// -----------------------------------------------------------------------------
class PatternedRoutesFixture : public benchmark::Fixture {
 public:
  void SetUp(const benchmark::State& /* state */) override {
    router.set(Method::GET, "/users/:id", "/users/42");
    router.set(Method::GET, "/users/:id/posts/:postId", "/users/42/posts/7");
    router.set(Method::GET, "/users/:id/posts/:postId/comments/:commentId", "/users/42/posts/7/comments/3");
    router.set(Method::GET, "/orgs/:org/repos/:repo/issues", "/orgs/acme/repos/routekit/issues");
    router.set(Method::GET, "/files/%E2%9C%93/:name", "/files/%E2%9C%93/report%20final.pdf");
    router.set(Method::GET, "/static/*", "/static/js/vendor/app.min.js");
    router.set(Method::GET, "/assets/:version/*", "/assets/v3/img/logo.png");
  }

  void TearDown(const benchmark::State& /* state */) override { router.clear(); }

  RouterWithRoutes router;
};

BENCHMARK_F(PatternedRoutesFixture, MatchSingleParam)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(Method::GET, "/users/42");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchMultipleParams)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(Method::GET, "/users/42/posts/7/comments/3");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchEncodedParam)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(Method::GET, "/files/%E2%9C%93/report%20final.pdf");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchWildcard)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(Method::GET, "/static/js/vendor/app.min.js");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchRandomPaths)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    const auto& mp = router.pickRandomPath();
    auto result = router.match(mp.method, mp.path);
    benchmark::DoNotOptimize(result);
  }
}

// -----------------------------------------------------------------------------
// Route match cache
// -----------------------------------------------------------------------------
static void CacheHit(benchmark::State& st) {
  Router router;
  router.get("/users/:id/posts/:postId", OkHandler);
  RouteMatchCache cache;
  auto result = router.match(Method::GET, "/users/42/posts/7");
  const std::string key = MakeCacheKey(Method::GET, "/users/42/posts/7");
  cache.set(key, result.route, result.params);
  for ([[maybe_unused]] auto iter : st) {
    auto entry = cache.get(key);
    benchmark::DoNotOptimize(entry);
  }
}
BENCHMARK(CacheHit);

static void CacheChurn(benchmark::State& st) {
  Router router;
  router.get("/items/:id", OkHandler);
  RouteMatchCache cache(static_cast<std::size_t>(st.range(0)));
  vector<std::string> paths;
  for (int64_t pos = 0; pos < 4 * st.range(0); ++pos) {
    paths.push_back("/items/" + std::to_string(pos));
  }
  std::size_t pos = 0;
  for ([[maybe_unused]] auto iter : st) {
    const std::string& path = paths[pos++ % paths.size()];
    const std::string key = MakeCacheKey(Method::GET, path);
    if (!cache.get(key)) {
      auto result = router.match(Method::GET, path);
      cache.set(key, result.route, std::move(result.params));
    }
  }
}
BENCHMARK(CacheChurn)->Arg(16)->Arg(1000);

// -----------------------------------------------------------------------------
// Full dispatch
// -----------------------------------------------------------------------------
static void Dispatch(benchmark::State& st) {
  Dispatcher dispatcher(DispatcherConfig{}.withRouteCache(st.range(0) != 0));
  dispatcher.use([](HttpRequest&, const Next& next) { return next(); });
  dispatcher.use("/api", [](HttpRequest&, const Next& next) { return next(); });
  dispatcher.get("/api/users/:id", OkHandler);
  for ([[maybe_unused]] auto iter : st) {
    HttpRequest req(Method::GET, "/api/users/42?verbose=1");
    auto resp = dispatcher.dispatch(req);
    benchmark::DoNotOptimize(resp);
  }
}
BENCHMARK(Dispatch)->Arg(0)->Arg(1);

}  // namespace routekit

BENCHMARK_MAIN();
