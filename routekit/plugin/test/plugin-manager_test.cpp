#include "routekit/plugin-manager.hpp"

#include <gtest/gtest.h>

#include <any>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-method.hpp"
#include "routekit/http-request.hpp"
#include "routekit/http-response.hpp"
#include "routekit/middleware-pipeline.hpp"
#include "routekit/plugin-builder.hpp"
#include "routekit/plugin-context.hpp"
#include "routekit/plugin-errors.hpp"
#include "routekit/plugin-status.hpp"
#include "routekit/plugin.hpp"
#include "routekit/response-builder.hpp"
#include "routekit/router.hpp"
#include "routekit/vector.hpp"

namespace routekit {

namespace {

struct TokenStore {
  std::string secret;
};

}  // namespace

class PluginManagerTest : public ::testing::Test {
 protected:
  // Plugin recording all of its hook calls as '<name>.<hook>'.
  Plugin tracingPlugin(std::string name) {
    auto hook = [this, name](std::string_view hookName) {
      return [this, name, hookName = std::string(hookName)](PluginContext&) { trace.push_back(name + '.' + hookName); };
    };
    return PluginBuilder()
        .name(name)
        .version("1.0.0")
        .onRegister(hook("register"))
        .beforeRegister(hook("beforeRegister"))
        .afterRegister(hook("afterRegister"))
        .beforeStart(hook("beforeStart"))
        .afterStart(hook("afterStart"))
        .beforeStop(hook("beforeStop"))
        .afterStop(hook("afterStop"))
        .build();
  }

  HttpResponse call(http::Method method, std::string_view path) {
    HttpRequest req(method, path);
    auto result = router.match(method, req.path());
    if (!result.hasHandler()) {
      return HttpResponse(404);
    }
    req.setPathParams(std::move(result.params));
    return pipeline.run(req, *result.route);
  }

  vector<std::string> trace;
  Router router;
  MiddlewarePipeline pipeline;
  PluginManager manager{router, pipeline};
};

TEST_F(PluginManagerTest, RegisterRunsHooksInOrder) {
  manager.registerPlugin(tracingPlugin("a"));
  const vector<std::string> expected{"a.beforeRegister", "a.register", "a.afterRegister"};
  EXPECT_EQ(trace, expected);
  EXPECT_TRUE(manager.hasPlugin("a"));
  EXPECT_EQ(manager.status("a"), PluginStatus::Registered);
  EXPECT_EQ(manager.size(), 1U);
}

TEST_F(PluginManagerTest, StatusOfUnknownPlugin) {
  EXPECT_FALSE(manager.hasPlugin("ghost"));
  EXPECT_EQ(manager.status("ghost"), PluginStatus::Unregistered);
  EXPECT_EQ(manager.metadata("ghost"), nullptr);
}

TEST_F(PluginManagerTest, StatusDuringRegistration) {
  PluginStatus seenBefore{};
  PluginStatus seenAfter{};
  manager.registerPlugin(PluginBuilder()
                             .name("p")
                             .version("0.1.0")
                             .beforeRegister([&](PluginContext&) { seenBefore = manager.status("p"); })
                             .onRegister([](PluginContext&) {})
                             .afterRegister([&](PluginContext&) { seenAfter = manager.status("p"); })
                             .build());
  EXPECT_EQ(seenBefore, PluginStatus::Registering);
  EXPECT_EQ(seenAfter, PluginStatus::Registered);
}

TEST_F(PluginManagerTest, Metadata) {
  manager.registerPlugin(PluginBuilder()
                             .name("meta")
                             .version("2.0.0")
                             .description("desc")
                             .tag("t1")
                             .onRegister([](PluginContext&) {})
                             .build());
  const PluginMetadata* metadata = manager.metadata("meta");
  ASSERT_NE(metadata, nullptr);
  EXPECT_EQ(metadata->version, "2.0.0");
  EXPECT_EQ(metadata->description, "desc");
  ASSERT_EQ(metadata->tags.size(), 1U);
}

TEST_F(PluginManagerTest, DuplicateRegistrationThrows) {
  manager.registerPlugin(tracingPlugin("a"));
  trace.clear();
  try {
    manager.registerPlugin(tracingPlugin("a"));
    FAIL() << "expected DuplicatePluginError";
  } catch (const DuplicatePluginError& ex) {
    EXPECT_STREQ(ex.what(), "Plugin 'a' is already registered");
    EXPECT_EQ(ex.pluginName(), "a");
  }
  EXPECT_TRUE(trace.empty());
  EXPECT_EQ(manager.size(), 1U);
}

TEST_F(PluginManagerTest, MissingDependencyThrowsWithoutSideEffects) {
  Plugin plugin = PluginBuilder()
                      .name("api")
                      .version("1.0.0")
                      .dependsOn("db")
                      .onRegister([](PluginContext& ctx) { ctx.get("/x", [](HttpRequest&, ResponseBuilder&) {}); })
                      .build();
  try {
    manager.registerPlugin(std::move(plugin));
    FAIL() << "expected MissingDependencyError";
  } catch (const MissingDependencyError& ex) {
    EXPECT_STREQ(ex.what(), "Plugin 'api' depends on 'db' which is not registered");
    EXPECT_EQ(ex.dependency(), "db");
  }
  EXPECT_FALSE(manager.hasPlugin("api"));
  EXPECT_TRUE(router.empty());
}

TEST_F(PluginManagerTest, DependencySatisfiedWhenRegisteredFirst) {
  manager.registerPlugin(tracingPlugin("db"));
  manager.registerPlugin(
      PluginBuilder().name("api").version("1.0.0").dependsOn("db").onRegister([](PluginContext&) {}).build());
  const vector<std::string> expected{"db", "api"};
  EXPECT_EQ(manager.pluginNames(), expected);
}

TEST_F(PluginManagerTest, PluginErrorsArePluginErrors) {
  manager.registerPlugin(tracingPlugin("a"));
  EXPECT_THROW(manager.registerPlugin(tracingPlugin("a")), PluginError);
  EXPECT_THROW(manager.registerPlugin(tracingPlugin("a")), std::runtime_error);
}

TEST_F(PluginManagerTest, FailedRegistrationForgetsPluginButKeepsRoutes) {
  bool shouldFail = true;
  auto makePlugin = [&shouldFail] {
    return PluginBuilder()
        .name("flaky")
        .version("1.0.0")
        .onRegister([&shouldFail](PluginContext& ctx) {
          ctx.get(shouldFail ? "/first" : "/second", [](HttpRequest&, ResponseBuilder& res) { res.text("ok"); });
          if (shouldFail) {
            throw std::runtime_error("boom");
          }
        })
        .build();
  };

  EXPECT_THROW(manager.registerPlugin(makePlugin()), std::runtime_error);
  EXPECT_FALSE(manager.hasPlugin("flaky"));
  EXPECT_EQ(manager.status("flaky"), PluginStatus::Unregistered);
  EXPECT_EQ(router.size(), 1U);

  shouldFail = false;
  manager.registerPlugin(makePlugin());
  EXPECT_TRUE(manager.hasPlugin("flaky"));
  EXPECT_EQ(router.size(), 2U);
}

TEST_F(PluginManagerTest, FailingAfterRegisterHookRemovesPlugin) {
  EXPECT_THROW(manager.registerPlugin(PluginBuilder()
                                          .name("p")
                                          .version("1.0.0")
                                          .onRegister([](PluginContext&) {})
                                          .afterRegister([](PluginContext&) { throw std::logic_error("late"); })
                                          .build()),
               std::logic_error);
  EXPECT_FALSE(manager.hasPlugin("p"));
}

TEST_F(PluginManagerTest, RoutesOfFailedRegistrationCanStillUseTheirContext) {
  EXPECT_THROW(manager.registerPlugin(PluginBuilder()
                                          .name("half")
                                          .version("1.0.0")
                                          .onRegister([](PluginContext& ctx) {
                                            ctx.get("/kept", [&ctx](HttpRequest&, ResponseBuilder& res) {
                                              res.text(std::string(ctx.name()));
                                            });
                                            throw std::runtime_error("boom");
                                          })
                                          .build()),
               std::runtime_error);
  EXPECT_FALSE(manager.hasPlugin("half"));

  const HttpResponse resp = call(http::Method::GET, "/kept");
  EXPECT_EQ(resp.status(), 200);
  EXPECT_EQ(resp.body(), "half");
}

TEST_F(PluginManagerTest, NonStandardExceptionDuringRegistrationForgetsPlugin) {
  bool shouldFail = true;
  auto makePlugin = [&shouldFail] {
    return PluginBuilder()
        .name("odd")
        .version("1.0.0")
        .onRegister([&shouldFail](PluginContext&) {
          if (shouldFail) {
            throw 42;
          }
        })
        .build();
  };

  EXPECT_THROW(manager.registerPlugin(makePlugin()), int);
  EXPECT_FALSE(manager.hasPlugin("odd"));
  EXPECT_EQ(manager.status("odd"), PluginStatus::Unregistered);
  EXPECT_EQ(manager.size(), 0U);

  shouldFail = false;
  manager.registerPlugin(makePlugin());
  EXPECT_EQ(manager.status("odd"), PluginStatus::Registered);
  manager.startPlugins();
  EXPECT_EQ(manager.status("odd"), PluginStatus::Started);
}

TEST_F(PluginManagerTest, NonStandardExceptionInHookIsWrappedAndStartRolledBack) {
  manager.registerPlugin(tracingPlugin("a"));
  manager.registerPlugin(PluginBuilder()
                             .name("odd")
                             .version("1.0.0")
                             .onRegister([](PluginContext&) {})
                             .beforeStart([](PluginContext&) { throw 42; })
                             .build());

  try {
    manager.startPlugins();
    FAIL() << "expected LifecycleHookError";
  } catch (const LifecycleHookError& ex) {
    EXPECT_EQ(ex.pluginName(), "odd");
    EXPECT_EQ(ex.hookName(), "beforeStart");
    try {
      std::rethrow_if_nested(ex);
      FAIL() << "expected a nested exception";
    } catch (int value) {
      EXPECT_EQ(value, 42);
    }
  }

  EXPECT_FALSE(manager.isStarted());
  EXPECT_EQ(manager.status("a"), PluginStatus::Registered);
  EXPECT_EQ(manager.status("odd"), PluginStatus::Registered);
}

TEST_F(PluginManagerTest, RejectsPluginWithoutRegisterFunction) {
  Plugin plugin;
  plugin.metadata.name = "raw";
  EXPECT_THROW(manager.registerPlugin(std::move(plugin)), std::invalid_argument);
}

TEST_F(PluginManagerTest, ConfigMergesDefaultsAndOptions) {
  std::string host;
  std::string port;
  std::string user;
  PluginRegistrationOptions options;
  options.config["port"] = "6543";
  options.config["user"] = "admin";
  manager.registerPlugin(PluginBuilder()
                             .name("db")
                             .version("1.0.0")
                             .config("host", "localhost")
                             .config("port", "5432")
                             .onRegister([&](PluginContext& ctx) {
                               host = std::string(ctx.configValue("host").value_or(""));
                               port = std::string(ctx.configValue("port").value_or(""));
                               user = std::string(ctx.configValue("user").value_or(""));
                               EXPECT_EQ(ctx.configValue("missing"), std::nullopt);
                               EXPECT_EQ(ctx.config().size(), 3U);
                             })
                             .build(),
                         std::move(options));
  EXPECT_EQ(host, "localhost");
  EXPECT_EQ(port, "6543");
  EXPECT_EQ(user, "admin");
}

TEST_F(PluginManagerTest, RoutesArePrefixed) {
  PluginRegistrationOptions options;
  options.prefix = "/api/v1/";
  manager.registerPlugin(PluginBuilder()
                             .name("users")
                             .version("1.0.0")
                             .onRegister([](PluginContext& ctx) {
                               EXPECT_EQ(ctx.prefix(), "/api/v1");
                               ctx.get("/users/:id", [](HttpRequest& req, ResponseBuilder& res) {
                                 res.text(std::string(req.pathParamValue("id").value_or("")));
                               });
                               ctx.addRoute(http::Method::DELETE, "/", [](HttpRequest&, ResponseBuilder& res) {
                                 res.status(204).end();
                               });
                             })
                             .build(),
                         std::move(options));

  auto resp = call(http::Method::GET, "/api/v1/users/7");
  EXPECT_EQ(resp.status(), 200);
  EXPECT_EQ(resp.body(), "7");
  EXPECT_EQ(call(http::Method::GET, "/users/7").status(), 404);
  EXPECT_EQ(call(http::Method::DELETE, "/api/v1").status(), 204);
}

TEST_F(PluginManagerTest, MiddlewaresGlobalAndPrefixed) {
  PluginRegistrationOptions options;
  options.prefix = "/admin";
  manager.registerPlugin(PluginBuilder()
                             .name("guard")
                             .version("1.0.0")
                             .onRegister([](PluginContext& ctx) {
                               ctx.addMiddleware([](HttpRequest&, const Next& next) {
                                 HttpResponse resp = next();
                                 resp.header("X-Global", "1");
                                 return resp;
                               });
                               ctx.addMiddleware("/", [](HttpRequest&, const Next& next) {
                                 HttpResponse resp = next();
                                 resp.header("X-Admin", "1");
                                 return resp;
                               });
                             })
                             .build(),
                         std::move(options));
  router.get("/admin/panel", [](HttpRequest&, ResponseBuilder& res) { res.text("panel"); });
  router.get("/public", [](HttpRequest&, ResponseBuilder& res) { res.text("public"); });

  auto adminResp = call(http::Method::GET, "/admin/panel");
  EXPECT_EQ(adminResp.headerValue("X-Global"), "1");
  EXPECT_EQ(adminResp.headerValue("X-Admin"), "1");

  auto publicResp = call(http::Method::GET, "/public");
  EXPECT_EQ(publicResp.headerValue("X-Global"), "1");
  EXPECT_EQ(publicResp.headerValue("X-Admin"), std::nullopt);
}

TEST_F(PluginManagerTest, ServicesAreNamespaced) {
  manager.registerPlugin(PluginBuilder()
                             .name("auth")
                             .version("1.0.0")
                             .onRegister([](PluginContext& ctx) {
                               ctx.registerService("tokens", std::make_shared<TokenStore>(TokenStore{"s3cr3t"}));
                               auto own = ctx.getService<TokenStore>("tokens");
                               ASSERT_NE(own, nullptr);
                               EXPECT_EQ(own->secret, "s3cr3t");
                             })
                             .build());

  std::shared_ptr<TokenStore> qualified;
  std::shared_ptr<TokenStore> bare;
  manager.registerPlugin(PluginBuilder()
                             .name("api")
                             .version("1.0.0")
                             .dependsOn("auth")
                             .onRegister([&](PluginContext& ctx) {
                               qualified = ctx.getService<TokenStore>("auth:tokens");
                               bare = ctx.getService<TokenStore>("tokens");
                             })
                             .build());

  ASSERT_NE(qualified, nullptr);
  EXPECT_EQ(qualified->secret, "s3cr3t");
  EXPECT_EQ(bare, nullptr);
  EXPECT_NE(manager.getService<TokenStore>("auth:tokens"), nullptr);
  EXPECT_EQ(manager.getService<TokenStore>("tokens"), nullptr);
}

TEST_F(PluginManagerTest, DuplicateServiceThrows) {
  EXPECT_THROW(manager.registerPlugin(PluginBuilder()
                                          .name("dup")
                                          .version("1.0.0")
                                          .onRegister([](PluginContext& ctx) {
                                            ctx.registerService("svc", std::make_shared<int>(1));
                                            ctx.registerService("svc", std::make_shared<int>(2));
                                          })
                                          .build()),
               std::logic_error);
  EXPECT_FALSE(manager.hasPlugin("dup"));
  EXPECT_EQ(*manager.getService<int>("dup:svc"), 1);
}

TEST_F(PluginManagerTest, StorageSharedBetweenRegisterAndHooks) {
  int startedWith = 0;
  manager.registerPlugin(PluginBuilder()
                             .name("store")
                             .version("1.0.0")
                             .onRegister([](PluginContext& ctx) { ctx.storage()["count"] = 41; })
                             .beforeStart([&startedWith](PluginContext& ctx) {
                               startedWith = std::any_cast<int>(ctx.storage()["count"]) + 1;
                             })
                             .build());
  manager.startPlugins();
  EXPECT_EQ(startedWith, 42);
}

TEST_F(PluginManagerTest, StartRunsAllBeforeStartThenAllAfterStart) {
  manager.registerPlugin(tracingPlugin("a"));
  manager.registerPlugin(tracingPlugin("b"));
  trace.clear();

  manager.startPlugins();
  const vector<std::string> expected{"a.beforeStart", "b.beforeStart", "a.afterStart", "b.afterStart"};
  EXPECT_EQ(trace, expected);
  EXPECT_TRUE(manager.isStarted());
  EXPECT_EQ(manager.status("a"), PluginStatus::Started);
  EXPECT_EQ(manager.status("b"), PluginStatus::Started);
}

TEST_F(PluginManagerTest, StartTwiceThrows) {
  manager.startPlugins();
  EXPECT_THROW(manager.startPlugins(), std::logic_error);
}

TEST_F(PluginManagerTest, RegisterAfterStartThrows) {
  manager.startPlugins();
  EXPECT_THROW(manager.registerPlugin(tracingPlugin("late")), std::logic_error);
  EXPECT_FALSE(manager.hasPlugin("late"));
}

TEST_F(PluginManagerTest, ServiceRegistryFrozenAfterStart) {
  PluginContext* savedContext = nullptr;
  manager.registerPlugin(PluginBuilder()
                             .name("p")
                             .version("1.0.0")
                             .onRegister([&savedContext](PluginContext& ctx) { savedContext = &ctx; })
                             .build());
  manager.startPlugins();
  EXPECT_TRUE(manager.services().frozen());
  ASSERT_NE(savedContext, nullptr);
  EXPECT_THROW(savedContext->registerService("late", std::make_shared<int>(0)), std::logic_error);
}

TEST_F(PluginManagerTest, StopRunsHooksInReverseOrder) {
  manager.registerPlugin(tracingPlugin("a"));
  manager.registerPlugin(tracingPlugin("b"));
  manager.startPlugins();
  trace.clear();

  manager.stopPlugins();
  const vector<std::string> expected{"b.beforeStop", "a.beforeStop", "b.afterStop", "a.afterStop"};
  EXPECT_EQ(trace, expected);
  EXPECT_FALSE(manager.isStarted());
  EXPECT_EQ(manager.status("a"), PluginStatus::Stopped);
}

TEST_F(PluginManagerTest, StopWithoutStartIsNoop) {
  manager.registerPlugin(tracingPlugin("a"));
  trace.clear();
  manager.stopPlugins();
  EXPECT_TRUE(trace.empty());
  EXPECT_EQ(manager.status("a"), PluginStatus::Registered);
}

TEST_F(PluginManagerTest, StopTwiceIsNoop) {
  manager.registerPlugin(tracingPlugin("a"));
  manager.startPlugins();
  manager.stopPlugins();
  trace.clear();
  manager.stopPlugins();
  EXPECT_TRUE(trace.empty());
  EXPECT_THROW(manager.startPlugins(), std::logic_error);
}

TEST_F(PluginManagerTest, FailingStartHookIsWrapped) {
  manager.registerPlugin(tracingPlugin("a"));
  manager.registerPlugin(PluginBuilder()
                             .name("bad")
                             .version("1.0.0")
                             .onRegister([](PluginContext&) {})
                             .beforeStart([](PluginContext&) { throw std::runtime_error("cannot connect"); })
                             .build());
  manager.registerPlugin(tracingPlugin("c"));
  trace.clear();

  try {
    manager.startPlugins();
    FAIL() << "expected LifecycleHookError";
  } catch (const LifecycleHookError& ex) {
    EXPECT_EQ(ex.pluginName(), "bad");
    EXPECT_EQ(ex.hookName(), "beforeStart");
    try {
      std::rethrow_if_nested(ex);
      FAIL() << "expected a nested exception";
    } catch (const std::runtime_error& nested) {
      EXPECT_STREQ(nested.what(), "cannot connect");
    }
  }

  const vector<std::string> expected{"a.beforeStart"};
  EXPECT_EQ(trace, expected);
  EXPECT_FALSE(manager.isStarted());
  EXPECT_FALSE(manager.services().frozen());
  EXPECT_EQ(manager.status("a"), PluginStatus::Registered);
}

TEST_F(PluginManagerTest, FailingStopHookIsWrapped) {
  manager.registerPlugin(PluginBuilder()
                             .name("bad")
                             .version("1.0.0")
                             .onRegister([](PluginContext&) {})
                             .afterStop([](PluginContext&) { throw std::runtime_error("flush failed"); })
                             .build());
  manager.startPlugins();
  EXPECT_THROW(manager.stopPlugins(), LifecycleHookError);
  EXPECT_FALSE(manager.isStarted());
}

}  // namespace routekit
