#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <routekit/routekit.hpp>

using namespace routekit;

namespace {

struct RequestCounter {
  std::atomic<uint64_t> count{0};
};

Plugin MakeMetricsPlugin() {
  return PluginBuilder()
      .name("metrics")
      .version("1.0.0")
      .description("Counts dispatched requests")
      .onRegister([](PluginContext &ctx) {
        auto counter = std::make_shared<RequestCounter>();
        ctx.registerService("counter", counter);
        ctx.addMiddleware([counter](HttpRequest &, const Next &next) {
          counter->count.fetch_add(1, std::memory_order_relaxed);
          return next();
        });
        ctx.get("/metrics", [counter](HttpRequest &, ResponseBuilder &res) {
          res.send(counter->count.load(std::memory_order_relaxed));
        });
      })
      .afterStart([](PluginContext &ctx) { ctx.log("collecting"); })
      .build();
}

Plugin MakeGreeterPlugin() {
  return PluginBuilder()
      .name("greeter")
      .version("0.2.0")
      .dependsOn("metrics")
      .config("greeting", "Hello")
      .onRegister([](PluginContext &ctx) {
        std::string greeting(ctx.configValue("greeting").value_or("Hi"));
        ctx.get("/:name", [greeting](HttpRequest &req, ResponseBuilder &res) {
          res.text(greeting + ", " + std::string(req.pathParamValue("name").value_or("")));
        });
        if (ctx.getService<RequestCounter>("metrics:counter") == nullptr) {
          throw std::runtime_error("metrics counter unavailable");
        }
      })
      .beforeStop([](PluginContext &ctx) { ctx.log("bye"); })
      .build();
}

}  // namespace

int main() {
  try {
    Dispatcher dispatcher;
    dispatcher.registerPlugin(MakeMetricsPlugin());

    PluginRegistrationOptions greeterOptions;
    greeterOptions.prefix = "/greet";
    greeterOptions.config["greeting"] = "Bonjour";
    dispatcher.registerPlugin(MakeGreeterPlugin(), std::move(greeterOptions));

    dispatcher.startPlugins();

    MockClient client(dispatcher);
    std::cout << client.get("/greet/alice").body() << '\n';
    std::cout << client.get("/greet/bob").body() << '\n';
    std::cout << "requests so far: " << client.get("/metrics").body() << '\n';

    dispatcher.stopPlugins();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
