#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include <routekit/routekit.hpp>

using namespace routekit;

// Dispatches each target given on the command line (default: a few sample ones) through an in-process client and
// prints the responses.
int main(int argc, char **argv) {
  try {
    Dispatcher dispatcher;

    dispatcher.use(MakeErrorHandlerMiddleware());
    dispatcher.use([](HttpRequest &req, const Next &next) {
      HttpResponse resp = next();
      resp.header("X-Path", req.path());
      return resp;
    });

    dispatcher.get("/", [](HttpRequest &, ResponseBuilder &res) { res.text("Hello from routekit!\n"); });
    dispatcher.get("/hello/:name", [](HttpRequest &req, ResponseBuilder &res) {
      std::string body("Hello ");
      body.append(req.pathParamValue("name").value_or("stranger"));
      body.push_back('\n');
      res.text(body);
    });
    dispatcher.get("/teapot", [](HttpRequest &, ResponseBuilder &) { throw HttpError(418, "I'm a teapot"); });

    dispatcher.logRoutes();

    MockClient client(dispatcher);
    auto print = [&client](std::string_view target) {
      HttpResponse resp = client.get(target);
      std::cout << "GET " << target << " -> " << resp.status() << ' ' << resp.reason() << '\n';
      for (const auto &[name, value] : resp.headers()) {
        std::cout << "  " << name << ": " << value << '\n';
      }
      std::cout << resp.body() << "\n\n";
    };

    if (argc > 1) {
      for (int argPos = 1; argPos < argc; ++argPos) {
        print(argv[argPos]);
      }
    } else {
      print("/");
      print("/hello/world%21");
      print("/teapot");
      print("/missing");
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
