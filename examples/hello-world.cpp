#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <tinyweb/tinyweb.hpp>

using namespace tinyweb;

namespace {

Task<void> Hello(const HttpRequest &req, HttpResponse &resp) {
  co_await resp.startHtml();
  co_await resp.send("<h1>Hello from tinyweb!</h1><p>You requested ");
  co_await resp.send(req.path());
  co_await resp.send("</p>");
}

Task<void> Greet(const HttpRequest &req, HttpResponse &resp) {
  co_await resp.start(http::ContentTypeTextPlain);
  co_await resp.send("Hello ");
  co_await resp.send(req.pathParam("name").value_or("stranger"));
  co_await resp.send(", your user agent is ");
  co_await resp.send(req.header("User-Agent").value_or("unknown"));
  co_await resp.send("\n");
}

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 8081;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();
  log::set_level(log::level::info);

  try {
    HttpServer server(HttpServerConfig{}.withPort(port));
    server.addRoute("/", Hello)
        .addRoute("/index.html", Hello)
        .addRoute("/hello/<name>", Greet, RouteConfig{}.withSaveHeaders({"User-Agent"}));
    server.run();  // blocking run, until Ctrl+C
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
