#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <tinyweb/tinyweb.hpp>

using namespace tinyweb;

int main(int argc, char **argv) {
  uint16_t port = 8081;
  std::filesystem::path root = ".";
  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }
  if (argc > 2) {
    root = argv[2];
  }

  SignalHandler::Enable();
  log::set_level(log::level::info);

  try {
    HttpServer server(HttpServerConfig{}.withPort(port).withMaxConcurrency(4));

    // Serves <root>/<filename>, with the content type detected from the extension.
    server.addRoute("/files/<filename>", [root](const HttpRequest &req, HttpResponse &resp) -> Task<void> {
      const std::string filename(req.pathParam("filename").value_or(""));
      if (filename.empty() || filename.starts_with('.')) {
        co_await resp.error(http::StatusCodeNotFound);
        co_return;
      }
      co_await resp.sendFile((root / filename).string());
    });
    server.addRoute("/", [](const HttpRequest & /*req*/, HttpResponse &resp) -> Task<void> {
      co_await resp.redirect("/files/index.html");
    });

    std::cout << "Starting static file example on port: " << server.port() << " serving root: " << root << '\n';
    server.run();
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
