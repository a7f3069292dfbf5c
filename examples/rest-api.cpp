#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <glaze/glaze.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <tinyweb/tinyweb.hpp>

using namespace tinyweb;

namespace {

// Key-value notes. GET /notes lists them, POST /notes creates one, GET/PUT/DELETE /notes/<id> work on one note.
class Notes {
 public:
  glz::json_t get(const glz::json_t & /*data*/, const PathParams &params) {
    const auto id = params.get("id");
    if (!id) {
      glz::json_t list = glz::json_t::object_t{};
      for (const auto &[key, text] : _notes) {
        list[key] = text;
      }
      return list;
    }
    return glz::json_t{{"id", std::string(*id)}, {"text", find(*id)}};
  }

  ResourceReply post(const glz::json_t &data) {
    const std::string id = std::to_string(++_lastId);
    _notes[id] = textOf(data);
    return {glz::json_t{{"id", id}}, http::StatusCodeCreated};
  }

  glz::json_t put(const glz::json_t &data, const PathParams &params) {
    const std::string id(params.get("id").value_or(""));
    find(id);
    _notes[id] = textOf(data);
    return glz::json_t{{"id", id}, {"text", _notes[id]}};
  }

  glz::json_t del(const glz::json_t & /*data*/, const PathParams &params) {
    const std::string id(params.get("id").value_or(""));
    find(id);
    _notes.erase(id);
    return glz::json_t{{"deleted", id}};
  }

 private:
  const std::string &find(std::string_view id) const {
    const auto it = _notes.find(id);
    if (it == _notes.end()) {
      throw HttpError(http::StatusCodeNotFound, "unknown note");
    }
    return it->second;
  }

  static std::string textOf(const glz::json_t &data) {
    if (!data.is_object() || !data.get_object().contains("text") || !data.get_object().at("text").is_string()) {
      throw HttpError(http::StatusCodeBadRequest, "a 'text' string is required");
    }
    return data.get_object().at("text").get<std::string>();
  }

  std::map<std::string, std::string, std::less<>> _notes;
  int64_t _lastId{0};
};

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 8081;
  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  SignalHandler::Enable();
  log::set_level(log::level::debug);

  try {
    auto notes = std::make_shared<Notes>();
    HttpServer server(HttpServerConfig{}.withPort(port).withDebug());
    server.addResource("/notes", notes).addResource("/notes/<id>", notes);

    std::cout << "REST example listening on port " << server.port() << '\n';
    server.run();
    std::cout << server.stats().json_str() << '\n';
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
