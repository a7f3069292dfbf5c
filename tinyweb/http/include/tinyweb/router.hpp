#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "tinyweb/http-method.hpp"
#include "tinyweb/http-request.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/path-params.hpp"
#include "tinyweb/resource.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

using RequestHandler = std::function<Task<void>(const HttpRequest&, HttpResponse&)>;

// A registered pattern with its handler (or resource) and its configuration. Immutable once registered.
struct Route {
  struct Segment {
    std::string value;  // literal text, or parameter name
    bool isParam{false};
  };

  [[nodiscard]] bool isResource() const noexcept { return !resource.empty(); }

  std::string pattern;
  std::vector<Segment> segments;
  RouteConfig config;
  RequestHandler handler;
  ResourceEntry resource;
};

struct RouteMatch {
  enum class Status : uint8_t {
    Matched,           // path and method match
    NotFound,          // no pattern matches the path
    MethodNotAllowed,  // first matching pattern does not accept the method
    Preflight          // OPTIONS on a matching plain route that does not accept it explicitly
  };

  Status status{Status::NotFound};
  const Route* route{nullptr};
  PathParams pathParams;
};

// Append-only table of routes, resolved in registration order.
// Patterns are made of '/' separated segments, each being a literal or a named parameter like '<name>'.
class Router {
 public:
  // Throws std::invalid_argument for an invalid or duplicated pattern, std::logic_error once frozen.
  Router& addRoute(std::string_view pattern, RequestHandler handler, RouteConfig config = {});

  // Registers a resource. Its route accepts GET, POST, PUT and DELETE and retains Content-Length and Content-Type.
  Router& addResource(std::string_view pattern, ResourceEntry resource, RouteConfig config = {});

  // Forbids further registrations. Route addresses are stable from now on.
  void freeze() noexcept { _frozen = true; }

  [[nodiscard]] bool frozen() const noexcept { return _frozen; }

  // The first route whose pattern matches path decides the outcome.
  [[nodiscard]] RouteMatch match(http::Method method, std::string_view path) const;

  [[nodiscard]] const std::vector<Route>& routes() const noexcept { return _routes; }

 private:
  Route& emplaceRoute(std::string_view pattern, RouteConfig config);

  std::vector<Route> _routes;
  bool _frozen{false};
};

}  // namespace tinyweb
