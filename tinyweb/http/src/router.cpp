#include "tinyweb/router.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-method.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/path-params.hpp"
#include "tinyweb/resource.hpp"
#include "tinyweb/route-config.hpp"

namespace tinyweb {

namespace {

// Calls fn on each segment of path after its leading '/'. "/" has a single empty segment.
template <class Fn>
void ForEachSegment(std::string_view path, Fn&& fn) {
  path.remove_prefix(1);
  while (true) {
    const auto slashPos = path.find('/');
    fn(path.substr(0, slashPos));
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }
}

std::vector<Route::Segment> ParsePattern(std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument("Route pattern should start with '/'");
  }
  if (pattern.find('?') != std::string_view::npos) {
    throw std::invalid_argument("Route pattern should not contain a query string");
  }
  std::vector<Route::Segment> segments;
  ForEachSegment(pattern, [&segments](std::string_view segment) {
    const bool opensParam = segment.starts_with('<');
    const bool closesParam = segment.ends_with('>');
    if (opensParam || closesParam) {
      if (!opensParam || !closesParam || segment.size() <= 2) {
        throw std::invalid_argument("Malformed route parameter segment");
      }
      std::string_view name = segment.substr(1, segment.size() - 2);
      if (name.find_first_of("<>") != std::string_view::npos) {
        throw std::invalid_argument("Malformed route parameter segment");
      }
      segments.push_back(Route::Segment{std::string(name), true});
    } else {
      segments.push_back(Route::Segment{std::string(segment), false});
    }
  });
  return segments;
}

bool MatchSegments(const Route& route, std::string_view path, PathParams& pathParams) {
  auto segIt = route.segments.begin();
  bool matched = true;
  ForEachSegment(path, [&](std::string_view segment) {
    if (!matched) {
      return;
    }
    if (segIt == route.segments.end()) {
      matched = false;
      return;
    }
    if (segIt->isParam) {
      if (segment.empty()) {
        matched = false;
        return;
      }
      pathParams.add(segIt->value, segment);
    } else if (segIt->value != segment) {
      matched = false;
      return;
    }
    ++segIt;
  });
  return matched && segIt == route.segments.end();
}

}  // namespace

Route& Router::emplaceRoute(std::string_view pattern, RouteConfig config) {
  if (_frozen) {
    throw std::logic_error("Cannot register routes once the server started serving");
  }
  if (std::ranges::any_of(_routes, [pattern](const Route& route) { return route.pattern == pattern; })) {
    throw std::invalid_argument("Duplicate route pattern");
  }
  auto segments = ParsePattern(pattern);
  config.validate();
  Route& route = _routes.emplace_back();
  route.segments = std::move(segments);
  route.pattern = pattern;
  route.config = std::move(config);
  return route;
}

Router& Router::addRoute(std::string_view pattern, RequestHandler handler, RouteConfig config) {
  if (!handler) {
    throw std::invalid_argument("Empty route handler");
  }
  Route& route = emplaceRoute(pattern, std::move(config));
  route.handler = std::move(handler);
  log::debug("Registered route {} [{}]", route.pattern, http::MethodBmpToStr(route.config.methods));
  return *this;
}

Router& Router::addResource(std::string_view pattern, ResourceEntry resource, RouteConfig config) {
  if (resource.empty()) {
    throw std::invalid_argument("Resource without any capability");
  }
  config.withMethods(ResourceEntry::kResourceMethods);
  config.addSaveHeader(http::ContentLength);
  config.addSaveHeader(http::ContentType);
  Route& route = emplaceRoute(pattern, std::move(config));
  route.resource = std::move(resource);
  log::debug("Registered resource {} [{}]", route.pattern, http::MethodBmpToStr(route.resource.methods()));
  return *this;
}

RouteMatch Router::match(http::Method method, std::string_view path) const {
  RouteMatch ret;
  if (path.empty() || path.front() != '/') {
    return ret;
  }
  for (const Route& route : _routes) {
    if (!MatchSegments(route, path, ret.pathParams)) {
      ret.pathParams.clear();
      continue;
    }
    ret.route = &route;
    if (http::IsMethodSet(route.config.methods, method)) {
      ret.status = RouteMatch::Status::Matched;
    } else if (method == http::Method::OPTIONS && !route.isResource()) {
      ret.status = RouteMatch::Status::Preflight;
    } else {
      ret.status = RouteMatch::Status::MethodNotAllowed;
    }
    return ret;
  }
  return ret;
}

}  // namespace tinyweb
