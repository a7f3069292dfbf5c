#include "tinyweb/router.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "tinyweb/http-method.hpp"
#include "tinyweb/http-request.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/resource.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

namespace {

Task<void> NoopHandler(const HttpRequest& /*request*/, HttpResponse& /*response*/) { co_return; }

struct ReadOnlyResource {
  glz::json_t get(const glz::json_t& /*data*/) { return glz::json_t{{"ok", true}}; }
};

}  // namespace

TEST(Router, StaticRouteMatchesExactPath) {
  Router router;
  router.addRoute("/", NoopHandler);
  router.addRoute("/index.html", NoopHandler);

  auto match = router.match(http::Method::GET, "/index.html");
  EXPECT_EQ(match.status, RouteMatch::Status::Matched);
  ASSERT_NE(match.route, nullptr);
  EXPECT_EQ(match.route->pattern, "/index.html");

  match = router.match(http::Method::GET, "/");
  EXPECT_EQ(match.status, RouteMatch::Status::Matched);
  EXPECT_EQ(match.route->pattern, "/");
}

TEST(Router, UnknownPathIsNotFound) {
  Router router;
  router.addRoute("/index.html", NoopHandler);
  EXPECT_EQ(router.match(http::Method::GET, "/index.htm").status, RouteMatch::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/index.html/").status, RouteMatch::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/").status, RouteMatch::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "").status, RouteMatch::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "index.html").status, RouteMatch::Status::NotFound);
}

TEST(Router, LiteralsAreCaseSensitive) {
  Router router;
  router.addRoute("/Status", NoopHandler);
  EXPECT_EQ(router.match(http::Method::GET, "/status").status, RouteMatch::Status::NotFound);
}

TEST(Router, DisallowedMethodIsMethodNotAllowedNeverNotFound) {
  Router router;
  router.addRoute("/form", NoopHandler, RouteConfig{}.withMethods(http::Method::GET | http::Method::POST));
  EXPECT_EQ(router.match(http::Method::POST, "/form").status, RouteMatch::Status::Matched);
  const auto match = router.match(http::Method::PUT, "/form");
  EXPECT_EQ(match.status, RouteMatch::Status::MethodNotAllowed);
  EXPECT_NE(match.route, nullptr);
}

TEST(Router, MethodNotAllowedDoesNotFallThroughToLaterRoute) {
  Router router;
  router.addRoute("/items/<id>", NoopHandler);
  router.addRoute("/items/all", NoopHandler, RouteConfig{}.withMethod(http::Method::DELETE));
  EXPECT_EQ(router.match(http::Method::DELETE, "/items/all").status, RouteMatch::Status::MethodNotAllowed);
}

TEST(Router, FirstRegisteredMatchWins) {
  Router router;
  router.addRoute("/user/<name>", NoopHandler);
  router.addRoute("/user/admin", NoopHandler);
  const auto match = router.match(http::Method::GET, "/user/admin");
  ASSERT_EQ(match.status, RouteMatch::Status::Matched);
  EXPECT_EQ(match.route->pattern, "/user/<name>");
  EXPECT_EQ(match.pathParams.get("name"), "admin");
}

TEST(Router, ParametersBindSegmentsVerbatim) {
  Router router;
  router.addRoute("/images/<fn>", NoopHandler);
  router.addRoute("/user/<id>/photos/<photo>", NoopHandler);

  auto match = router.match(http::Method::GET, "/images/cat.png");
  ASSERT_EQ(match.status, RouteMatch::Status::Matched);
  EXPECT_EQ(match.pathParams.size(), 1U);
  EXPECT_EQ(match.pathParams.get("fn"), "cat.png");

  match = router.match(http::Method::GET, "/user/42/photos/a%20b");
  ASSERT_EQ(match.status, RouteMatch::Status::Matched);
  EXPECT_EQ(match.pathParams.get("id"), "42");
  EXPECT_EQ(match.pathParams.get("photo"), "a%20b");
  EXPECT_EQ(match.pathParams.get("fn"), std::nullopt);
}

TEST(Router, ParameterRequiresNonEmptySegment) {
  Router router;
  router.addRoute("/images/<fn>", NoopHandler);
  EXPECT_EQ(router.match(http::Method::GET, "/images/").status, RouteMatch::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/images").status, RouteMatch::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/images/a/b").status, RouteMatch::Status::NotFound);
}

TEST(Router, OptionsOnMatchedRouteIsPreflight) {
  Router router;
  router.addRoute("/api", NoopHandler, RouteConfig{}.withMethods(http::Method::GET | http::Method::POST));
  router.addRoute("/custom", NoopHandler, RouteConfig{}.withMethod(http::Method::OPTIONS));
  EXPECT_EQ(router.match(http::Method::OPTIONS, "/api").status, RouteMatch::Status::Preflight);
  EXPECT_EQ(router.match(http::Method::OPTIONS, "/custom").status, RouteMatch::Status::Matched);
  EXPECT_EQ(router.match(http::Method::OPTIONS, "/nowhere").status, RouteMatch::Status::NotFound);
}

TEST(Router, InvalidPatternsAreRejected) {
  Router router;
  EXPECT_THROW(router.addRoute("", NoopHandler), std::invalid_argument);
  EXPECT_THROW(router.addRoute("index.html", NoopHandler), std::invalid_argument);
  EXPECT_THROW(router.addRoute("/search?q=1", NoopHandler), std::invalid_argument);
  EXPECT_THROW(router.addRoute("/images/<fn", NoopHandler), std::invalid_argument);
  EXPECT_THROW(router.addRoute("/images/fn>", NoopHandler), std::invalid_argument);
  EXPECT_THROW(router.addRoute("/images/<>", NoopHandler), std::invalid_argument);
  EXPECT_THROW(router.addRoute("/ok", RequestHandler{}), std::invalid_argument);
  EXPECT_THROW(router.addRoute("/ok", NoopHandler, RouteConfig{}.withMethods(0)), std::invalid_argument);
  EXPECT_TRUE(router.routes().empty());
}

TEST(Router, DuplicatePatternIsRejected) {
  Router router;
  router.addRoute("/a", NoopHandler);
  EXPECT_THROW(router.addRoute("/a", NoopHandler, RouteConfig{}.withMethod(http::Method::POST)),
               std::invalid_argument);
  EXPECT_EQ(router.routes().size(), 1U);
}

TEST(Router, RegistrationAfterFreezeIsALogicError) {
  Router router;
  router.addRoute("/a", NoopHandler);
  router.freeze();
  EXPECT_THROW(router.addRoute("/b", NoopHandler), std::logic_error);
  EXPECT_THROW(router.addResource("/c", MakeResourceEntry(std::make_shared<ReadOnlyResource>())), std::logic_error);
}

TEST(Router, ResourceRouteAcceptsTheResourceMethods) {
  Router router;
  router.addResource("/user/<id>", MakeResourceEntry(std::make_shared<ReadOnlyResource>()));

  // DELETE reaches the resource dispatcher, which answers 405 as the capability is missing
  const auto match = router.match(http::Method::DELETE, "/user/5");
  ASSERT_EQ(match.status, RouteMatch::Status::Matched);
  EXPECT_TRUE(match.route->isResource());
  EXPECT_EQ(match.route->resource.methods(), static_cast<http::MethodBmp>(http::Method::GET));
  EXPECT_TRUE(match.route->config.isHeaderSaved("content-length"));
  EXPECT_TRUE(match.route->config.isHeaderSaved("Content-Type"));

  EXPECT_EQ(router.match(http::Method::PATCH, "/user/5").status, RouteMatch::Status::MethodNotAllowed);
  EXPECT_EQ(router.match(http::Method::OPTIONS, "/user/5").status, RouteMatch::Status::MethodNotAllowed);
}

}  // namespace tinyweb
