#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <glaze/glaze.hpp>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-error.hpp"
#include "tinyweb/http-server-config.hpp"
#include "tinyweb/http-server.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/json-serializer.hpp"
#include "tinyweb/path-params.hpp"
#include "tinyweb/resource.hpp"
#include "tinyweb/test_server_fixture.hpp"
#include "tinyweb/test_util.hpp"

namespace tinyweb {

namespace {

// In-memory collection of users, only accessed from the serving thread.
struct Users {
  glz::json_t get(const glz::json_t& data, const PathParams& params) {
    ++calls;
    const auto id = params.get("id");
    if (!id) {
      glz::json_t list = glz::json_t::object_t{};
      for (const auto& [key, name] : users) {
        list[key] = name;
      }
      if (data.is_object() && data.get_object().contains("greeting")) {
        list["greeting"] = data.get_object().at("greeting");
      }
      return list;
    }
    const auto it = users.find(std::string(*id));
    if (it == users.end()) {
      throw HttpError(http::StatusCodeNotFound, "unknown user");
    }
    return glz::json_t{{"id", it->first}, {"name", it->second}};
  }

  ResourceReply post(const glz::json_t& data) {
    ++calls;
    if (!data.is_object() || !data.get_object().contains("name")) {
      return {glz::json_t{{"error", std::string("name is required")}}, http::StatusCodeBadRequest};
    }
    const std::string id = std::to_string(++lastId);
    users[id] = data.get_object().at("name").get<std::string>();
    return {glz::json_t{{"id", id}}, http::StatusCodeCreated};
  }

  std::map<std::string, std::string> users{{"1", "alice"}};
  int64_t lastId{1};
  std::atomic<int> calls{0};
};

std::shared_ptr<Users> gUsers = std::make_shared<Users>();

test::TestServer ts(HttpServerConfig{}, [](HttpServer& server) {
  server.addResource("/users", gUsers).addResource("/users/<id>", gUsers);
});

glz::json_t JsonBody(const std::string& body) {
  auto json = ParseJson(body);
  if (!json) {
    throw std::runtime_error(json.error());
  }
  return std::move(*json);
}

}  // namespace

TEST(HttpResource, GetWithPathParameter) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/users/1"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.version, "HTTP/1.1");
  EXPECT_EQ(resp.header(http::ContentType), http::ContentTypeApplicationJson);
  EXPECT_EQ(resp.header(http::Connection), http::close);
  EXPECT_EQ(resp.header(http::ContentLength), std::to_string(resp.body.size()));
  EXPECT_EQ(resp.header(http::AccessControlAllowOrigin), "*");
  EXPECT_EQ(resp.header(http::AccessControlAllowMethods), "GET, POST, PUT, DELETE");

  const auto json = JsonBody(resp.body);
  EXPECT_EQ(json.get_object().at("id").get<std::string>(), "1");
  EXPECT_EQ(json.get_object().at("name").get<std::string>(), "alice");
}

TEST(HttpResource, QueryParametersAreGivenToTheCapability) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/users?greeting=hi%21"));
  ASSERT_EQ(resp.statusCode, http::StatusCodeOK);
  const auto json = JsonBody(resp.body);
  EXPECT_EQ(json.get_object().at("greeting").get<std::string>(), "hi!");
  EXPECT_TRUE(json.get_object().contains("1"));
}

TEST(HttpResource, PostJsonBody) {
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/users";
  opt.headers = {{"Content-Type", "application/json; charset=utf-8"}};
  opt.body = R"({"name":"bob"})";
  auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  ASSERT_EQ(resp.statusCode, http::StatusCodeCreated);
  const std::string id = JsonBody(resp.body).get_object().at("id").get<std::string>();

  resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/users/" + id));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(JsonBody(resp.body).get_object().at("name").get<std::string>(), "bob");
}

TEST(HttpResource, PostFormBody) {
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/users";
  opt.headers = {{"Content-Type", "application/x-www-form-urlencoded"}};
  opt.body = "name=carol+smith";
  const auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeCreated);
}

TEST(HttpResource, ExplicitStatusFromCapability) {
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/users";
  opt.headers = {{"Content-Type", "application/json"}};
  opt.body = R"({"nickname":"dave"})";
  const auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
  EXPECT_EQ(JsonBody(resp.body).get_object().at("error").get<std::string>(), "name is required");
}

TEST(HttpResource, InvalidJsonBodyIsBadRequest) {
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/users";
  opt.headers = {{"Content-Type", "application/json"}};
  opt.body = R"({"name":)";
  const auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
}

TEST(HttpResource, MissingCapabilityIsMethodNotAllowed) {
  test::RequestOptions opt;
  opt.method = "DELETE";
  opt.target = "/users/1";
  const auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(gUsers->users.count("1"), 1U);
}

TEST(HttpResource, MethodOutsideResourceMethodsIsMethodNotAllowed) {
  test::RequestOptions opt;
  opt.method = "PATCH";
  opt.target = "/users/1";
  const auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
}

TEST(HttpResource, OptionsOnResourceIsMethodNotAllowed) {
  const int callsBefore = gUsers->calls.load();
  test::RequestOptions opt;
  opt.method = "OPTIONS";
  opt.target = "/users/5";
  const auto resp = test::parseResponseOrThrow(test::request(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_FALSE(resp.header(http::AccessControlAllowMethods));
  EXPECT_EQ(gUsers->calls.load(), callsBefore);
}

TEST(HttpResource, ErrorThrownByCapabilityIsAnswered) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/users/42"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(resp.body, "HTTP 404 Not Found\r\n");
}

}  // namespace tinyweb
