#include "tinyweb/resource.hpp"

#include <cstddef>
#include <glaze/glaze.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-error.hpp"
#include "tinyweb/http-method.hpp"
#include "tinyweb/http-request.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/json-serializer.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/string-equal-ignore-case.hpp"
#include "tinyweb/string-trim.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/url-decode.hpp"

namespace tinyweb {

namespace {

constexpr std::string_view kRawBodyKey = "body";

// Media type of a Content-Type value, without its parameters.
std::string_view MediaType(std::string_view contentType) {
  return TrimOws(contentType.substr(0, contentType.find(';')));
}

}  // namespace

std::size_t ResourceEntry::SlotOf(http::Method method) noexcept {
  switch (method) {
    case http::Method::GET:
      return 0;
    case http::Method::POST:
      return 1;
    case http::Method::PUT:
      return 2;
    default:
      return 3;
  }
}

void ResourceEntry::set(http::Method method, ResourceCapability capability) {
  if (!http::IsMethodSet(kResourceMethods, method)) {
    throw std::invalid_argument("Resources only serve GET, POST, PUT and DELETE");
  }
  _capabilities[SlotOf(method)] = std::move(capability);
  _methods = _methods | method;
}

const ResourceCapability* ResourceEntry::capability(http::Method method) const noexcept {
  if (!http::IsMethodSet(_methods, method)) {
    return nullptr;
  }
  return &_capabilities[SlotOf(method)];
}

glz::json_t BuildResourceData(const HttpRequest& request) {
  glz::json_t data = glz::json_t::object_t{};
  auto& fields = data.get_object();
  for (auto& [name, value] : request.queryParams()) {
    fields.insert_or_assign(std::move(name), glz::json_t(std::move(value)));
  }

  const std::string_view body = request.body();
  if (body.empty()) {
    return data;
  }
  const std::string_view mediaType = MediaType(request.header(http::ContentType).value_or(""));
  if (CaseInsensitiveEqual(mediaType, http::ContentTypeApplicationJson)) {
    auto parsed = ParseJson(std::string(body));
    if (!parsed) {
      throw HttpError(ErrorKind::BadRequest, "Invalid JSON body: " + parsed.error());
    }
    if (parsed->is_object()) {
      for (auto& [name, value] : parsed->get_object()) {
        fields.insert_or_assign(name, std::move(value));
      }
    } else {
      fields.insert_or_assign(std::string(kRawBodyKey), std::move(*parsed));
    }
  } else if (CaseInsensitiveEqual(mediaType, http::ContentTypeFormUrlEncoded)) {
    for (auto& [name, value] : ParseQueryString(body)) {
      fields.insert_or_assign(std::move(name), glz::json_t(std::move(value)));
    }
  } else {
    fields.insert_or_assign(std::string(kRawBodyKey), glz::json_t(std::string(body)));
  }
  return data;
}

Task<void> DispatchResource(const ResourceEntry& entry, const HttpRequest& request, HttpResponse& response) {
  const ResourceCapability* capability = entry.capability(request.method());
  if (capability == nullptr) {
    log::debug("Resource at {} does not implement {}", request.path(), http::MethodToStr(request.method()));
    co_await response.error(http::StatusCodeMethodNotAllowed);
    co_return;
  }

  const glz::json_t data = BuildResourceData(request);
  ResourceReply reply = (*capability)(data, request.pathParams());

  auto json = SerializeToJson(reply.value);
  if (!json) {
    log::error("Failed to serialize reply of {} {}: {}", http::MethodToStr(request.method()), request.path(),
               json.error());
    co_await response.error(http::StatusCodeInternalServerError, json.error());
    co_return;
  }

  response.setStatus(reply.status)
      .setVersion(http::HTTP11)
      .setHeader(http::ContentLength, std::to_string(json->size()))
      .setHeader(http::Connection, http::close)
      .addAccessControlHeaders();
  co_await response.start(http::ContentTypeApplicationJson);
  co_await response.send(*json);
  response.markDone();
}

}  // namespace tinyweb
