#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <glaze/glaze.hpp>
#include <memory>
#include <stdexcept>
#include <utility>

#include "tinyweb/http-method.hpp"
#include "tinyweb/http-request.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/path-params.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

// Value returned by a resource capability, serialized as JSON.
struct ResourceReply {
  ResourceReply(glz::json_t val) : value(std::move(val)) {}  // NOLINT(google-explicit-constructor)

  ResourceReply(glz::json_t val, http::StatusCode statusCode) : value(std::move(val)), status(statusCode) {}

  glz::json_t value;
  http::StatusCode status{http::StatusCodeOK};
};

using ResourceCapability = std::function<ResourceReply(const glz::json_t&, const PathParams&)>;

// The capabilities of a resource, indexed by method. Only GET, POST, PUT and DELETE can be served.
class ResourceEntry {
 public:
  static constexpr http::MethodBmp kResourceMethods =
      http::Method::GET | http::Method::POST | http::Method::PUT | http::Method::DELETE;

  ResourceEntry() noexcept = default;

  // Throws std::invalid_argument if method is not one of the resource methods.
  void set(http::Method method, ResourceCapability capability);

  // Returns the capability for method, nullptr if the resource does not implement it.
  [[nodiscard]] const ResourceCapability* capability(http::Method method) const noexcept;

  // Methods implemented by the resource.
  [[nodiscard]] http::MethodBmp methods() const noexcept { return _methods; }

  [[nodiscard]] bool empty() const noexcept { return _methods == 0; }

 private:
  static std::size_t SlotOf(http::Method method) noexcept;

  std::array<ResourceCapability, 4> _capabilities;
  http::MethodBmp _methods{0};
};

namespace detail {

enum class Capability : uint8_t { Get, Post, Put, Del };

template <class R>
concept HasGet = requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.get(data) } -> std::convertible_to<ResourceReply>;
} || requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.get(data, params) } -> std::convertible_to<ResourceReply>;
};

template <class R>
concept HasPost = requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.post(data) } -> std::convertible_to<ResourceReply>;
} || requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.post(data, params) } -> std::convertible_to<ResourceReply>;
};

template <class R>
concept HasPut = requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.put(data) } -> std::convertible_to<ResourceReply>;
} || requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.put(data, params) } -> std::convertible_to<ResourceReply>;
};

template <class R>
concept HasDel = requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.del(data) } -> std::convertible_to<ResourceReply>;
} || requires(R& res, const glz::json_t& data, const PathParams& params) {
  { res.del(data, params) } -> std::convertible_to<ResourceReply>;
};

// Calls the capability with the path parameters when its signature accepts them.
template <Capability kCapability, class R>
ResourceReply Invoke(R& res, const glz::json_t& data, const PathParams& params) {
  if constexpr (kCapability == Capability::Get) {
    if constexpr (requires { res.get(data, params); }) {
      return res.get(data, params);
    } else {
      return res.get(data);
    }
  } else if constexpr (kCapability == Capability::Post) {
    if constexpr (requires { res.post(data, params); }) {
      return res.post(data, params);
    } else {
      return res.post(data);
    }
  } else if constexpr (kCapability == Capability::Put) {
    if constexpr (requires { res.put(data, params); }) {
      return res.put(data, params);
    } else {
      return res.put(data);
    }
  } else {
    if constexpr (requires { res.del(data, params); }) {
      return res.del(data, params);
    } else {
      return res.del(data);
    }
  }
}

template <Capability kCapability, class R>
ResourceCapability Bind(const std::shared_ptr<R>& resource) {
  return [resource](const glz::json_t& data, const PathParams& params) {
    return Invoke<kCapability>(*resource, data, params);
  };
}

}  // namespace detail

// Builds the capability set of any type exposing some of get, post, put and del.
// Each of them takes (const glz::json_t& data) or (const glz::json_t& data, const PathParams& params)
// and returns something convertible to ResourceReply.
template <class R>
ResourceEntry MakeResourceEntry(std::shared_ptr<R> resource) {
  static_assert(detail::HasGet<R> || detail::HasPost<R> || detail::HasPut<R> || detail::HasDel<R>,
                "A resource should implement at least one of get, post, put or del");
  if (!resource) {
    throw std::invalid_argument("Null resource");
  }
  ResourceEntry entry;
  if constexpr (detail::HasGet<R>) {
    entry.set(http::Method::GET, detail::Bind<detail::Capability::Get>(resource));
  }
  if constexpr (detail::HasPost<R>) {
    entry.set(http::Method::POST, detail::Bind<detail::Capability::Post>(resource));
  }
  if constexpr (detail::HasPut<R>) {
    entry.set(http::Method::PUT, detail::Bind<detail::Capability::Put>(resource));
  }
  if constexpr (detail::HasDel<R>) {
    entry.set(http::Method::DELETE, detail::Bind<detail::Capability::Del>(resource));
  }
  return entry;
}

// Builds the data object given to a capability: query parameters, merged with the body according to its type.
// A JSON object body is merged key by key, a form body as strings. Other bodies are stored as a string under "body".
// Throws HttpError(BadRequest) for an invalid JSON body.
glz::json_t BuildResourceData(const HttpRequest& request);

// Serves request with the matching capability of entry, answering 405 if there is none.
// The JSON reply is written with a fixed Content-Length, in a single write.
Task<void> DispatchResource(const ResourceEntry& entry, const HttpRequest& request, HttpResponse& response);

}  // namespace tinyweb
