#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/transport.hpp"

namespace tinyweb {

// Response writer of one exchange.
// Its state only moves forward: NotStarted -> HeadersSent -> BodyStreaming -> Done.
// Status, version and headers can only be modified while NotStarted, otherwise HttpError(InvalidState) is thrown.
class HttpResponse {
 public:
  enum class State : uint8_t { NotStarted, HeadersSent, BodyStreaming, Done };

  static constexpr std::chrono::seconds kDefaultMaxAge{std::chrono::days{30}};

  struct Options {
    // Append diagnostics to the body of error responses.
    bool debug{false};
    std::size_t sendFileChunkSize{512};
  };

  struct SendFileOptions {
    // Detected from the file extension when empty.
    std::string_view contentType;
    // Emitted as Content-Encoding when not empty (for pre-compressed files).
    std::string_view contentEncoding;
    // 0 emits 'Cache-Control: no-cache'.
    std::chrono::seconds maxAge{kDefaultMaxAge};
  };

  using HeaderField = std::pair<std::string, std::string>;

  explicit HttpResponse(ITransport& transport) : HttpResponse(transport, Options{}) {}

  HttpResponse(ITransport& transport, Options options) : _transport(transport), _options(options) {}

  HttpResponse& setStatus(http::StatusCode status);

  // Version emitted in the status line, "1.0" by default.
  HttpResponse& setVersion(std::string_view version);

  // Sets a header, replacing any header with the same name (case-insensitive).
  HttpResponse& setHeader(std::string_view name, std::string_view value);

  // Appends a header, even if another one with the same name exists.
  HttpResponse& addHeader(std::string_view name, std::string_view value);

  // Adds the Access-Control-Allow-{Origin,Methods,Headers} headers of the bound route.
  HttpResponse& addAccessControlHeaders();

  // Associates the configuration of the route serving this exchange.
  void bindRoute(const RouteConfig& routeConfig) noexcept { _routeConfig = &routeConfig; }

  // Emits the status line and the headers. contentType is added as Content-Type unless empty or already set.
  Task<void> start(std::string_view contentType = http::ContentTypeTextHtml);

  Task<void> startHtml() { return start(http::ContentTypeTextHtml); }

  // Writes a body chunk, starting the response with the default content type first if needed.
  Task<void> send(std::string_view data);

  // Streams a file by fixed size chunks. A missing file is answered with a 404 error response.
  // The response is complete afterwards: any further send throws InvalidState.
  Task<void> sendFile(std::string_view path, SendFileOptions options);

  Task<void> sendFile(std::string_view path) { return sendFile(path, SendFileOptions{}); }

  // Emits a 302 redirection to location with an empty body.
  Task<void> redirect(std::string_view location);

  // Emits a complete minimal text/plain error response. diagnostics are only included in debug mode.
  Task<void> error(http::StatusCode status, std::string_view diagnostics = {});

  // Terminal transition, called once the exchange is over.
  void markDone() noexcept { _state = State::Done; }

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool started() const noexcept { return _state != State::NotStarted; }

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;

  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  [[nodiscard]] bool debug() const noexcept { return _options.debug; }

 private:
  void ensureNotStarted(std::string_view operation) const;

  Task<void> write(std::string_view data);

  ITransport& _transport;
  const RouteConfig* _routeConfig{nullptr};
  std::vector<HeaderField> _headers;
  std::string _version{http::HTTP10};
  Options _options;
  http::StatusCode _status{http::StatusCodeOK};
  State _state{State::NotStarted};
};

std::string_view StateToStr(HttpResponse::State state) noexcept;

}  // namespace tinyweb
