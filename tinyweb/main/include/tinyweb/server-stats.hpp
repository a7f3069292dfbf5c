#pragma once

#include <cstdint>
#include <string>

namespace tinyweb {

// Snapshot of the counters of an HttpServer.
struct ServerStats {
  uint64_t connectionsAccepted{0};
  // Exchanges that ended with a complete response, errors included.
  uint64_t requestsServed{0};
  // Connections closed because the request was not received in time.
  uint64_t timeouts{0};
  // Requests rejected by the parser or the router (400, 404, 405, 413, 431).
  uint64_t parseFailures{0};
  // Handlers that failed with an exception.
  uint64_t handlerFailures{0};
  uint32_t activeConnections{0};
  uint32_t maxActiveObserved{0};

  // Stats as a flat JSON object.
  [[nodiscard]] std::string json_str() const;
};

}  // namespace tinyweb
