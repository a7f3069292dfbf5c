#include "tinyweb/server-stats.hpp"

#include <fmt/format.h>

#include <string>

namespace tinyweb {

std::string ServerStats::json_str() const {
  return fmt::format(
      R"({{"connectionsAccepted":{},"requestsServed":{},"timeouts":{},"parseFailures":{},"handlerFailures":{},)"
      R"("activeConnections":{},"maxActiveObserved":{}}})",
      connectionsAccepted, requestsServed, timeouts, parseFailures, handlerFailures, activeConnections,
      maxActiveObserved);
}

}  // namespace tinyweb
