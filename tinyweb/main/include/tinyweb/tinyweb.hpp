#pragma once

// IWYU pragma: begin_exports
#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-error.hpp"
#include "tinyweb/http-method.hpp"
#include "tinyweb/http-request.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/http-server-config.hpp"
#include "tinyweb/http-server.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/path-params.hpp"
#include "tinyweb/resource.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/signal-handler.hpp"
#include "tinyweb/task.hpp"
// IWYU pragma: end_exports
