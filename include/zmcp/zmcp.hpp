#pragma once

/// Umbrella header for the zmcp tool server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "context.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include "metrics.hpp"
#include "codec.hpp"
#include "session.hpp"
#include "router.hpp"
#include "server.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
