#pragma once

/// Umbrella header for the mcprt stateless MCP runtime.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "cancellation.hpp"
#include "limiter.hpp"
#include "worker_pool.hpp"
#include "responder.hpp"
#include "context.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "prompt_registry.hpp"
#include "resource_registry.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/event_stream.hpp"
#include "transport/http_transport.hpp"
#include "transport/streamable_http_transport.hpp"
