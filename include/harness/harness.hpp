#pragma once

// Core types
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/message.hpp"
#include "core/runtime.hpp"
#include "core/transcript.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"
#include "core/version.hpp"

// Logging
#include "log/log.h"

// Event bus
#include "bus/bus.hpp"

// Child processes
#include "process/process_session.hpp"
#include "transport/stdio_transport.hpp"

// Server sessions
#include "scope/resource_guard.hpp"
#include "server/protocol_server.hpp"
#include "server/server_session.hpp"

// Model backends
#include "llm/backend.hpp"
#include "llm/scripted_backend.hpp"

// Tool system
#include "tool/tool.hpp"

// Agent loop
#include "agent/agent.hpp"
#include "agent/orchestrator.hpp"
