#pragma once

// Core types
#include "core/config.hpp"
#include "core/json_store.hpp"
#include "core/message.hpp"
#include "core/session_store.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Permission gating
#include "permission/allowlist.hpp"
#include "permission/global_allowlist.hpp"
#include "permission/permission_gate.hpp"

// Agent runtime
#include "agent/agent_event.hpp"
#include "agent/agent_service.hpp"
#include "agent/claude_cli.hpp"

// Sessions and wire protocol
#include "net/transport.hpp"
#include "net/transport_server.hpp"
#include "protocol/dispatcher.hpp"
#include "protocol/events.hpp"
#include "session/orchestrator.hpp"

namespace tether {

// Initialize logging from config
void init(const Config& config);

// Flush logs
void shutdown();

// Get version string
std::string version();

}  // namespace tether
