#pragma once

#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"
#include "permission/permission_gate.hpp"

namespace tether::protocol {

// One event addressed to a client connection
struct OutboundEvent {
  std::string type;
  SessionId session_id;
  json payload = json::object();

  // {"type": ..., "sessionId": ..., <payload fields>}
  json to_json() const;
};

// Outbound event builders
namespace events {

OutboundEvent session_ready(const SessionId &id, PermissionMode mode);

// Live or replayed history entry
OutboundEvent message(const SessionId &id, const StoredMessage &msg, bool replay = false, bool programmatic = false);

// Raw user-role message from the agent runtime (replayed by the runtime itself)
OutboundEvent agent_history(const SessionId &id, const json &message);

OutboundEvent permission_request(const SessionId &id, const permission::PendingRequest &request);
OutboundEvent thinking(const SessionId &id, bool thinking);
OutboundEvent tool_result(const SessionId &id, const ToolUseId &invocation_id, const json &result);
OutboundEvent slash_commands(const SessionId &id, const std::vector<std::string> &commands);
OutboundEvent allowed_tools(const SessionId &id, const std::vector<std::string> &tools);
OutboundEvent global_allowed_tools(const std::vector<std::string> &tools);
OutboundEvent result(const SessionId &id, const ContextUsage &usage, bool replay = false);
OutboundEvent error(const SessionId &id, const std::string &message);

}  // namespace events

}  // namespace tether::protocol
