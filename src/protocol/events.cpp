#include "protocol/events.hpp"

namespace tether::protocol {

json OutboundEvent::to_json() const {
  json j = payload.is_object() ? payload : json::object();
  j["type"] = type;
  if (!session_id.empty()) {
    j["sessionId"] = session_id;
  }
  return j;
}

namespace events {

OutboundEvent session_ready(const SessionId &id, PermissionMode mode) {
  return {"session_ready", id, {{"permissionMode", to_string(mode)}}};
}

OutboundEvent message(const SessionId &id, const StoredMessage &msg, bool replay, bool programmatic) {
  json payload = {{"role", to_string(msg.role)}, {"content", msg.content}, {"sequence", msg.sequence}};
  if (replay) {
    payload["replay"] = true;
  }
  if (programmatic) {
    payload["programmatic"] = true;
  }
  return {"message", id, payload};
}

OutboundEvent agent_history(const SessionId &id, const json &message) {
  auto role = message.contains("role") && message["role"].is_string() ? message["role"].get<std::string>() : std::string("user");
  return {"message", id, {{"role", role}, {"content", message.contains("content") ? message["content"] : json()}, {"replay", true}}};
}

OutboundEvent permission_request(const SessionId &id, const permission::PendingRequest &request) {
  return {"permission_request", id, {{"invocationId", request.invocation_id}, {"toolName", request.tool_name}, {"input", request.input}}};
}

OutboundEvent thinking(const SessionId &id, bool thinking) {
  return {"thinking", id, {{"thinking", thinking}}};
}

OutboundEvent tool_result(const SessionId &id, const ToolUseId &invocation_id, const json &result) {
  return {"tool_result", id, {{"invocationId", invocation_id}, {"result", result}}};
}

OutboundEvent slash_commands(const SessionId &id, const std::vector<std::string> &commands) {
  return {"slash_commands", id, {{"commands", commands}}};
}

OutboundEvent allowed_tools(const SessionId &id, const std::vector<std::string> &tools) {
  return {"allowed_tools", id, {{"tools", tools}}};
}

OutboundEvent global_allowed_tools(const std::vector<std::string> &tools) {
  return {"global_allowed_tools", "", {{"tools", tools}}};
}

OutboundEvent result(const SessionId &id, const ContextUsage &usage, bool replay) {
  json payload = usage.to_json();
  if (replay) {
    payload["replay"] = true;
  }
  return {"result", id, payload};
}

OutboundEvent error(const SessionId &id, const std::string &message) {
  return {"error", id, {{"message", message}}};
}

}  // namespace events

}  // namespace tether::protocol
