#include "core/session_store.hpp"

namespace tether {

json SessionRecord::to_json() const {
  json j;
  j["id"] = id;
  j["name"] = name;
  j["working_dir"] = working_dir;
  j["permission_mode"] = to_string(permission_mode);
  if (agent_conversation_id) {
    j["agent_conversation_id"] = *agent_conversation_id;
  }
  if (context_usage) {
    j["context_usage"] = context_usage->to_json();
  }
  j["allowed_tools"] = allowed_tools;
  j["pending_messages"] = pending_messages;
  j["status"] = status;
  if (forked_from) {
    j["forked_from"] = *forked_from;
  }
  j["created_at"] = timestamp_to_epoch(created_at);
  j["updated_at"] = timestamp_to_epoch(updated_at);
  return j;
}

SessionRecord SessionRecord::from_json(const json &j) {
  SessionRecord record;
  record.id = j.value("id", "");
  record.name = j.value("name", "");
  record.working_dir = j.value("working_dir", "");
  record.permission_mode = permission_mode_from_string(j.value("permission_mode", "default")).value_or(PermissionMode::Default);
  if (j.contains("agent_conversation_id")) {
    record.agent_conversation_id = j["agent_conversation_id"].get<std::string>();
  }
  if (j.contains("context_usage")) {
    record.context_usage = ContextUsage::from_json(j["context_usage"]);
  }
  if (j.contains("allowed_tools")) {
    record.allowed_tools = j["allowed_tools"].get<std::vector<std::string>>();
  }
  if (j.contains("pending_messages")) {
    record.pending_messages = j["pending_messages"].get<std::vector<std::string>>();
  }
  record.status = j.value("status", "idle");
  if (j.contains("forked_from")) {
    record.forked_from = j["forked_from"].get<std::string>();
  }
  record.created_at = epoch_to_timestamp(j.value("created_at", int64_t(0)));
  record.updated_at = epoch_to_timestamp(j.value("updated_at", int64_t(0)));
  return record;
}

json GlobalSettings::to_json() const {
  return {{"allowed_tools", allowed_tools}};
}

GlobalSettings GlobalSettings::from_json(const json &j) {
  GlobalSettings settings;
  if (j.contains("allowed_tools")) {
    settings.allowed_tools = j["allowed_tools"].get<std::vector<std::string>>();
  }
  return settings;
}

}  // namespace tether
