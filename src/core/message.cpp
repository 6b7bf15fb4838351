#include "core/message.hpp"

namespace tether {

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "assistant") return Role::Assistant;
  return Role::User;
}

StoredMessage StoredMessage::user(const json &content) {
  return StoredMessage{Role::User, content, now_millis(), 0};
}

StoredMessage StoredMessage::assistant(const json &content) {
  return StoredMessage{Role::Assistant, content, now_millis(), 0};
}

json StoredMessage::to_json() const {
  return {{"role", to_string(role)}, {"content", content}, {"timestamp", timestamp}, {"sequence", sequence}};
}

StoredMessage StoredMessage::from_json(const json &j) {
  StoredMessage msg;
  msg.role = role_from_string(j.value("role", "user"));
  if (j.contains("content")) {
    msg.content = j["content"];
  }
  msg.timestamp = j.value("timestamp", int64_t(0));
  msg.sequence = j.value("sequence", uint64_t(0));
  return msg;
}

}  // namespace tether
