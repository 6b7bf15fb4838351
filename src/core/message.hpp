#pragma once

#include <string>

#include "core/types.hpp"

namespace tether {

enum class Role {
  User,
  Assistant
};

std::string to_string(Role role);

Role role_from_string(const std::string &str);

// One entry of a session's conversation history.
// `content` is kept opaque: a plain string for user turns, the agent's content blocks otherwise.
struct StoredMessage {
  Role role = Role::User;
  json content;
  int64_t timestamp = 0;  // ms since epoch
  uint64_t sequence = 0;  // absolute position in the persisted history

  static StoredMessage user(const json &content);
  static StoredMessage assistant(const json &content);

  json to_json() const;
  static StoredMessage from_json(const json &j);
};

}  // namespace tether
