#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace tether {

// Persisted view of a session
struct SessionRecord {
  SessionId id;
  std::string name;
  std::string working_dir;
  PermissionMode permission_mode = PermissionMode::Default;
  std::optional<std::string> agent_conversation_id;
  std::vector<StoredMessage> messages;
  std::optional<ContextUsage> context_usage;
  std::vector<std::string> allowed_tools;
  std::vector<std::string> pending_messages;
  std::string status = "idle";  // idle | running | stopped
  std::optional<SessionId> forked_from;
  Timestamp created_at = std::chrono::system_clock::now();
  Timestamp updated_at = std::chrono::system_clock::now();

  // Messages are stored separately from the index entry
  json to_json() const;
  static SessionRecord from_json(const json &j);
};

// Partial update: only set fields are written. `append_messages` is appended to the stored history.
struct SessionPatch {
  std::optional<std::string> name;
  std::optional<std::string> working_dir;
  std::optional<PermissionMode> permission_mode;
  std::optional<std::string> agent_conversation_id;
  std::vector<StoredMessage> append_messages;
  std::optional<ContextUsage> context_usage;
  std::optional<std::vector<std::string>> allowed_tools;
  std::optional<std::string> status;
};

struct GlobalSettings {
  std::vector<std::string> allowed_tools;

  json to_json() const;
  static GlobalSettings from_json(const json &j);
};

// Durable mirror of session metadata. Never authoritative for an active session.
// Write methods return false when the write did not reach disk.
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  virtual std::optional<SessionRecord> get_session(const SessionId &id) = 0;
  virtual bool update_session(const SessionId &id, const SessionPatch &patch) = 0;

  virtual GlobalSettings get_global_settings() = 0;
  virtual bool set_global_settings(const GlobalSettings &settings) = 0;

  // Cross-session queue. queue_message fails for an unknown session.
  virtual bool queue_message(const SessionId &id, const std::string &text) = 0;
  // Returns and clears
  virtual std::vector<std::string> get_pending_messages(const SessionId &id) = 0;
};

}  // namespace tether
