#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include "core/session_store.hpp"

namespace tether {

// JSON file-based session store
// Storage layout:
//   base_dir/
//     sessions.json                  — session index (metadata, queue, allow-lists)
//     settings.json                  — global settings
//     {session_id}/
//       messages.json                — full message history for that session
class JsonSessionStore : public SessionStore {
 public:
  explicit JsonSessionStore(const std::filesystem::path &base_dir);

  // SessionStore interface
  std::optional<SessionRecord> get_session(const SessionId &id) override;
  bool update_session(const SessionId &id, const SessionPatch &patch) override;
  GlobalSettings get_global_settings() override;
  bool set_global_settings(const GlobalSettings &settings) override;
  bool queue_message(const SessionId &id, const std::string &text) override;
  std::vector<std::string> get_pending_messages(const SessionId &id) override;

  // Session lifecycle (extra methods beyond SessionStore)
  SessionRecord create_session(const std::string &name, const std::string &working_dir, PermissionMode mode);

  // New session sharing working dir and permission mode, no messages.
  // The source's agent conversation id is kept so the first query can fork from it.
  std::optional<SessionRecord> fork_session(const SessionId &source_id, const std::string &name);

  // Index entries only, without messages
  std::vector<SessionRecord> list_sessions();
  bool remove_session(const SessionId &id);

  // Marks sessions left "running" by a previous process as stopped; returns how many were reset
  size_t reset_running_sessions();

  const std::filesystem::path &base_dir() const {
    return base_dir_;
  }

 private:
  std::filesystem::path base_dir_;
  mutable std::mutex mutex_;

  // Path helpers
  std::filesystem::path session_dir(const SessionId &id) const;
  std::filesystem::path messages_file(const SessionId &id) const;
  std::filesystem::path sessions_index_file() const;
  std::filesystem::path settings_file() const;

  // Atomic write: write to .tmp then rename
  bool atomic_write(const std::filesystem::path &path, const std::string &content);

  // Internal: load/save messages.json for a session
  std::vector<StoredMessage> load_messages(const SessionId &session_id);
  bool save_messages(const SessionId &session_id, const std::vector<StoredMessage> &messages);

  // Internal: load/save sessions.json index
  std::vector<SessionRecord> load_sessions_index();
  bool save_sessions_index(const std::vector<SessionRecord> &sessions);
};

}  // namespace tether
