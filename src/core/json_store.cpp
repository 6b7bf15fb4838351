#include "core/json_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

#include "core/uuid.hpp"

namespace tether {

namespace fs = std::filesystem;

namespace {

std::vector<SessionRecord>::iterator find_record(std::vector<SessionRecord> &sessions, const SessionId &id) {
  return std::find_if(sessions.begin(), sessions.end(), [&id](const SessionRecord &s) {
    return s.id == id;
  });
}

}  // namespace

JsonSessionStore::JsonSessionStore(const fs::path &base_dir) : base_dir_(base_dir) {
  std::error_code ec;
  fs::create_directories(base_dir_, ec);
  if (ec) {
    spdlog::warn("Failed to create sessions directory {}: {}", base_dir_.string(), ec.message());
  }
}

// --- Path helpers ---

fs::path JsonSessionStore::session_dir(const SessionId &id) const {
  return base_dir_ / id;
}

fs::path JsonSessionStore::messages_file(const SessionId &id) const {
  return session_dir(id) / "messages.json";
}

fs::path JsonSessionStore::sessions_index_file() const {
  return base_dir_ / "sessions.json";
}

fs::path JsonSessionStore::settings_file() const {
  return base_dir_ / "settings.json";
}

// --- Atomic write ---

bool JsonSessionStore::atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    spdlog::warn("Failed to open temp file for writing: {}", tmp_path.string());
    return false;
  }

  file << content;
  file.close();

  std::error_code ec;
  if (file.fail()) {
    spdlog::warn("Failed to write temp file: {}", tmp_path.string());
    fs::remove(tmp_path, ec);
    return false;
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    spdlog::warn("Failed to rename temp file {} -> {}: {}", tmp_path.string(), path.string(), ec.message());
    fs::remove(tmp_path, ec);
    return false;
  }
  return true;
}

// --- Internal: messages.json ---

std::vector<StoredMessage> JsonSessionStore::load_messages(const SessionId &session_id) {
  auto path = messages_file(session_id);
  if (!fs::exists(path)) {
    return {};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open messages file: {}", path.string());
    return {};
  }

  try {
    json j = json::parse(file);
    std::vector<StoredMessage> messages;
    for (const auto &msg_json : j) {
      messages.push_back(StoredMessage::from_json(msg_json));
    }
    return messages;
  } catch (const std::exception &e) {
    spdlog::warn("Failed to parse messages file {}: {}", path.string(), e.what());
    return {};
  }
}

bool JsonSessionStore::save_messages(const SessionId &session_id, const std::vector<StoredMessage> &messages) {
  auto dir = session_dir(session_id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    spdlog::warn("Failed to create session directory {}: {}", dir.string(), ec.message());
    return false;
  }

  json j = json::array();
  for (const auto &msg : messages) {
    j.push_back(msg.to_json());
  }

  return atomic_write(messages_file(session_id), j.dump(2));
}

// --- Internal: sessions.json index ---

std::vector<SessionRecord> JsonSessionStore::load_sessions_index() {
  auto path = sessions_index_file();
  if (!fs::exists(path)) {
    return {};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return {};
  }

  try {
    json j = json::parse(file);
    std::vector<SessionRecord> sessions;
    for (const auto &s : j) {
      sessions.push_back(SessionRecord::from_json(s));
    }
    return sessions;
  } catch (const std::exception &e) {
    spdlog::warn("Failed to parse sessions index: {}", e.what());
    return {};
  }
}

bool JsonSessionStore::save_sessions_index(const std::vector<SessionRecord> &sessions) {
  json j = json::array();
  for (const auto &s : sessions) {
    j.push_back(s.to_json());
  }
  return atomic_write(sessions_index_file(), j.dump(2));
}

// --- SessionStore interface ---

std::optional<SessionRecord> JsonSessionStore::get_session(const SessionId &id) {
  std::lock_guard lock(mutex_);

  auto sessions = load_sessions_index();
  auto it = find_record(sessions, id);
  if (it == sessions.end()) {
    return std::nullopt;
  }

  SessionRecord record = *it;
  record.messages = load_messages(id);
  return record;
}

bool JsonSessionStore::update_session(const SessionId &id, const SessionPatch &patch) {
  std::lock_guard lock(mutex_);

  auto sessions = load_sessions_index();
  auto it = find_record(sessions, id);
  if (it == sessions.end()) {
    spdlog::warn("update_session: unknown session {}", id);
    return false;
  }

  bool ok = true;
  if (!patch.append_messages.empty()) {
    auto messages = load_messages(id);
    messages.insert(messages.end(), patch.append_messages.begin(), patch.append_messages.end());
    ok = save_messages(id, messages);
  }

  if (patch.name) it->name = *patch.name;
  if (patch.working_dir) it->working_dir = *patch.working_dir;
  if (patch.permission_mode) it->permission_mode = *patch.permission_mode;
  if (patch.agent_conversation_id) it->agent_conversation_id = *patch.agent_conversation_id;
  if (patch.context_usage) it->context_usage = *patch.context_usage;
  if (patch.allowed_tools) it->allowed_tools = *patch.allowed_tools;
  if (patch.status) it->status = *patch.status;
  it->updated_at = std::chrono::system_clock::now();

  return save_sessions_index(sessions) && ok;
}

GlobalSettings JsonSessionStore::get_global_settings() {
  std::lock_guard lock(mutex_);

  auto path = settings_file();
  if (!fs::exists(path)) {
    return {};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open settings file: {}", path.string());
    return {};
  }

  try {
    return GlobalSettings::from_json(json::parse(file));
  } catch (const std::exception &e) {
    spdlog::warn("Failed to parse settings file {}: {}", path.string(), e.what());
    return {};
  }
}

bool JsonSessionStore::set_global_settings(const GlobalSettings &settings) {
  std::lock_guard lock(mutex_);
  return atomic_write(settings_file(), settings.to_json().dump(2));
}

bool JsonSessionStore::queue_message(const SessionId &id, const std::string &text) {
  std::lock_guard lock(mutex_);

  auto sessions = load_sessions_index();
  auto it = find_record(sessions, id);
  if (it == sessions.end()) {
    spdlog::warn("queue_message: unknown session {}", id);
    return false;
  }

  it->pending_messages.push_back(text);
  return save_sessions_index(sessions);
}

std::vector<std::string> JsonSessionStore::get_pending_messages(const SessionId &id) {
  std::lock_guard lock(mutex_);

  auto sessions = load_sessions_index();
  auto it = find_record(sessions, id);
  if (it == sessions.end() || it->pending_messages.empty()) {
    return {};
  }

  std::vector<std::string> pending = std::move(it->pending_messages);
  it->pending_messages.clear();
  if (!save_sessions_index(sessions)) {
    spdlog::warn("get_pending_messages: failed to clear queue for {}", id);
  }
  return pending;
}

// --- Session lifecycle ---

SessionRecord JsonSessionStore::create_session(const std::string &name, const std::string &working_dir, PermissionMode mode) {
  std::lock_guard lock(mutex_);

  SessionRecord record;
  record.id = UUID::generate();
  record.name = name.empty() ? "session-" + record.id.substr(0, 8) : name;
  record.working_dir = working_dir;
  record.permission_mode = mode;

  auto sessions = load_sessions_index();
  sessions.push_back(record);
  if (!save_sessions_index(sessions)) {
    spdlog::warn("create_session: failed to persist {}", record.id);
  }
  return record;
}

std::optional<SessionRecord> JsonSessionStore::fork_session(const SessionId &source_id, const std::string &name) {
  std::lock_guard lock(mutex_);

  auto sessions = load_sessions_index();
  auto it = find_record(sessions, source_id);
  if (it == sessions.end()) {
    return std::nullopt;
  }

  SessionRecord record;
  record.id = UUID::generate();
  record.name = name.empty() ? it->name + " (fork)" : name;
  record.working_dir = it->working_dir;
  record.permission_mode = it->permission_mode;
  record.agent_conversation_id = it->agent_conversation_id;
  record.forked_from = source_id;

  sessions.push_back(record);
  if (!save_sessions_index(sessions)) {
    spdlog::warn("fork_session: failed to persist {}", record.id);
  }
  return record;
}

std::vector<SessionRecord> JsonSessionStore::list_sessions() {
  std::lock_guard lock(mutex_);
  return load_sessions_index();
}

bool JsonSessionStore::remove_session(const SessionId &id) {
  std::lock_guard lock(mutex_);

  auto sessions = load_sessions_index();
  auto it = find_record(sessions, id);
  if (it == sessions.end()) {
    return false;
  }
  sessions.erase(it);
  bool ok = save_sessions_index(sessions);

  auto dir = session_dir(id);
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    spdlog::warn("Failed to remove session directory {}: {}", dir.string(), ec.message());
  }
  return ok;
}

size_t JsonSessionStore::reset_running_sessions() {
  std::lock_guard lock(mutex_);

  auto sessions = load_sessions_index();
  size_t reset = 0;
  for (auto &s : sessions) {
    if (s.status == "running") {
      s.status = "stopped";
      ++reset;
    }
  }
  if (reset > 0 && !save_sessions_index(sessions)) {
    spdlog::warn("reset_running_sessions: failed to persist index");
  }
  return reset;
}

}  // namespace tether
