#pragma once

#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/agent_event.hpp"
#include "agent/agent_service.hpp"
#include "core/message.hpp"
#include "core/session_store.hpp"
#include "core/types.hpp"
#include "net/transport.hpp"
#include "permission/global_allowlist.hpp"
#include "permission/permission_gate.hpp"

namespace tether {

struct OrchestratorOptions {
  size_t max_history_messages = 50;       // in-memory window per session
  int64_t default_context_window = 200000;  // when the model advertises none
  PermissionMode default_permission_mode = PermissionMode::Default;
};

struct ResumeOptions {
  std::optional<std::string> resume_token;  // agent conversation id; defaults to the stored one
  std::optional<PermissionMode> permission_mode;
  bool fork = false;
};

struct StartRequest {
  SessionId session_id;
  ConnectionId connection_id;
  std::string working_dir;
  ResumeOptions resume;
  std::optional<uint64_t> client_message_count;  // messages the client already shows
};

struct SessionStatus {
  bool exists = false;
  bool active = false;
  bool thinking = false;
  bool has_pending_permission = false;

  // not_started | waiting_permission | thinking | idle
  std::string state() const;
  json to_json() const;
};

struct DeliveryResult {
  bool success = false;
  bool delivered = false;
  bool queued = false;
  std::optional<std::string> error;

  json to_json() const;
};

// Owns every active session: routes client actions to the agent service and permission gate,
// tracks thinking state, and brings reconnecting clients up to date.
// Must be owned by a std::shared_ptr; agent callbacks hold it weakly.
class SessionOrchestrator : public std::enable_shared_from_this<SessionOrchestrator> {
 public:
  using ServiceCreator = std::function<std::shared_ptr<agent::AgentService>(const SessionId &, const agent::AgentServiceOptions &,
                                                                            agent::AgentServiceCallbacks)>;

  SessionOrchestrator(std::shared_ptr<SessionStore> store, std::shared_ptr<net::Transport> transport,
                      std::shared_ptr<permission::GlobalAllowlist> global_allowlist, ServiceCreator creator,
                      OrchestratorOptions options = {});
  ~SessionOrchestrator();

  SessionOrchestrator(const SessionOrchestrator &) = delete;
  SessionOrchestrator &operator=(const SessionOrchestrator &) = delete;

  // Resume if active, cold start otherwise. Never fails towards the caller.
  void start_or_resume(const StartRequest &request);

  // Rejected (false) while a query is in flight
  bool send_message(const SessionId &id, const std::string &content, bool relay_to_client = false);

  void record_agent_event(const SessionId &id, const agent::AgentEvent &event);

  std::future<permission::PermissionResult> request_permission(const SessionId &id, const std::string &tool_name, const json &input,
                                                               const ToolUseId &invocation_id);

  // false when no request is pending under that id
  bool respond_to_permission(const SessionId &id, const ToolUseId &invocation_id, const permission::PermissionDecision &decision);

  void abort(const SessionId &id);
  void shutdown();

  void handle_error(const SessionId &id, const std::string &error);
  void handle_complete(const SessionId &id);

  bool set_permission_mode(const SessionId &id, PermissionMode mode);
  bool set_allowed_tools(const SessionId &id, const permission::PatternList &patterns);
  std::optional<permission::PatternList> allowed_tools(const SessionId &id) const;
  void set_global_allowed_tools(const permission::PatternList &patterns);
  permission::PatternList global_allowed_tools() const;

  SessionStatus get_status(const SessionId &id) const;

  // Inter-agent handoff: deliver now if idle, otherwise queue durably
  DeliveryResult send_message_to_session(const SessionId &target, const std::string &text);
  void process_pending_messages(const SessionId &id);

  // Owning connection went away; events are dropped until the next resume
  void detach_connection(const ConnectionId &connection);

  size_t active_session_count() const;
  bool is_active(const SessionId &id) const;
  std::optional<std::string> agent_conversation_id(const SessionId &id) const;

 private:
  struct ActiveSession {
    ActiveSession(SessionId session_id, std::shared_ptr<permission::GlobalAllowlist> global)
        : id(std::move(session_id)), gate(std::move(global)) {}

    std::mutex mutex;

    SessionId id;
    ConnectionId owner;
    std::string working_dir;
    std::optional<std::string> agent_conversation_id;
    bool thinking = false;
    std::deque<StoredMessage> history;  // bounded tail
    uint64_t history_total = 0;         // messages ever recorded, persisted ones included
    std::vector<std::string> slash_commands;
    PermissionMode permission_mode = PermissionMode::Default;
    std::optional<ContextUsage> context_usage;
    permission::PermissionGate gate;
    std::shared_ptr<agent::AgentService> service;
    bool closed = false;
  };

  using SessionPtr = std::shared_ptr<ActiveSession>;

  SessionPtr find(const SessionId &id) const;

  // All *_locked helpers expect session.mutex to be held
  void cold_start_locked(ActiveSession &session, const StartRequest &request);
  void run_resume_protocol_locked(ActiveSession &session, std::optional<uint64_t> client_message_count);
  bool send_locked(ActiveSession &session, const std::string &content, bool relay_to_client);
  void drain_pending_locked(ActiveSession &session);
  StoredMessage append_history_locked(ActiveSession &session, StoredMessage msg);
  void set_thinking_locked(ActiveSession &session, bool thinking, bool force);
  void relay_locked(const ActiveSession &session, const protocol::OutboundEvent &event);

  void persist(const SessionId &id, const SessionPatch &patch, const char *what);
  agent::AgentServiceCallbacks make_callbacks(const SessionId &id);

  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<net::Transport> transport_;
  std::shared_ptr<permission::GlobalAllowlist> global_allowlist_;
  ServiceCreator creator_;
  OrchestratorOptions options_;

  // Guards the table only; never held while waiting on agent or human
  mutable std::mutex sessions_mutex_;
  std::unordered_map<SessionId, SessionPtr> sessions_;
  bool shut_down_ = false;
};

}  // namespace tether
