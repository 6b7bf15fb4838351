#include "session/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>

namespace tether {

using permission::PermissionResult;
namespace events = protocol::events;

namespace {

template <typename>
inline constexpr bool always_false_v = false;

std::future<PermissionResult> cancelled_future(const std::string &reason) {
  std::promise<PermissionResult> promise;
  promise.set_exception(std::make_exception_ptr(permission::PermissionCancelled(reason)));
  return promise.get_future();
}

std::future<PermissionResult> ready_future(PermissionResult result) {
  std::promise<PermissionResult> promise;
  promise.set_value(std::move(result));
  return promise.get_future();
}

}  // namespace

// --- SessionStatus / DeliveryResult ---

std::string SessionStatus::state() const {
  if (!active) return "not_started";
  if (has_pending_permission) return "waiting_permission";
  if (thinking) return "thinking";
  return "idle";
}

json SessionStatus::to_json() const {
  return {{"exists", exists}, {"active", active}, {"thinking", thinking}, {"hasPendingPermission", has_pending_permission},
          {"state", state()}};
}

json DeliveryResult::to_json() const {
  json j = {{"success", success}, {"delivered", delivered}, {"queued", queued}};
  if (error) {
    j["error"] = *error;
  }
  return j;
}

// --- SessionOrchestrator ---

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<SessionStore> store, std::shared_ptr<net::Transport> transport,
                                         std::shared_ptr<permission::GlobalAllowlist> global_allowlist, ServiceCreator creator,
                                         OrchestratorOptions options)
    : store_(std::move(store)),
      transport_(std::move(transport)),
      global_allowlist_(std::move(global_allowlist)),
      creator_(std::move(creator)),
      options_(options) {
  if (!global_allowlist_) {
    global_allowlist_ = std::make_shared<permission::GlobalAllowlist>(store_);
  }
  if (options_.max_history_messages == 0) {
    options_.max_history_messages = 1;
  }
}

SessionOrchestrator::~SessionOrchestrator() {
  shutdown();
}

SessionOrchestrator::SessionPtr SessionOrchestrator::find(const SessionId &id) const {
  std::lock_guard lock(sessions_mutex_);
  auto it = sessions_.find(id);
  return it != sessions_.end() ? it->second : nullptr;
}

void SessionOrchestrator::start_or_resume(const StartRequest &request) {
  SessionPtr session;
  std::unique_lock<std::mutex> session_lock;
  {
    std::lock_guard lock(sessions_mutex_);
    if (shut_down_) {
      spdlog::warn("[Session {}] start_or_resume after shutdown, ignored", request.session_id);
      return;
    }

    auto it = sessions_.find(request.session_id);
    if (it != sessions_.end()) {
      session = it->second;
    } else {
      // Lock before publishing so nobody observes a half-started session
      session = std::make_shared<ActiveSession>(request.session_id, global_allowlist_);
      session_lock = std::unique_lock(session->mutex);
      sessions_[request.session_id] = session;
    }
  }
  if (!session_lock.owns_lock()) {
    session_lock = std::unique_lock(session->mutex);
  }

  if (session->closed) {
    return;
  }

  if (session->service) {
    spdlog::info("[Session {}] Client {} joining active session (client has {}, server has {})", session->id, request.connection_id,
                 request.client_message_count ? std::to_string(*request.client_message_count) : "?", session->history_total);
    session->owner = request.connection_id;
    relay_locked(*session, events::session_ready(session->id, session->permission_mode));
    run_resume_protocol_locked(*session, request.client_message_count);
    return;
  }

  cold_start_locked(*session, request);
}

void SessionOrchestrator::cold_start_locked(ActiveSession &session, const StartRequest &request) {
  std::optional<SessionRecord> record;
  try {
    record = store_->get_session(session.id);
  } catch (const std::exception &e) {
    spdlog::error("[Session {}] Failed to load session from store: {}", session.id, e.what());
  }

  session.owner = request.connection_id;
  session.working_dir = !request.working_dir.empty() || !record ? request.working_dir : record->working_dir;
  session.permission_mode = request.resume.permission_mode.value_or(record ? record->permission_mode : options_.default_permission_mode);
  session.history.clear();
  session.history_total = 0;

  if (record) {
    const auto &messages = record->messages;
    size_t first = messages.size() > options_.max_history_messages ? messages.size() - options_.max_history_messages : 0;
    for (size_t i = first; i < messages.size(); ++i) {
      StoredMessage msg = messages[i];
      msg.sequence = i;
      session.history.push_back(std::move(msg));
    }
    session.history_total = messages.size();
    session.context_usage = record->context_usage;
    session.agent_conversation_id = record->agent_conversation_id;
    session.gate.set_session_allowed(record->allowed_tools);
  }

  agent::AgentServiceOptions service_options;
  service_options.working_dir = session.working_dir;
  service_options.resume_token = request.resume.resume_token ? request.resume.resume_token : session.agent_conversation_id;
  service_options.fork = request.resume.fork;
  service_options.permission_mode = session.permission_mode;

  spdlog::info("[Session {}] Starting: cwd=\"{}\", resume={}, fork={}, loaded {} of {} messages", session.id, session.working_dir,
               service_options.resume_token.value_or("<none>"), service_options.fork, session.history.size(), session.history_total);

  try {
    session.service = creator_(session.id, service_options, make_callbacks(session.id));
  } catch (const std::exception &e) {
    spdlog::error("[Session {}] Failed to create agent service: {}", session.id, e.what());
  }

  relay_locked(session, events::session_ready(session.id, session.permission_mode));

  if (!session.service) {
    relay_locked(session, events::error(session.id, "Failed to start agent service"));
    return;
  }

  SessionPatch patch;
  patch.status = "running";
  persist(session.id, patch, "status");

  run_resume_protocol_locked(session, request.client_message_count);
  drain_pending_locked(session);
}

void SessionOrchestrator::run_resume_protocol_locked(ActiveSession &session, std::optional<uint64_t> client_message_count) {
  uint64_t start = std::min<uint64_t>(client_message_count.value_or(0), session.history_total);

  size_t replayed = 0;
  uint64_t window_first = session.history.empty() ? session.history_total : session.history.front().sequence;
  if (start < window_first) {
    // Older than the in-memory window: serve from the persisted history
    std::optional<SessionRecord> record;
    try {
      record = store_->get_session(session.id);
    } catch (const std::exception &e) {
      spdlog::error("[Session {}] Failed to load history for replay: {}", session.id, e.what());
    }
    if (record) {
      uint64_t end = std::min<uint64_t>(window_first, record->messages.size());
      for (uint64_t i = start; i < end; ++i) {
        StoredMessage msg = record->messages[i];
        msg.sequence = i;
        relay_locked(session, events::message(session.id, msg, true));
        ++replayed;
      }
    }
  }

  for (const auto &msg : session.history) {
    if (msg.sequence >= start) {
      relay_locked(session, events::message(session.id, msg, true));
      ++replayed;
    }
  }
  if (replayed > 0) {
    spdlog::info("[Session {}] Replayed {} messages from {}", session.id, replayed, start);
  } else {
    spdlog::debug("[Session {}] Skipping history replay, client is up to date", session.id);
  }

  if (session.context_usage) {
    relay_locked(session, events::result(session.id, *session.context_usage, true));
  }

  for (const auto &request : session.gate.pending()) {
    relay_locked(session, events::permission_request(session.id, request));
  }

  if (!session.slash_commands.empty()) {
    relay_locked(session, events::slash_commands(session.id, session.slash_commands));
  }

  relay_locked(session, events::thinking(session.id, session.thinking));
}

bool SessionOrchestrator::send_message(const SessionId &id, const std::string &content, bool relay_to_client) {
  auto session = find(id);
  if (!session) {
    spdlog::warn("[Session {}] send_message to inactive session, ignored", id);
    return false;
  }

  std::lock_guard lock(session->mutex);
  return send_locked(*session, content, relay_to_client);
}

bool SessionOrchestrator::send_locked(ActiveSession &session, const std::string &content, bool relay_to_client) {
  if (session.closed || !session.service) {
    spdlog::warn("[Session {}] No agent service, message ignored", session.id);
    return false;
  }
  if (session.service->is_active()) {
    spdlog::warn("[Session {}] Query already in flight, message ignored", session.id);
    return false;
  }

  auto msg = append_history_locked(session, StoredMessage::user(content));
  if (relay_to_client) {
    relay_locked(session, events::message(session.id, msg, false, true));
  }

  SessionPatch patch;
  patch.append_messages.push_back(msg);
  persist(session.id, patch, "user message");

  set_thinking_locked(session, true, false);

  try {
    session.service->start(content);
  } catch (const std::exception &e) {
    spdlog::error("[Session {}] Failed to start query: {}", session.id, e.what());
    relay_locked(session, events::error(session.id, e.what()));
    set_thinking_locked(session, false, false);
    return false;
  }
  return true;
}

void SessionOrchestrator::record_agent_event(const SessionId &id, const agent::AgentEvent &event) {
  auto session = find(id);
  if (!session) {
    spdlog::warn("[Session {}] Agent event for unknown session: {}", id, agent::event_kind(event));
    return;
  }

  std::lock_guard lock(session->mutex);
  if (session->closed) {
    return;
  }

  spdlog::debug("[Session {}] Agent event: {}", id, agent::event_kind(event));

  std::visit(
      [this, &s = *session](const auto &e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, agent::SystemInit>) {
          s.slash_commands = e.slash_commands;
          spdlog::info("[Session {}] Agent initialized: conversation={}, {} slash commands", s.id, e.conversation_id, e.slash_commands.size());
          if (!s.slash_commands.empty()) {
            relay_locked(s, events::slash_commands(s.id, s.slash_commands));
          }
          set_thinking_locked(s, true, false);

          if (!e.conversation_id.empty()) {
            s.agent_conversation_id = e.conversation_id;
            SessionPatch patch;
            patch.agent_conversation_id = e.conversation_id;
            persist(s.id, patch, "agent conversation id");
          }
        } else if constexpr (std::is_same_v<T, agent::AssistantMessage>) {
          auto msg = append_history_locked(s, StoredMessage::assistant(e.content));

          SessionPatch patch;
          patch.append_messages.push_back(msg);
          persist(s.id, patch, "assistant message");

          relay_locked(s, events::message(s.id, msg));
        } else if constexpr (std::is_same_v<T, agent::UserMessage>) {
          if (e.tool_use_id && e.tool_result) {
            relay_locked(s, events::tool_result(s.id, *e.tool_use_id, *e.tool_result));
          }
          if (e.is_replay) {
            relay_locked(s, events::agent_history(s.id, e.message));
          }
        } else if constexpr (std::is_same_v<T, agent::ResultMessage>) {
          set_thinking_locked(s, false, true);

          auto usage = e.context_usage(options_.default_context_window);
          s.context_usage = usage;
          spdlog::info("[Session {}] Result: tokens={}, window={}, cost=${:.4f}", s.id, usage.tokens_used, usage.context_window,
                       usage.cost_usd);

          SessionPatch patch;
          patch.context_usage = usage;
          persist(s.id, patch, "context usage");

          relay_locked(s, events::result(s.id, usage));
        } else {
          static_assert(always_false_v<T>, "unhandled agent event");
        }
      },
      event);
}

std::future<PermissionResult> SessionOrchestrator::request_permission(const SessionId &id, const std::string &tool_name,
                                                                      const json &input, const ToolUseId &invocation_id) {
  auto session = find(id);
  if (!session) {
    spdlog::warn("[Session {}] Permission request for unknown session: {}", id, tool_name);
    return cancelled_future("Session not active");
  }

  std::lock_guard lock(session->mutex);
  if (session->closed) {
    return cancelled_future("Server shutdown");
  }

  if (session->gate.is_allowed(tool_name, input)) {
    spdlog::info("[Session {}] Auto-allowed {} ({})", id, tool_name, permission::generate_pattern(tool_name, input));
    return ready_future(PermissionResult::allow(input));
  }

  auto future = session->gate.suspend(invocation_id, tool_name, input);
  spdlog::info("[Session {}] Awaiting permission for {} ({})", id, tool_name, invocation_id);
  relay_locked(*session, events::permission_request(id, permission::PendingRequest{invocation_id, tool_name, input}));
  return future;
}

bool SessionOrchestrator::respond_to_permission(const SessionId &id, const ToolUseId &invocation_id,
                                                const permission::PermissionDecision &decision) {
  auto session = find(id);
  if (!session) {
    spdlog::warn("[Session {}] Permission response for inactive session", id);
    return false;
  }

  std::lock_guard lock(session->mutex);
  auto outcome = session->gate.render_decision(invocation_id, decision);
  if (!outcome) {
    spdlog::warn("[Session {}] No pending permission for {}", id, invocation_id);
    return false;
  }

  spdlog::info("[Session {}] Permission {} for {} ({})", id, permission::to_string(outcome->result.behavior), outcome->request.tool_name,
               invocation_id);

  if (outcome->added_to_session) {
    auto patterns = session->gate.session_allowed();
    SessionPatch patch;
    patch.allowed_tools = patterns;
    persist(id, patch, "allowed tools");
    relay_locked(*session, events::allowed_tools(id, patterns));
  }
  if (outcome->added_to_global) {
    relay_locked(*session, events::global_allowed_tools(global_allowlist_->patterns()));
  }

  // The agent keeps going either way
  set_thinking_locked(*session, true, true);
  return true;
}

void SessionOrchestrator::abort(const SessionId &id) {
  auto session = find(id);
  if (!session) {
    spdlog::warn("[Session {}] Abort for inactive session", id);
    return;
  }

  std::lock_guard lock(session->mutex);
  spdlog::info("[Session {}] Aborting", id);
  if (session->service) {
    session->service->abort();
  }
  set_thinking_locked(*session, false, false);

  auto rejected = session->gate.reject_all("Session aborted");
  if (rejected > 0) {
    spdlog::info("[Session {}] Rejected {} pending permissions", id, rejected);
  }
}

void SessionOrchestrator::shutdown() {
  std::unordered_map<SessionId, SessionPtr> sessions;
  {
    std::lock_guard lock(sessions_mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    sessions.swap(sessions_);
  }

  spdlog::info("[Orchestrator] Shutting down {} sessions", sessions.size());
  for (auto &[id, session] : sessions) {
    std::lock_guard lock(session->mutex);
    session->closed = true;
    if (session->service) {
      session->service->abort();
    }
    session->thinking = false;
    session->gate.reject_all("Server shutdown");

    SessionPatch patch;
    patch.status = "stopped";
    persist(id, patch, "status");
  }
}

void SessionOrchestrator::handle_error(const SessionId &id, const std::string &error) {
  auto session = find(id);
  if (!session) {
    return;
  }

  std::lock_guard lock(session->mutex);
  spdlog::error("[Session {}] Agent error: {}", id, error);
  relay_locked(*session, events::error(id, error));
  set_thinking_locked(*session, false, false);
}

void SessionOrchestrator::handle_complete(const SessionId &id) {
  auto session = find(id);
  if (!session) {
    return;
  }

  std::lock_guard lock(session->mutex);
  if (session->closed) {
    return;
  }
  set_thinking_locked(*session, false, true);

  // The query is over, so nobody is left to act on an outstanding decision
  auto rejected = session->gate.reject_all("Agent query ended");
  if (rejected > 0) {
    spdlog::info("[Session {}] Rejected {} pending permissions after query ended", id, rejected);
  }
  drain_pending_locked(*session);
}

bool SessionOrchestrator::set_permission_mode(const SessionId &id, PermissionMode mode) {
  SessionPatch patch;
  patch.permission_mode = mode;

  auto session = find(id);
  if (!session) {
    return store_->update_session(id, patch);
  }

  std::lock_guard lock(session->mutex);
  session->permission_mode = mode;
  if (session->service) {
    session->service->set_permission_mode(mode);
  }
  spdlog::info("[Session {}] Permission mode: {}", id, to_string(mode));
  persist(id, patch, "permission mode");
  return true;
}

bool SessionOrchestrator::set_allowed_tools(const SessionId &id, const permission::PatternList &patterns) {
  SessionPatch patch;
  patch.allowed_tools = patterns;

  auto session = find(id);
  if (!session) {
    return store_->update_session(id, patch);
  }

  std::lock_guard lock(session->mutex);
  session->gate.set_session_allowed(patterns);
  persist(id, patch, "allowed tools");
  relay_locked(*session, events::allowed_tools(id, patterns));
  return true;
}

std::optional<permission::PatternList> SessionOrchestrator::allowed_tools(const SessionId &id) const {
  if (auto session = find(id)) {
    return session->gate.session_allowed();
  }

  auto record = store_->get_session(id);
  if (!record) {
    return std::nullopt;
  }
  return record->allowed_tools;
}

void SessionOrchestrator::set_global_allowed_tools(const permission::PatternList &patterns) {
  global_allowlist_->replace(patterns);
  spdlog::info("[Orchestrator] Global allow-list replaced ({} patterns)", patterns.size());
}

permission::PatternList SessionOrchestrator::global_allowed_tools() const {
  return global_allowlist_->patterns();
}

SessionStatus SessionOrchestrator::get_status(const SessionId &id) const {
  SessionStatus status;
  auto session = find(id);
  if (!session) {
    status.exists = store_->get_session(id).has_value();
    return status;
  }

  std::lock_guard lock(session->mutex);
  status.exists = true;
  status.active = session->service != nullptr && !session->closed;
  status.thinking = session->thinking;
  status.has_pending_permission = session->gate.has_pending();
  return status;
}

DeliveryResult SessionOrchestrator::send_message_to_session(const SessionId &target, const std::string &text) {
  auto queue = [&]() -> DeliveryResult {
    if (store_->queue_message(target, text)) {
      spdlog::info("[Session {}] Queued cross-session message", target);
      return {true, false, true, std::nullopt};
    }
    return {false, false, false, "Session not found: " + target};
  };

  auto session = find(target);
  if (!session) {
    return queue();
  }

  // Held across the check and the enqueue so a drain cannot interleave
  std::lock_guard lock(session->mutex);
  bool idle = !session->closed && session->service && !session->thinking && !session->gate.has_pending() && !session->service->is_active();
  if (idle && send_locked(*session, text, true)) {
    return {true, true, false, std::nullopt};
  }
  return queue();
}

void SessionOrchestrator::process_pending_messages(const SessionId &id) {
  auto session = find(id);
  if (!session) {
    return;
  }

  std::lock_guard lock(session->mutex);
  drain_pending_locked(*session);
}

void SessionOrchestrator::drain_pending_locked(ActiveSession &session) {
  std::vector<std::string> pending;
  try {
    pending = store_->get_pending_messages(session.id);
  } catch (const std::exception &e) {
    spdlog::error("[Session {}] Failed to read pending messages: {}", session.id, e.what());
    return;
  }
  if (pending.empty()) {
    return;
  }

  spdlog::info("[Session {}] Draining {} queued messages", session.id, pending.size());

  // One query at a time: the rest go back in order and wait for the next completion
  size_t next = send_locked(session, pending.front(), true) ? 1 : 0;
  for (size_t i = next; i < pending.size(); ++i) {
    if (!store_->queue_message(session.id, pending[i])) {
      spdlog::error("[Session {}] Failed to re-queue message: {}", session.id, pending[i]);
    }
  }
}

void SessionOrchestrator::detach_connection(const ConnectionId &connection) {
  std::vector<SessionPtr> sessions;
  {
    std::lock_guard lock(sessions_mutex_);
    for (const auto &[_, session] : sessions_) {
      sessions.push_back(session);
    }
  }

  for (auto &session : sessions) {
    std::lock_guard lock(session->mutex);
    if (session->owner == connection) {
      spdlog::info("[Session {}] Owning connection {} closed", session->id, connection);
      session->owner.clear();
    }
  }
}

size_t SessionOrchestrator::active_session_count() const {
  std::lock_guard lock(sessions_mutex_);
  return sessions_.size();
}

bool SessionOrchestrator::is_active(const SessionId &id) const {
  return find(id) != nullptr;
}

std::optional<std::string> SessionOrchestrator::agent_conversation_id(const SessionId &id) const {
  auto session = find(id);
  if (!session) {
    return std::nullopt;
  }
  std::lock_guard lock(session->mutex);
  return session->agent_conversation_id;
}

// --- Helpers ---

StoredMessage SessionOrchestrator::append_history_locked(ActiveSession &session, StoredMessage msg) {
  msg.sequence = session.history_total++;
  session.history.push_back(msg);
  while (session.history.size() > options_.max_history_messages) {
    session.history.pop_front();
  }
  return msg;
}

void SessionOrchestrator::set_thinking_locked(ActiveSession &session, bool thinking, bool force) {
  bool changed = session.thinking != thinking;
  session.thinking = thinking;
  if (changed || force) {
    relay_locked(session, events::thinking(session.id, thinking));
  }
}

void SessionOrchestrator::relay_locked(const ActiveSession &session, const protocol::OutboundEvent &event) {
  if (session.owner.empty() || !transport_) {
    spdlog::debug("[Session {}] No owning connection, dropping {}", session.id, event.type);
    return;
  }

  try {
    transport_->deliver(session.owner, event);
  } catch (const std::exception &e) {
    spdlog::error("[Session {}] Failed to deliver {}: {}", session.id, event.type, e.what());
  }
}

void SessionOrchestrator::persist(const SessionId &id, const SessionPatch &patch, const char *what) {
  try {
    if (!store_->update_session(id, patch)) {
      spdlog::error("[Session {}] Failed to persist {}", id, what);
    }
  } catch (const std::exception &e) {
    spdlog::error("[Session {}] Failed to persist {}: {}", id, what, e.what());
  }
}

agent::AgentServiceCallbacks SessionOrchestrator::make_callbacks(const SessionId &id) {
  std::weak_ptr<SessionOrchestrator> weak = weak_from_this();
  agent::AgentServiceCallbacks callbacks;

  callbacks.on_event = [weak, id](const agent::AgentEvent &event) {
    if (auto self = weak.lock()) {
      self->record_agent_event(id, event);
    }
  };
  callbacks.on_permission_request = [weak, id](const std::string &tool_name, const json &input, const ToolUseId &invocation_id) {
    if (auto self = weak.lock()) {
      return self->request_permission(id, tool_name, input, invocation_id);
    }
    return cancelled_future("Server shutdown");
  };
  callbacks.on_error = [weak, id](const std::string &error) {
    if (auto self = weak.lock()) {
      self->handle_error(id, error);
    }
  };
  callbacks.on_complete = [weak, id]() {
    if (auto self = weak.lock()) {
      self->handle_complete(id);
    }
  };
  return callbacks;
}

}  // namespace tether
