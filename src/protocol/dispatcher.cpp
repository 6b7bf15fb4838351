#include "protocol/dispatcher.hpp"

#include <spdlog/spdlog.h>

namespace tether::protocol {

namespace {

std::optional<std::string> optional_string(const json &j, const char *key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return std::nullopt;
}

PermissionMode parse_mode(const std::string &str) {
  auto mode = permission_mode_from_string(str);
  if (!mode) {
    throw std::invalid_argument("Unknown permission mode: " + str);
  }
  return *mode;
}

}  // namespace

permission::PermissionDecision parse_decision(const json &command) {
  permission::PermissionDecision decision;

  auto behavior = command.at("behavior").get<std::string>();
  if (behavior == "allow") {
    decision.behavior = permission::PermissionBehavior::Allow;
  } else if (behavior == "deny") {
    decision.behavior = permission::PermissionBehavior::Deny;
  } else {
    throw std::invalid_argument("Unknown permission behavior: " + behavior);
  }

  if (command.contains("updatedInput") && !command["updatedInput"].is_null()) {
    decision.updated_input = command["updatedInput"];
  }
  decision.message = optional_string(command, "message");
  decision.remember = command.value("remember", false);
  decision.global = command.value("global", false);
  return decision;
}

StartRequest parse_start_request(const ConnectionId &connection, const json &command) {
  StartRequest request;
  request.session_id = command.at("sessionId").get<std::string>();
  request.connection_id = connection;
  request.working_dir = command.value("workingDir", "");
  request.resume.resume_token = optional_string(command, "resumeToken");
  if (auto mode = optional_string(command, "permissionMode")) {
    request.resume.permission_mode = parse_mode(*mode);
  }
  request.resume.fork = command.value("fork", false);
  if (command.contains("messageCount") && command["messageCount"].is_number_integer()) {
    auto count = command["messageCount"].get<int64_t>();
    request.client_message_count = count > 0 ? static_cast<uint64_t>(count) : 0;
  }
  return request;
}

json session_summary(const SessionRecord &record) {
  json j = {{"id", record.id},
            {"name", record.name},
            {"workingDir", record.working_dir},
            {"permissionMode", to_string(record.permission_mode)},
            {"status", record.status},
            {"pendingMessages", record.pending_messages.size()},
            {"createdAt", timestamp_to_epoch(record.created_at)},
            {"updatedAt", timestamp_to_epoch(record.updated_at)}};
  if (record.forked_from) {
    j["forkedFrom"] = *record.forked_from;
  }
  return j;
}

Dispatcher::Dispatcher(std::shared_ptr<SessionOrchestrator> orchestrator, std::shared_ptr<JsonSessionStore> store,
                       std::shared_ptr<net::Transport> transport)
    : orchestrator_(std::move(orchestrator)), store_(std::move(store)), transport_(std::move(transport)) {}

void Dispatcher::handle_line(const ConnectionId &connection, const std::string &line) {
  if (line.empty()) {
    return;
  }

  json command;
  try {
    command = json::parse(line);
  } catch (const json::parse_error &e) {
    spdlog::warn("[Conn {}] Malformed line: {}", connection, e.what());
    reply_error(connection, "", "Malformed JSON");
    return;
  }

  if (!command.is_object() || !command.contains("type") || !command["type"].is_string()) {
    spdlog::warn("[Conn {}] Command without type", connection);
    reply_error(connection, "", "Missing command type");
    return;
  }

  handle(connection, command);
}

void Dispatcher::handle(const ConnectionId &connection, const json &command) {
  const auto type = command.value("type", "");
  const auto session_id = command.value("sessionId", "");

  spdlog::debug("[Conn {}] {} {}", connection, type, session_id);

  try {
    if (type == "start_or_resume") {
      orchestrator_->start_or_resume(parse_start_request(connection, command));

    } else if (type == "send_message") {
      orchestrator_->send_message(command.at("sessionId").get<std::string>(), command.at("content").get<std::string>());

    } else if (type == "respond_to_permission") {
      orchestrator_->respond_to_permission(command.at("sessionId").get<std::string>(), command.at("invocationId").get<std::string>(),
                                           parse_decision(command));

    } else if (type == "abort") {
      orchestrator_->abort(command.at("sessionId").get<std::string>());

    } else if (type == "set_permission_mode") {
      auto id = command.at("sessionId").get<std::string>();
      if (!orchestrator_->set_permission_mode(id, parse_mode(command.at("mode").get<std::string>()))) {
        reply_error(connection, id, "Session not found: " + id);
      }

    } else if (type == "set_allowed_tools") {
      auto id = command.at("sessionId").get<std::string>();
      auto patterns = command.at("patterns").get<permission::PatternList>();
      if (!orchestrator_->set_allowed_tools(id, patterns)) {
        reply_error(connection, id, "Session not found: " + id);
      } else if (!orchestrator_->is_active(id)) {
        // Active sessions echo to their owner already
        reply(connection, events::allowed_tools(id, patterns));
      }

    } else if (type == "get_allowed_tools") {
      auto id = command.at("sessionId").get<std::string>();
      if (auto patterns = orchestrator_->allowed_tools(id)) {
        reply(connection, events::allowed_tools(id, *patterns));
      } else {
        reply_error(connection, id, "Session not found: " + id);
      }

    } else if (type == "set_global_allowed_tools") {
      orchestrator_->set_global_allowed_tools(command.at("patterns").get<permission::PatternList>());
      reply(connection, events::global_allowed_tools(orchestrator_->global_allowed_tools()));

    } else if (type == "get_global_allowed_tools") {
      reply(connection, events::global_allowed_tools(orchestrator_->global_allowed_tools()));

    } else if (type == "get_status") {
      auto id = command.at("sessionId").get<std::string>();
      reply(connection, OutboundEvent{"status", id, orchestrator_->get_status(id).to_json()});

    } else if (type == "send_to_session") {
      auto target = command.at("targetSessionId").get<std::string>();
      auto result = orchestrator_->send_message_to_session(target, command.at("text").get<std::string>());
      reply(connection, OutboundEvent{"delivery", target, result.to_json()});

    } else if (type == "create_session") {
      create_session(connection, command);

    } else if (type == "fork_session") {
      fork_session(connection, command);

    } else if (type == "delete_session") {
      delete_session(connection, command);

    } else if (type == "list_sessions") {
      json sessions = json::array();
      for (const auto &record : store_->list_sessions()) {
        sessions.push_back(session_summary(record));
      }
      reply(connection, OutboundEvent{"sessions", "", {{"sessions", sessions}}});

    } else {
      spdlog::warn("[Conn {}] Unknown command type: {}", connection, type);
      reply_error(connection, session_id, "Unknown command type: " + type);
    }
  } catch (const json::exception &e) {
    spdlog::warn("[Conn {}] Invalid {} command: {}", connection, type, e.what());
    reply_error(connection, session_id, "Invalid " + type + " command");
  } catch (const std::invalid_argument &e) {
    spdlog::warn("[Conn {}] Invalid {} command: {}", connection, type, e.what());
    reply_error(connection, session_id, e.what());
  }
}

void Dispatcher::create_session(const ConnectionId &connection, const json &command) {
  auto working_dir = command.at("workingDir").get<std::string>();
  auto mode = PermissionMode::Default;
  if (auto mode_str = optional_string(command, "permissionMode")) {
    mode = parse_mode(*mode_str);
  }

  auto record = store_->create_session(command.value("name", ""), working_dir, mode);
  spdlog::info("[Conn {}] Created session {} ({})", connection, record.id, record.name);
  reply(connection, OutboundEvent{"session_created", record.id, {{"session", session_summary(record)}}});

  StartRequest request;
  request.session_id = record.id;
  request.connection_id = connection;
  request.working_dir = record.working_dir;
  request.resume.permission_mode = record.permission_mode;
  orchestrator_->start_or_resume(request);
}

void Dispatcher::fork_session(const ConnectionId &connection, const json &command) {
  auto source = command.at("sessionId").get<std::string>();
  auto record = store_->fork_session(source, command.value("name", ""));
  if (!record) {
    reply_error(connection, source, "Session not found: " + source);
    return;
  }

  spdlog::info("[Conn {}] Forked session {} from {}", connection, record->id, source);
  reply(connection, OutboundEvent{"session_forked", record->id, {{"session", session_summary(*record)}, {"forkedFrom", source}}});

  StartRequest request;
  request.session_id = record->id;
  request.connection_id = connection;
  request.working_dir = record->working_dir;
  request.resume.resume_token = record->agent_conversation_id;
  request.resume.permission_mode = record->permission_mode;
  request.resume.fork = record->agent_conversation_id.has_value();
  orchestrator_->start_or_resume(request);
}

void Dispatcher::delete_session(const ConnectionId &connection, const json &command) {
  auto id = command.at("sessionId").get<std::string>();
  if (orchestrator_->is_active(id)) {
    reply_error(connection, id, "Session is active: " + id);
    return;
  }
  if (!store_->remove_session(id)) {
    reply_error(connection, id, "Session not found: " + id);
    return;
  }

  spdlog::info("[Conn {}] Deleted session {}", connection, id);
  reply(connection, OutboundEvent{"session_deleted", id, json::object()});
}

void Dispatcher::reply(const ConnectionId &connection, const OutboundEvent &event) {
  if (transport_) {
    transport_->deliver(connection, event);
  }
}

void Dispatcher::reply_error(const ConnectionId &connection, const SessionId &id, const std::string &message) {
  reply(connection, events::error(id, message));
}

}  // namespace tether::protocol
