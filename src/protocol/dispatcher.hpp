#pragma once

#include <memory>
#include <string>

#include "core/json_store.hpp"
#include "core/types.hpp"
#include "net/transport.hpp"
#include "permission/permission_gate.hpp"
#include "session/orchestrator.hpp"

namespace tether::protocol {

// Inbound command parsing helpers, exposed for tests
permission::PermissionDecision parse_decision(const json &command);
StartRequest parse_start_request(const ConnectionId &connection, const json &command);

// Summary shown to clients for create/fork/list replies
json session_summary(const SessionRecord &record);

// Turns inbound client lines into orchestrator and store calls.
// Replies and errors go back to the sending connection only.
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<SessionOrchestrator> orchestrator, std::shared_ptr<JsonSessionStore> store,
             std::shared_ptr<net::Transport> transport);

  // One newline-delimited JSON command
  void handle_line(const ConnectionId &connection, const std::string &line);

  void handle(const ConnectionId &connection, const json &command);

 private:
  void reply(const ConnectionId &connection, const OutboundEvent &event);
  void reply_error(const ConnectionId &connection, const SessionId &id, const std::string &message);

  void create_session(const ConnectionId &connection, const json &command);
  void fork_session(const ConnectionId &connection, const json &command);
  // Stored sessions only; an active session has to stay
  void delete_session(const ConnectionId &connection, const json &command);

  std::shared_ptr<SessionOrchestrator> orchestrator_;
  std::shared_ptr<JsonSessionStore> store_;
  std::shared_ptr<net::Transport> transport_;
};

}  // namespace tether::protocol
