#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "permission/allowlist.hpp"
#include "permission/global_allowlist.hpp"

namespace tether::permission {

enum class PermissionBehavior {
  Allow,
  Deny
};

std::string to_string(PermissionBehavior behavior);

// What the agent receives for a tool invocation
struct PermissionResult {
  PermissionBehavior behavior = PermissionBehavior::Deny;
  json updated_input;   // Allow only
  std::string message;  // Deny only

  static PermissionResult allow(json input) {
    return PermissionResult{PermissionBehavior::Allow, std::move(input), ""};
  }

  static PermissionResult deny(std::string message) {
    return PermissionResult{PermissionBehavior::Deny, json(), std::move(message)};
  }

  bool allowed() const {
    return behavior == PermissionBehavior::Allow;
  }
};

// What the human decided
struct PermissionDecision {
  PermissionBehavior behavior = PermissionBehavior::Deny;
  std::optional<json> updated_input;
  std::optional<std::string> message;
  bool remember = false;
  bool global = false;
};

// Set on a suspended continuation that will never receive a decision (abort, shutdown)
class PermissionCancelled : public std::runtime_error {
 public:
  explicit PermissionCancelled(const std::string &reason) : std::runtime_error(reason) {}
};

// A suspended tool invocation, as shown to the client
struct PendingRequest {
  ToolUseId invocation_id;
  std::string tool_name;
  json input;
};

// Outcome of render_decision, for the caller to relay and persist
struct DecisionOutcome {
  PendingRequest request;
  PermissionResult result;
  std::optional<std::string> remembered_pattern;
  bool added_to_session = false;
  bool added_to_global = false;
};

// Deny message forwarded to the agent so it does not retry the same action
std::string deny_feedback(const std::optional<std::string> &message);

// Per-session broker of tool-approval requests.
class PermissionGate {
 public:
  explicit PermissionGate(std::shared_ptr<GlobalAllowlist> global, PatternList session_allowed = {});

  // Allow-list check against session and global lists
  bool is_allowed(const std::string &tool_name, const json &input) const;

  // Registers a suspended entry. An existing entry with the same id is cancelled first.
  std::future<PermissionResult> suspend(const ToolUseId &invocation_id, const std::string &tool_name, const json &input);

  // Resolves and removes the entry; nullopt if no entry exists for the id
  std::optional<DecisionOutcome> render_decision(const ToolUseId &invocation_id, const PermissionDecision &decision);

  // Fails every suspended continuation with PermissionCancelled(reason); returns how many
  size_t reject_all(const std::string &reason);

  std::vector<PendingRequest> pending() const;
  bool has_pending() const;

  PatternList session_allowed() const;
  void set_session_allowed(PatternList patterns);

  const std::shared_ptr<GlobalAllowlist> &global() const {
    return global_;
  }

 private:
  struct Entry {
    PendingRequest request;
    std::promise<PermissionResult> promise;
  };

  std::shared_ptr<GlobalAllowlist> global_;

  mutable std::mutex mutex_;
  PatternList session_allowed_;
  std::vector<Entry> entries_;  // insertion order
};

}  // namespace tether::permission
