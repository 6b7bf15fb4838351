#include "permission/permission_gate.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tether::permission {

std::string to_string(PermissionBehavior behavior) {
  switch (behavior) {
    case PermissionBehavior::Allow:
      return "allow";
    case PermissionBehavior::Deny:
      return "deny";
  }
  return "deny";
}

std::string deny_feedback(const std::optional<std::string> &message) {
  std::string text = message && !message->empty() ? *message : "Permission denied by user";
  return "[USER FEEDBACK] " + text + ". Respect this decision and do not attempt this action again.";
}

PermissionGate::PermissionGate(std::shared_ptr<GlobalAllowlist> global, PatternList session_allowed)
    : global_(std::move(global)), session_allowed_(std::move(session_allowed)) {
  if (!global_) {
    global_ = std::make_shared<GlobalAllowlist>();
  }
}

bool PermissionGate::is_allowed(const std::string &tool_name, const json &input) const {
  auto global_snapshot = global_->snapshot();
  std::lock_guard lock(mutex_);
  return is_tool_allowed(tool_name, input, session_allowed_, *global_snapshot);
}

std::future<PermissionResult> PermissionGate::suspend(const ToolUseId &invocation_id, const std::string &tool_name, const json &input) {
  std::lock_guard lock(mutex_);

  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &e) {
    return e.request.invocation_id == invocation_id;
  });
  if (it != entries_.end()) {
    spdlog::warn("[PermissionGate] Duplicate request for {}, cancelling the previous one", invocation_id);
    it->promise.set_exception(std::make_exception_ptr(PermissionCancelled("Superseded by a new request")));
    entries_.erase(it);
  }

  Entry entry{PendingRequest{invocation_id, tool_name, input}, std::promise<PermissionResult>()};
  auto future = entry.promise.get_future();
  entries_.push_back(std::move(entry));
  return future;
}

std::optional<DecisionOutcome> PermissionGate::render_decision(const ToolUseId &invocation_id, const PermissionDecision &decision) {
  std::unique_lock lock(mutex_);

  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &e) {
    return e.request.invocation_id == invocation_id;
  });
  if (it == entries_.end()) {
    return std::nullopt;
  }

  Entry entry = std::move(*it);
  entries_.erase(it);

  DecisionOutcome outcome;
  outcome.request = entry.request;

  if (decision.behavior == PermissionBehavior::Allow) {
    if (decision.remember) {
      auto pattern = generate_pattern(entry.request.tool_name, entry.request.input);
      outcome.remembered_pattern = pattern;
      if (!decision.global && std::find(session_allowed_.begin(), session_allowed_.end(), pattern) == session_allowed_.end()) {
        session_allowed_.push_back(pattern);
        outcome.added_to_session = true;
      }
    }
    outcome.result = PermissionResult::allow(decision.updated_input.value_or(entry.request.input));
  } else {
    outcome.result = PermissionResult::deny(deny_feedback(decision.message));
  }
  lock.unlock();

  // Global list has its own writer lock and store write
  if (outcome.remembered_pattern && decision.global) {
    global_->add(*outcome.remembered_pattern);
    outcome.added_to_global = true;
  }

  entry.promise.set_value(outcome.result);
  return outcome;
}

size_t PermissionGate::reject_all(const std::string &reason) {
  std::vector<Entry> entries;
  {
    std::lock_guard lock(mutex_);
    entries.swap(entries_);
  }

  for (auto &entry : entries) {
    entry.promise.set_exception(std::make_exception_ptr(PermissionCancelled(reason)));
  }
  return entries.size();
}

std::vector<PendingRequest> PermissionGate::pending() const {
  std::lock_guard lock(mutex_);
  std::vector<PendingRequest> out;
  out.reserve(entries_.size());
  for (const auto &entry : entries_) {
    out.push_back(entry.request);
  }
  return out;
}

bool PermissionGate::has_pending() const {
  std::lock_guard lock(mutex_);
  return !entries_.empty();
}

PatternList PermissionGate::session_allowed() const {
  std::lock_guard lock(mutex_);
  return session_allowed_;
}

void PermissionGate::set_session_allowed(PatternList patterns) {
  std::lock_guard lock(mutex_);
  session_allowed_ = std::move(patterns);
}

}  // namespace tether::permission
