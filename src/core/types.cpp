#include "core/types.hpp"

namespace tether {

std::string to_string(PermissionMode mode) {
  switch (mode) {
    case PermissionMode::Default:
      return "default";
    case PermissionMode::AcceptEdits:
      return "acceptEdits";
    case PermissionMode::BypassPermissions:
      return "bypassPermissions";
    case PermissionMode::Plan:
      return "plan";
  }
  return "default";
}

std::optional<PermissionMode> permission_mode_from_string(const std::string &str) {
  if (str == "default") return PermissionMode::Default;
  if (str == "acceptEdits") return PermissionMode::AcceptEdits;
  if (str == "bypassPermissions") return PermissionMode::BypassPermissions;
  if (str == "plan") return PermissionMode::Plan;
  return std::nullopt;
}

json ContextUsage::to_json() const {
  return {{"tokensUsed", tokens_used}, {"contextWindow", context_window}, {"costUsd", cost_usd}};
}

ContextUsage ContextUsage::from_json(const json &j) {
  ContextUsage usage;
  usage.tokens_used = j.value("tokensUsed", int64_t(0));
  usage.context_window = j.value("contextWindow", int64_t(0));
  usage.cost_usd = j.value("costUsd", 0.0);
  return usage;
}

int64_t now_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t timestamp_to_epoch(const Timestamp &ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp epoch_to_timestamp(int64_t epoch) {
  return Timestamp(std::chrono::seconds(epoch));
}

}  // namespace tether
