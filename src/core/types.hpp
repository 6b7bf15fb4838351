#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tether {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using ConnectionId = std::string;
using ToolUseId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Agent permission mode, changeable live by the human
enum class PermissionMode {
  Default,
  AcceptEdits,
  BypassPermissions,
  Plan
};

std::string to_string(PermissionMode mode);

std::optional<PermissionMode> permission_mode_from_string(const std::string &str);

// Last known context usage, re-shown verbatim to a resuming client
struct ContextUsage {
  int64_t tokens_used = 0;
  int64_t context_window = 0;
  double cost_usd = 0.0;

  json to_json() const;
  static ContextUsage from_json(const json &j);

  bool operator==(const ContextUsage &other) const = default;
};

// Milliseconds since epoch
int64_t now_millis();

int64_t timestamp_to_epoch(const Timestamp &ts);

Timestamp epoch_to_timestamp(int64_t epoch);

}  // namespace tether
