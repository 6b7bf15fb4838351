#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

namespace tether::agent {

// Agent event types

// Session initialized by the backing runtime
struct SystemInit {
  std::string conversation_id;
  std::vector<std::string> slash_commands;
  std::string model;
};

struct AssistantMessage {
  json content;  // content blocks, relayed verbatim
};

// User-role message from the runtime: tool results, or history it replays on resume
struct UserMessage {
  std::optional<ToolUseId> tool_use_id;
  std::optional<json> tool_result;
  bool is_replay = false;
  json message;  // {role, content}
};

struct ResultMessage {
  std::string subtype;
  bool is_error = false;
  int64_t input_tokens = 0;
  int64_t cache_read_input_tokens = 0;
  int64_t output_tokens = 0;
  std::optional<int64_t> context_window;  // first model's advertised window
  double total_cost_usd = 0.0;

  // tokens_used counts the latest call only, not the cumulative per-model counters
  ContextUsage context_usage(int64_t fallback_window) const;
};

using AgentEvent = std::variant<SystemInit, AssistantMessage, UserMessage, ResultMessage>;

// Classify one stream-json line from the runtime. Unknown or irrelevant shapes yield nullopt.
std::optional<AgentEvent> parse_agent_event(const json &j);

std::string event_kind(const AgentEvent &event);

}  // namespace tether::agent
