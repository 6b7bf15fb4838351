#include "agent/agent_event.hpp"

#include <type_traits>

namespace tether::agent {

namespace {

// Null or mistyped fields read as the default instead of throwing
std::string string_field(const json &j, const char *key) {
  auto it = j.find(key);
  return it != j.end() && it->is_string() ? it->get<std::string>() : std::string();
}

template <typename T>
T number_field(const json &j, const char *key, T fallback) {
  auto it = j.find(key);
  return it != j.end() && it->is_number() ? it->get<T>() : fallback;
}

std::optional<AgentEvent> parse_system(const json &j) {
  if (string_field(j, "subtype") != "init") {
    return std::nullopt;
  }

  SystemInit init;
  init.conversation_id = string_field(j, "session_id");
  init.model = string_field(j, "model");
  if (j.contains("slash_commands") && j["slash_commands"].is_array()) {
    for (const auto &cmd : j["slash_commands"]) {
      if (cmd.is_string()) {
        init.slash_commands.push_back(cmd.get<std::string>());
      }
    }
  }
  return init;
}

std::optional<AgentEvent> parse_assistant(const json &j) {
  AssistantMessage msg;
  if (j.contains("message") && j["message"].is_object()) {
    const auto &message = j["message"];
    msg.content = message.contains("content") && !message["content"].is_null() ? message["content"] : json::array();
  } else {
    msg.content = json::array();
  }
  return msg;
}

std::optional<AgentEvent> parse_user(const json &j) {
  UserMessage msg;
  msg.is_replay = j.contains("isReplay") && j["isReplay"].is_boolean() && j["isReplay"].get<bool>();
  msg.message = j.contains("message") && j["message"].is_object() ? j["message"] : json::object();

  if (j.contains("tool_use_result") && !j["tool_use_result"].is_null()) {
    msg.tool_result = j["tool_use_result"];

    if (j.contains("parent_tool_use_id") && j["parent_tool_use_id"].is_string()) {
      msg.tool_use_id = j["parent_tool_use_id"].get<std::string>();
    } else if (msg.message.contains("content") && msg.message["content"].is_array()) {
      for (const auto &block : msg.message["content"]) {
        if (block.is_object() && string_field(block, "type") == "tool_result" && block.contains("tool_use_id") &&
            block["tool_use_id"].is_string()) {
          msg.tool_use_id = block["tool_use_id"].get<std::string>();
          break;
        }
      }
    }
  }
  return msg;
}

std::optional<AgentEvent> parse_result(const json &j) {
  ResultMessage result;
  result.subtype = string_field(j, "subtype");
  result.is_error = j.contains("is_error") && j["is_error"].is_boolean() && j["is_error"].get<bool>();
  result.total_cost_usd = number_field(j, "total_cost_usd", 0.0);

  if (j.contains("usage") && j["usage"].is_object()) {
    const auto &usage = j["usage"];
    result.input_tokens = number_field(usage, "input_tokens", int64_t(0));
    result.cache_read_input_tokens = number_field(usage, "cache_read_input_tokens", int64_t(0));
    result.output_tokens = number_field(usage, "output_tokens", int64_t(0));
  }

  if (j.contains("modelUsage") && j["modelUsage"].is_object() && !j["modelUsage"].empty()) {
    const auto &first = j["modelUsage"].begin().value();
    if (first.is_object() && first.contains("contextWindow") && first["contextWindow"].is_number()) {
      auto window = first["contextWindow"].get<int64_t>();
      if (window > 0) {
        result.context_window = window;
      }
    }
  }
  return result;
}

}  // namespace

ContextUsage ResultMessage::context_usage(int64_t fallback_window) const {
  ContextUsage usage;
  usage.tokens_used = input_tokens + cache_read_input_tokens;
  usage.context_window = context_window.value_or(fallback_window);
  usage.cost_usd = total_cost_usd;
  return usage;
}

std::optional<AgentEvent> parse_agent_event(const json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  auto type = string_field(j, "type");
  if (type == "system") return parse_system(j);
  if (type == "assistant") return parse_assistant(j);
  if (type == "user") return parse_user(j);
  if (type == "result") return parse_result(j);
  return std::nullopt;
}

std::string event_kind(const AgentEvent &event) {
  return std::visit(
      [](const auto &e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SystemInit>) {
          return "system-init";
        } else if constexpr (std::is_same_v<T, AssistantMessage>) {
          return "assistant";
        } else if constexpr (std::is_same_v<T, UserMessage>) {
          return "user";
        } else {
          return "result";
        }
      },
      event);
}

}  // namespace tether::agent
