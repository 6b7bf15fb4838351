#include "permission/allowlist.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "permission/command_splitter.hpp"

namespace tether::permission {

namespace {

constexpr std::string_view kBashPrefix = "Bash(";

bool is_wrapped_bash(const std::string &p) {
  return p.size() > kBashPrefix.size() && p.starts_with(kBashPrefix) && p.ends_with(")");
}

std::string unwrap_bash(const std::string &p) {
  return p.substr(kBashPrefix.size(), p.size() - kBashPrefix.size() - 1);
}

bool is_boundary(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || std::string_view("|&;<>()").find(c) != std::string_view::npos;
}

// "pnpm build" covers "pnpm build 2>&1" but not "pnpm buildx"
bool command_prefix_matches(const std::string &allowed_cmd, const std::string &actual_cmd) {
  if (allowed_cmd.empty() || !actual_cmd.starts_with(allowed_cmd)) {
    return false;
  }
  if (actual_cmd.size() == allowed_cmd.size()) {
    return true;
  }
  return is_boundary(allowed_cmd.back()) || is_boundary(actual_cmd[allowed_cmd.size()]);
}

bool matches_either(const std::string &pattern, const PatternList &session_list, const PatternList &global_list) {
  return matches_allowlist(pattern, session_list) || matches_allowlist(pattern, global_list);
}

}  // namespace

std::string generate_pattern(const std::string &tool_name, const json &input) {
  if (tool_name == "Bash" && input.is_object() && input.contains("command") && input["command"].is_string()) {
    return "Bash(" + input["command"].get<std::string>() + ")";
  }

  if ((tool_name == "Read" || tool_name == "Write" || tool_name == "Edit") && input.is_object() && input.contains("file_path") &&
      input["file_path"].is_string()) {
    return tool_name + "(" + input["file_path"].get<std::string>() + ")";
  }

  return tool_name;
}

bool matches_pattern(const std::string &pattern, const std::string &allowed) {
  if (pattern == allowed) {
    return true;
  }

  if (is_wrapped_bash(pattern) && is_wrapped_bash(allowed) && command_prefix_matches(unwrap_bash(allowed), unwrap_bash(pattern))) {
    return true;
  }

  if (allowed.ends_with("*)")) {
    auto prefix = allowed.substr(0, allowed.size() - 2);
    auto open_pattern = pattern.ends_with(")") ? pattern.substr(0, pattern.size() - 1) : pattern;
    return open_pattern.starts_with(prefix);
  }

  if (allowed.ends_with("*")) {
    return pattern.starts_with(allowed.substr(0, allowed.size() - 1));
  }

  return false;
}

bool matches_allowlist(const std::string &pattern, const PatternList &allowlist) {
  return std::any_of(allowlist.begin(), allowlist.end(), [&pattern](const std::string &allowed) {
    return matches_pattern(pattern, allowed);
  });
}

bool is_tool_allowed(const std::string &tool_name, const json &input, const PatternList &session_list, const PatternList &global_list) {
  if (tool_name == "Bash" && input.is_object() && input.contains("command") && input["command"].is_string()) {
    auto sub_commands = split_bash_commands(input["command"].get<std::string>());
    if (sub_commands.size() > 1) {
      return std::all_of(sub_commands.begin(), sub_commands.end(), [&](const std::string &cmd) {
        return matches_either("Bash(" + cmd + ")", session_list, global_list);
      });
    }
  }

  return matches_either(generate_pattern(tool_name, input), session_list, global_list);
}

}  // namespace tether::permission
