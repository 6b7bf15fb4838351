#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace tether::permission {

using PatternList = std::vector<std::string>;

// Canonical permission pattern for a tool invocation:
//   Bash            -> Bash(<command>)
//   Read/Write/Edit -> <Tool>(<file_path>)
//   anything else   -> <Tool>
std::string generate_pattern(const std::string &tool_name, const json &input);

// Does `pattern` match a single stored pattern?
//   - exact match
//   - Bash(x) stored, Bash(x ...) actual: stored command is a prefix ending on a word boundary
//   - stored ends with "*)" or "*": prefix wildcard over everything before the star
bool matches_pattern(const std::string &pattern, const std::string &allowed);

bool matches_allowlist(const std::string &pattern, const PatternList &allowlist);

// Allow-list decision for one invocation against the union of both lists.
// A compound Bash command is allowed only if every sub-command matches.
bool is_tool_allowed(const std::string &tool_name, const json &input, const PatternList &session_list, const PatternList &global_list);

}  // namespace tether::permission
