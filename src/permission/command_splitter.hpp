#pragma once

#include <string>
#include <vector>

namespace tether::permission {

// Splits a shell command line on `&&`, `||` and `;` outside single/double quotes.
// Sub-commands are trimmed; empty ones are dropped. A backslash escapes a quote character.
std::vector<std::string> split_bash_commands(const std::string &command);

// True when the command splits into more than one sub-command
bool is_compound_command(const std::string &command);

}  // namespace tether::permission
