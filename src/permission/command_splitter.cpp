#include "permission/command_splitter.hpp"

namespace tether::permission {

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

enum class ScanState {
  Plain,
  InSingleQuote,
  InDoubleQuote
};

}  // namespace

std::vector<std::string> split_bash_commands(const std::string &command) {
  std::vector<std::string> parts;
  std::string current;
  ScanState state = ScanState::Plain;

  auto flush = [&]() {
    auto part = trim(current);
    if (!part.empty()) {
      parts.push_back(std::move(part));
    }
    current.clear();
  };

  for (size_t i = 0; i < command.size(); ++i) {
    char c = command[i];
    bool escaped = i > 0 && command[i - 1] == '\\';

    switch (state) {
      case ScanState::InSingleQuote:
        if (c == '\'' && !escaped) state = ScanState::Plain;
        current += c;
        continue;
      case ScanState::InDoubleQuote:
        if (c == '"' && !escaped) state = ScanState::Plain;
        current += c;
        continue;
      case ScanState::Plain:
        break;
    }

    if (c == '\'' && !escaped) {
      state = ScanState::InSingleQuote;
      current += c;
    } else if (c == '"' && !escaped) {
      state = ScanState::InDoubleQuote;
      current += c;
    } else if (c == ';') {
      flush();
    } else if ((c == '&' || c == '|') && i + 1 < command.size() && command[i + 1] == c) {
      flush();
      ++i;
    } else {
      current += c;
    }
  }
  flush();

  return parts;
}

bool is_compound_command(const std::string &command) {
  return split_bash_commands(command).size() > 1;
}

}  // namespace tether::permission
