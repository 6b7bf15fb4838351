#pragma once

#include <string>

namespace tether {

// Random identifiers for sessions, connections and control requests.
// Safe to call from any thread.
class UUID {
 public:
  // RFC 4122 version 4
  static std::string generate();

  // Lowercase alphanumeric, for log-friendly ids
  static std::string short_id(size_t length = 8);
};

}  // namespace tether
