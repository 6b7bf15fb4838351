#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "core/session_store.hpp"
#include "permission/allowlist.hpp"

namespace tether::permission {

// Process-wide allow-list shared by every session's PermissionGate.
// Readers take an immutable snapshot; writers publish a new list and persist it.
class GlobalAllowlist {
 public:
  explicit GlobalAllowlist(std::shared_ptr<SessionStore> store = nullptr);

  // Replace the in-memory list with the store's global settings
  void load();

  std::shared_ptr<const PatternList> snapshot() const;

  PatternList patterns() const {
    return *snapshot();
  }

  // Returns false if the pattern was already present
  bool add(const std::string &pattern);

  void replace(PatternList patterns);

 private:
  void publish(PatternList patterns);

  std::shared_ptr<SessionStore> store_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const PatternList> current_;

  // Serializes writers, including their store write
  std::mutex write_mutex_;
};

}  // namespace tether::permission
