#include "permission/global_allowlist.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tether::permission {

GlobalAllowlist::GlobalAllowlist(std::shared_ptr<SessionStore> store)
    : store_(std::move(store)), current_(std::make_shared<const PatternList>()) {}

void GlobalAllowlist::load() {
  if (!store_) {
    return;
  }

  auto settings = store_->get_global_settings();
  std::lock_guard lock(snapshot_mutex_);
  current_ = std::make_shared<const PatternList>(std::move(settings.allowed_tools));
  spdlog::info("[GlobalAllowlist] Loaded {} patterns", current_->size());
}

std::shared_ptr<const PatternList> GlobalAllowlist::snapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return current_;
}

bool GlobalAllowlist::add(const std::string &pattern) {
  std::lock_guard write_lock(write_mutex_);

  auto next = *snapshot();
  if (std::find(next.begin(), next.end(), pattern) != next.end()) {
    return false;
  }
  next.push_back(pattern);
  publish(std::move(next));
  spdlog::info("[GlobalAllowlist] Added pattern: {}", pattern);
  return true;
}

void GlobalAllowlist::replace(PatternList patterns) {
  std::lock_guard write_lock(write_mutex_);
  publish(std::move(patterns));
}

void GlobalAllowlist::publish(PatternList patterns) {
  auto next = std::make_shared<const PatternList>(std::move(patterns));
  {
    std::lock_guard lock(snapshot_mutex_);
    current_ = next;
  }

  if (store_ && !store_->set_global_settings(GlobalSettings{*next})) {
    spdlog::error("[GlobalAllowlist] Failed to persist {} patterns", next->size());
  }
}

}  // namespace tether::permission
