#pragma once

#include <asio.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "agent/agent_event.hpp"
#include "core/types.hpp"
#include "permission/permission_gate.hpp"

namespace tether::agent {

struct AgentServiceOptions {
  std::string working_dir;
  std::optional<std::string> resume_token;  // agent conversation id to resume
  bool fork = false;                        // fork from resume_token instead of continuing it
  PermissionMode permission_mode = PermissionMode::Default;

  // Backend settings, filled in from Config by the daemon
  std::string executable;
  std::vector<std::string> extra_args;
  std::string model;
};

// Callbacks must never be invoked synchronously from start(), abort() or set_permission_mode().
struct AgentServiceCallbacks {
  std::function<void(const AgentEvent &)> on_event;
  // A future failing with an exception is treated as a deny
  std::function<std::future<permission::PermissionResult>(const std::string &tool_name, const json &input, const ToolUseId &id)>
      on_permission_request;
  std::function<void(const std::string &error)> on_error;
  // Called after the final result, once is_active() already reports false
  std::function<void()> on_complete;
};

// Abstract agent runtime, one instance per session
class AgentService {
 public:
  virtual ~AgentService() = default;

  virtual std::string name() const = 0;

  // Run one query. At most one query is in flight at a time.
  virtual void start(const std::string &prompt) = 0;

  // Stop the current query, if any
  virtual void abort() = 0;

  // Applies to the running query and to every later one
  virtual void set_permission_mode(PermissionMode mode) = 0;

  virtual bool is_active() const = 0;

  // Conversation id assigned by the runtime, once known
  virtual std::optional<std::string> conversation_id() const = 0;
};

// Agent service factory
class AgentServiceFactory {
 public:
  using FactoryFunc = std::function<std::shared_ptr<AgentService>(const AgentServiceOptions &, AgentServiceCallbacks, asio::io_context &)>;

  static AgentServiceFactory &instance();

  // Create service by backend name; nullptr if unknown
  std::shared_ptr<AgentService> create(const std::string &name, const AgentServiceOptions &options, AgentServiceCallbacks callbacks,
                                       asio::io_context &io_ctx);

  void register_service(const std::string &name, FactoryFunc factory);

  std::vector<std::string> names() const;

 private:
  AgentServiceFactory();

  mutable std::mutex mutex_;
  std::map<std::string, FactoryFunc> factories_;
};

}  // namespace tether::agent
