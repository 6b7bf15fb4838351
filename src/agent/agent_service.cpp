#include "agent/agent_service.hpp"

#include "agent/claude_cli.hpp"

namespace tether::agent {

AgentServiceFactory::AgentServiceFactory() {
  // Built-in backends
  register_service("claude-cli", [](const AgentServiceOptions &options, AgentServiceCallbacks callbacks, asio::io_context &io_ctx) {
    return ClaudeCliService::create(io_ctx, options, std::move(callbacks));
  });
}

AgentServiceFactory &AgentServiceFactory::instance() {
  static AgentServiceFactory instance;
  return instance;
}

std::shared_ptr<AgentService> AgentServiceFactory::create(const std::string &name, const AgentServiceOptions &options,
                                                          AgentServiceCallbacks callbacks, asio::io_context &io_ctx) {
  FactoryFunc factory;
  {
    std::lock_guard lock(mutex_);
    auto it = factories_.find(name);
    if (it == factories_.end()) {
      return nullptr;
    }
    factory = it->second;
  }
  return factory(options, std::move(callbacks), io_ctx);
}

void AgentServiceFactory::register_service(const std::string &name, FactoryFunc factory) {
  std::lock_guard lock(mutex_);
  factories_[name] = std::move(factory);
}

std::vector<std::string> AgentServiceFactory::names() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> out;
  for (const auto &[name, _] : factories_) {
    out.push_back(name);
  }
  return out;
}

}  // namespace tether::agent
