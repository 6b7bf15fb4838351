#include "tether.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace tether {

void init(const Config& config) {
  // 初始化日志系统
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level, config.log_to_console);

  std::string backends;
  for (const auto& name : agent::AgentServiceFactory::instance().names()) {
    backends += backends.empty() ? name : ", " + name;
  }
  spdlog::info("tether {} (agent backend: {}, available: {})", version(), config.agent.backend, backends);
}

void shutdown() {
  spdlog::info("tether shutting down");
  spdlog::shutdown();
}

std::string version() {
  return TETHER_VERSION_STRING;
}

}  // namespace tether
