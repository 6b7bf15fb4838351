#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

#include "session/orchestrator.hpp"

namespace tether {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file: {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    config.server.host = j.value("host", config.server.host);
    config.server.port = j.value("port", config.server.port);
    if (j.contains("tls")) {
      const auto& tls_json = j["tls"];
      if (tls_json.contains("cert_file")) {
        config.server.tls_cert_file = tls_json["cert_file"].get<std::string>();
      }
      if (tls_json.contains("key_file")) {
        config.server.tls_key_file = tls_json["key_file"].get<std::string>();
      }
    }

    if (j.contains("data_dir")) {
      config.data_dir = j["data_dir"].get<std::string>();
    }

    // Load agent backend
    if (j.contains("agent")) {
      const auto& agent_json = j["agent"];
      config.agent.backend = agent_json.value("backend", config.agent.backend);
      config.agent.executable = agent_json.value("executable", config.agent.executable);
      config.agent.model = agent_json.value("model", "");
      if (agent_json.contains("extra_args")) {
        for (const auto& arg : agent_json["extra_args"]) {
          config.agent.extra_args.push_back(arg);
        }
      }
    }

    config.max_history_messages = j.value("max_history_messages", config.max_history_messages);
    config.default_context_window = j.value("default_context_window", config.default_context_window);

    if (j.contains("default_permission_mode")) {
      auto mode_str = j["default_permission_mode"].get<std::string>();
      if (auto mode = permission_mode_from_string(mode_str)) {
        config.default_permission_mode = *mode;
      } else {
        spdlog::warn("Unknown default_permission_mode '{}' in {}, using default", mode_str, path.string());
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}", path.string(), e.what());
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

void Config::apply_env() {
  Config& config = *this;

  if (const char* host = std::getenv("TETHER_HOST")) {
    config.server.host = host;
  }

  if (const char* port = std::getenv("TETHER_PORT")) {
    try {
      int value = std::stoi(port);
      if (value > 0 && value <= 65535) {
        config.server.port = static_cast<uint16_t>(value);
      } else {
        spdlog::warn("TETHER_PORT out of range: {}", port);
      }
    } catch (const std::exception& e) {
      spdlog::warn("Invalid TETHER_PORT '{}': {}", port, e.what());
    }
  }

  if (const char* data_dir = std::getenv("TETHER_DATA_DIR")) {
    config.data_dir = fs::path(data_dir);
  }

  if (const char* level = std::getenv("TETHER_LOG_LEVEL")) {
    config.log_level = level;
  }

  // Same variable the CLI wrappers use
  if (const char* cli_path = std::getenv("CLAUDE_CLI_PATH")) {
    config.agent.executable = cli_path;
  }
}

bool Config::save(const fs::path& path) const {
  json j;

  j["host"] = server.host;
  j["port"] = server.port;
  if (server.tls_enabled()) {
    j["tls"] = {{"cert_file", server.tls_cert_file->string()}, {"key_file", server.tls_key_file->string()}};
  }

  if (data_dir) {
    j["data_dir"] = data_dir->string();
  }

  j["agent"] = {{"backend", agent.backend}, {"executable", agent.executable}, {"extra_args", agent.extra_args}, {"model", agent.model}};

  j["max_history_messages"] = max_history_messages;
  j["default_context_window"] = default_context_window;
  j["default_permission_mode"] = to_string(default_permission_mode);

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("Failed to write config file: {}", path.string());
    return false;
  }
  file << j.dump(2);
  return file.good();
}

fs::path Config::resolved_data_dir() const {
  return data_dir ? *data_dir : config_paths::data_dir();
}

OrchestratorOptions Config::to_orchestrator_options() const {
  OrchestratorOptions options;
  options.max_history_messages = max_history_messages;
  options.default_context_window = default_context_window;
  options.default_permission_mode = default_permission_mode;
  return options;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "tether";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".tether" / "config.json";
}

fs::path data_dir() {
  return config_dir() / "data";
}

}  // namespace config_paths

}  // namespace tether
