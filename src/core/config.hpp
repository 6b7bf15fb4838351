#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace tether {

struct OrchestratorOptions;

// Listening endpoint for client connections
struct ServerSettings {
  std::string host = "127.0.0.1";
  uint16_t port = 7420;

  // TLS is enabled when both are set (PEM files)
  std::optional<std::filesystem::path> tls_cert_file;
  std::optional<std::filesystem::path> tls_key_file;

  bool tls_enabled() const {
    return tls_cert_file && tls_key_file;
  }
};

// Agent runtime backend
struct AgentBackendSettings {
  std::string backend = "claude-cli";  // AgentServiceFactory name
  std::string executable = "claude";
  std::vector<std::string> extra_args;
  std::string model;  // empty = runtime default
};

// Application configuration
struct Config {
  ServerSettings server;
  AgentBackendSettings agent;

  // Session store root, defaults to config_paths::data_dir()
  std::optional<std::filesystem::path> data_dir;

  // Session behavior
  size_t max_history_messages = 50;
  int64_t default_context_window = 200000;
  PermissionMode default_permission_mode = PermissionMode::Default;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;
  bool log_to_console = false;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Environment overrides on top of this config
  // Reads: TETHER_HOST, TETHER_PORT, TETHER_DATA_DIR, TETHER_LOG_LEVEL, CLAUDE_CLI_PATH
  void apply_env();

  // Save to file
  bool save(const std::filesystem::path& path) const;

  std::filesystem::path resolved_data_dir() const;

  OrchestratorOptions to_orchestrator_options() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

// ~/.config/tether
std::filesystem::path config_dir();

std::filesystem::path default_config_file();

// ./.tether/config.json
std::filesystem::path project_config_file();

// ~/.config/tether/data
std::filesystem::path data_dir();
}  // namespace config_paths

}  // namespace tether
