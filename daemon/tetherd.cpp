// tetherd: keeps agent sessions alive across client reconnects
#include <unistd.h>

#include <asio.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "tether.hpp"

using namespace tether;

namespace {

void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  --config <path>      Config file (default: ./.tether/config.json or ~/.config/tether/config.json)\n"
            << "  --host <addr>        Listen address (default: 127.0.0.1)\n"
            << "  --port <n>           Listen port (default: 7420)\n"
            << "  --data-dir <dir>     Session store directory (default: ~/.config/tether/data)\n"
            << "  --log-level <level>  trace, debug, info, warn, err, critical, off\n"
            << "  --foreground         Stay attached to the terminal and log to stderr\n"
            << "  --version            Print version and exit\n"
            << "  -h, --help           Show this help\n";
}

struct Options {
  std::optional<std::string> config_file;
  std::optional<std::string> host;
  std::optional<uint16_t> port;
  std::optional<std::string> data_dir;
  std::optional<std::string> log_level;
  bool foreground = false;
};

// Returns nullopt after printing an error or help text; exit_code tells which
std::optional<Options> parse_args(int argc, char* argv[], int& exit_code) {
  Options options;
  exit_code = 0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return std::nullopt;
    } else if (arg == "--version") {
      std::cout << "tetherd " << version() << "\n";
      return std::nullopt;
    } else if (arg == "--foreground") {
      options.foreground = true;
    } else if (arg == "--config" || arg == "--host" || arg == "--port" || arg == "--data-dir" || arg == "--log-level") {
      auto v = value();
      if (!v) {
        exit_code = 2;
        return std::nullopt;
      }
      if (arg == "--config") {
        options.config_file = *v;
      } else if (arg == "--host") {
        options.host = *v;
      } else if (arg == "--data-dir") {
        options.data_dir = *v;
      } else if (arg == "--log-level") {
        options.log_level = *v;
      } else {
        try {
          int port = std::stoi(*v);
          if (port <= 0 || port > 65535) {
            throw std::out_of_range("port");
          }
          options.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
          std::cerr << "Invalid port: " << *v << "\n";
          exit_code = 2;
          return std::nullopt;
        }
      }
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      exit_code = 2;
      return std::nullopt;
    }
  }

  return options;
}

}  // namespace

int main(int argc, char* argv[]) {
  int exit_code = 0;
  auto options = parse_args(argc, argv, exit_code);
  if (!options) {
    return exit_code;
  }

  // ----- 加载配置 -----
  Config config = options->config_file ? Config::load(*options->config_file) : Config::load_default();
  config.apply_env();
  if (options->host) config.server.host = *options->host;
  if (options->port) config.server.port = *options->port;
  if (options->data_dir) config.data_dir = std::filesystem::path(*options->data_dir);
  if (options->log_level) config.log_level = *options->log_level;
  config.log_to_console = options->foreground;

  if (!options->foreground && ::daemon(1, 0) != 0) {
    std::perror("daemon");
    return 1;
  }

  // Closed client sockets must surface as write errors
  std::signal(SIGPIPE, SIG_IGN);

  tether::init(config);

  // ----- 初始化存储 -----
  auto data_dir = config.resolved_data_dir();
  auto store = std::make_shared<JsonSessionStore>(data_dir);
  if (auto reset = store->reset_running_sessions(); reset > 0) {
    spdlog::info("Marked {} sessions from a previous run as stopped", reset);
  }

  auto global_allowlist = std::make_shared<permission::GlobalAllowlist>(store);
  global_allowlist->load();

  // ----- 网络与会话 -----
  asio::io_context io_ctx;

  std::optional<net::TlsOptions> tls;
  if (config.server.tls_enabled()) {
    tls = net::TlsOptions{config.server.tls_cert_file->string(), config.server.tls_key_file->string()};
  }
  auto server = std::make_shared<net::TransportServer>(io_ctx, config.server.host, config.server.port, tls);

  auto backend = config.agent;
  SessionOrchestrator::ServiceCreator creator = [&io_ctx, backend](const SessionId& id, const agent::AgentServiceOptions& base,
                                                                    agent::AgentServiceCallbacks callbacks) {
    auto service_options = base;
    service_options.executable = backend.executable;
    service_options.extra_args = backend.extra_args;
    service_options.model = backend.model;

    auto service = agent::AgentServiceFactory::instance().create(backend.backend, service_options, std::move(callbacks), io_ctx);
    if (!service) {
      spdlog::error("[Session {}] Unknown agent backend: {}", id, backend.backend);
    }
    return service;
  };

  auto orchestrator = std::make_shared<SessionOrchestrator>(store, server, global_allowlist, creator, config.to_orchestrator_options());
  auto dispatcher = std::make_shared<protocol::Dispatcher>(orchestrator, store, server);

  std::weak_ptr<protocol::Dispatcher> weak_dispatcher = dispatcher;
  server->set_line_handler([weak_dispatcher](const ConnectionId& connection, const std::string& line) {
    if (auto d = weak_dispatcher.lock()) {
      d->handle_line(connection, line);
    }
  });

  std::weak_ptr<SessionOrchestrator> weak_orchestrator = orchestrator;
  server->set_close_handler([weak_orchestrator](const ConnectionId& connection) {
    if (auto o = weak_orchestrator.lock()) {
      o->detach_connection(connection);
    }
  });

  if (!server->start()) {
    tether::shutdown();
    return 1;
  }

  auto work = asio::make_work_guard(io_ctx);

  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&](const asio::error_code& ec, int signo) {
    if (ec) {
      return;
    }
    spdlog::info("Received signal {}, shutting down", signo);
    server->stop();
    orchestrator->shutdown();
    // Let aborted agent processes be reaped before run() returns
    work.reset();
  });

  spdlog::info("tetherd {} ready (data: {}, backend: {})", version(), data_dir.string(), config.agent.backend);

  io_ctx.run();

  tether::shutdown();
  return 0;
}
