#include "agent/claude_cli.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <future>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/uuid.hpp"

namespace tether::agent {

namespace {

constexpr auto kKillGrace = std::chrono::seconds(2);
constexpr auto kPermissionPoll = std::chrono::milliseconds(50);

void close_fds(std::initializer_list<int> fds) {
  for (int fd : fds) {
    if (fd >= 0) {
      close(fd);
    }
  }
}

}  // namespace

std::shared_ptr<ClaudeCliService> ClaudeCliService::create(asio::io_context &io_ctx, const AgentServiceOptions &options,
                                                           AgentServiceCallbacks callbacks) {
  // A CLI that exits before reading stdin must surface as EPIPE
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, []() { ::signal(SIGPIPE, SIG_IGN); });

  return std::shared_ptr<ClaudeCliService>(new ClaudeCliService(io_ctx, options, std::move(callbacks)));
}

ClaudeCliService::ClaudeCliService(asio::io_context &io_ctx, const AgentServiceOptions &options, AgentServiceCallbacks callbacks)
    : io_ctx_(io_ctx), callbacks_(std::move(callbacks)), options_(options) {
  if (options_.executable.empty()) {
    options_.executable = "claude";
  }
}

ClaudeCliService::~ClaudeCliService() {
  // Handlers keep the service alive while a query runs; only an io_context teardown gets here with one
  if (current_) {
    std::lock_guard lock(current_->write_mutex);
    if (current_->pid > 0) {
      kill(current_->pid, SIGKILL);
      waitpid(current_->pid, nullptr, 0);
      current_->pid = -1;
    }
  }
}

// --- Wire messages ---

std::vector<std::string> ClaudeCliService::build_args(const AgentServiceOptions &options, const std::optional<std::string> &resume_id,
                                                      PermissionMode mode) {
  std::vector<std::string> args = {"--print",         "--output-format",         "stream-json", "--input-format",
                                   "stream-json",     "--verbose",               "--permission-prompt-tool",
                                   "stdio",           "--permission-mode",       to_string(mode),
                                   "--setting-sources", "user,project"};

  if (!options.model.empty()) {
    args.push_back("--model");
    args.push_back(options.model);
  }

  if (resume_id) {
    args.push_back("--resume");
    args.push_back(*resume_id);
    if (options.fork) {
      args.push_back("--fork-session");
    }
  }

  args.insert(args.end(), options.extra_args.begin(), options.extra_args.end());
  return args;
}

json ClaudeCliService::make_user_message(const std::string &prompt) {
  return {{"type", "user"}, {"message", {{"role", "user"}, {"content", prompt}}}};
}

json ClaudeCliService::make_permission_response(const std::string &request_id, const permission::PermissionResult &result) {
  json decision;
  if (result.allowed()) {
    decision = {{"behavior", "allow"}, {"updatedInput", result.updated_input}};
  } else {
    decision = {{"behavior", "deny"}, {"message", result.message}};
  }
  return {{"type", "control_response"}, {"response", {{"subtype", "success"}, {"request_id", request_id}, {"response", decision}}}};
}

json ClaudeCliService::make_control_request(const std::string &request_id, const json &request) {
  return {{"type", "control_request"}, {"request_id", request_id}, {"request", request}};
}

// --- AgentService ---

void ClaudeCliService::start(const std::string &prompt) {
  std::shared_ptr<Query> query;
  std::vector<std::string> args;
  {
    std::lock_guard lock(mutex_);
    if (current_) {
      spdlog::warn("[ClaudeCli] start() while a query is running, ignored");
      return;
    }

    // Fork only once: later queries continue the forked conversation
    auto opts = options_;
    auto resume_id = conversation_id_ ? conversation_id_ : options_.resume_token;
    if (conversation_id_) {
      opts.fork = false;
    }

    query = std::make_shared<Query>(io_ctx_);
    auto mode = opts.permission_mode;
    if (resume_id && mode == PermissionMode::BypassPermissions) {
      // The CLI refuses bypassPermissions together with --resume; restored after init
      mode = PermissionMode::AcceptEdits;
      query->restore_bypass = true;
      spdlog::warn("[ClaudeCli] Downgrading bypassPermissions to acceptEdits for resume");
    }

    args = build_args(opts, resume_id, mode);
    current_ = query;
    spdlog::info("[ClaudeCli] Starting query: cwd=\"{}\", resume={}, mode={}", opts.working_dir, resume_id.value_or("<none>"),
                 to_string(mode));
  }

  auto spawned = spawn(query, args);
  if (spawned.failed()) {
    asio::post(io_ctx_, [self = shared_from_this(), query, error = *spawned.error]() {
      self->finish(query, error);
    });
    return;
  }

  write_line(query, make_user_message(prompt));
  read_stdout(query);
  read_stderr(query);
}

void ClaudeCliService::abort() {
  std::shared_ptr<Query> query;
  {
    std::lock_guard lock(mutex_);
    query = std::move(current_);
    current_.reset();
  }

  if (!query) {
    return;
  }

  spdlog::info("[ClaudeCli] Aborting query");
  query->aborted = true;
  write_line(query, make_control_request(UUID::short_id(), {{"subtype", "interrupt"}}));
  terminate(query);
}

void ClaudeCliService::set_permission_mode(PermissionMode mode) {
  std::shared_ptr<Query> query;
  {
    std::lock_guard lock(mutex_);
    options_.permission_mode = mode;
    query = current_;
  }

  if (query) {
    write_line(query, make_control_request(UUID::short_id(), {{"subtype", "set_permission_mode"}, {"mode", to_string(mode)}}));
    spdlog::info("[ClaudeCli] Permission mode updated on active query: {}", to_string(mode));
  } else {
    spdlog::info("[ClaudeCli] Permission mode updated (applies to next query): {}", to_string(mode));
  }
}

bool ClaudeCliService::is_active() const {
  std::lock_guard lock(mutex_);
  return current_ != nullptr;
}

std::optional<std::string> ClaudeCliService::conversation_id() const {
  std::lock_guard lock(mutex_);
  return conversation_id_;
}

// --- Process ---

Result<pid_t> ClaudeCliService::spawn(const std::shared_ptr<Query> &query, const std::vector<std::string> &args) {
  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};

  if (pipe2(in_pipe, O_CLOEXEC) == -1 || pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1) {
    auto error = "Failed to create pipe: " + std::string(strerror(errno));
    close_fds({in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]});
    return Result<pid_t>::failure(error);
  }

  // argv must be built before fork
  std::string executable;
  std::string working_dir;
  {
    std::lock_guard lock(mutex_);
    executable = options_.executable;
    working_dir = options_.working_dir;
  }
  std::vector<char *> argv;
  argv.push_back(const_cast<char *>(executable.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    auto error = "Failed to fork process: " + std::string(strerror(errno));
    close_fds({in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]});
    return Result<pid_t>::failure(error);
  }

  if (pid == 0) {
    // ---- Child process ----
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      _exit(126);
    }

    execvp(argv[0], argv.data());
    _exit(127);  // exec failed
  }

  // ---- Parent process ----
  close_fds({in_pipe[0], out_pipe[1], err_pipe[1]});

  std::lock_guard lock(query->write_mutex);
  query->pid = pid;
  query->in.assign(in_pipe[1]);
  query->out.assign(out_pipe[0]);
  query->err.assign(err_pipe[0]);
  spdlog::debug("[ClaudeCli] Spawned {} (pid {})", executable, pid);
  return Result<pid_t>::success(pid);
}

void ClaudeCliService::read_stdout(std::shared_ptr<Query> query) {
  auto self = shared_from_this();
  asio::async_read_until(query->out, query->out_buf, '\n', [self, query](const asio::error_code &ec, std::size_t n) {
    if (ec) {
      if (ec == asio::error::eof && query->out_buf.size() > 0) {
        std::string rest(asio::buffers_begin(query->out_buf.data()), asio::buffers_end(query->out_buf.data()));
        query->out_buf.consume(query->out_buf.size());
        self->handle_line(query, rest);
      } else if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        spdlog::warn("[ClaudeCli] stdout read failed: {}", ec.message());
      }
      self->finish(query, std::nullopt);
      return;
    }

    std::string line(asio::buffers_begin(query->out_buf.data()), asio::buffers_begin(query->out_buf.data()) + n);
    query->out_buf.consume(n);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    if (!line.empty()) {
      self->handle_line(query, line);
    }
    self->read_stdout(query);
  });
}

void ClaudeCliService::read_stderr(std::shared_ptr<Query> query) {
  auto self = shared_from_this();
  asio::async_read_until(query->err, query->err_buf, '\n', [self, query](const asio::error_code &ec, std::size_t n) {
    if (ec) {
      return;
    }
    std::string line(asio::buffers_begin(query->err_buf.data()), asio::buffers_begin(query->err_buf.data()) + n);
    query->err_buf.consume(n);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    if (!line.empty()) {
      spdlog::error("[ClaudeCli] stderr: {}", line);
    }
    self->read_stderr(query);
  });
}

void ClaudeCliService::handle_line(const std::shared_ptr<Query> &query, const std::string &line) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error &e) {
    spdlog::debug("[ClaudeCli] Non-JSON output: {}", line);
    return;
  }

  try {
    dispatch_line(query, j);
  } catch (const json::exception &e) {
    spdlog::warn("[ClaudeCli] Malformed CLI message ({}): {}", e.what(), line);
  }
}

void ClaudeCliService::dispatch_line(const std::shared_ptr<Query> &query, const json &j) {
  auto type = j.contains("type") && j["type"].is_string() ? j["type"].get<std::string>() : std::string();
  if (type == "control_request") {
    handle_control_request(query, j);
    return;
  }
  if (type == "control_response") {
    spdlog::debug("[ClaudeCli] Control response: {}", j.dump());
    return;
  }

  auto event = parse_agent_event(j);
  if (!event) {
    spdlog::debug("[ClaudeCli] Ignoring {} message", type);
    return;
  }

  if (auto *init = std::get_if<SystemInit>(&*event); init && !init->conversation_id.empty()) {
    {
      std::lock_guard lock(mutex_);
      conversation_id_ = init->conversation_id;
    }
    spdlog::info("[ClaudeCli] Conversation initialized: {}", init->conversation_id);
    if (query->restore_bypass) {
      query->restore_bypass = false;
      write_line(query, make_control_request(UUID::short_id(), {{"subtype", "set_permission_mode"}, {"mode", "bypassPermissions"}}));
      spdlog::info("[ClaudeCli] Restored bypassPermissions after resume");
    }
  }

  bool is_result = std::holds_alternative<ResultMessage>(*event);
  if (is_result) {
    query->result_seen = true;
  }

  if (query->aborted) {
    return;
  }

  if (callbacks_.on_event) {
    callbacks_.on_event(*event);
  }

  // Closing stdin lets the CLI exit once the turn is over
  if (is_result) {
    close_stdin(query);
  }
}

void ClaudeCliService::handle_control_request(const std::shared_ptr<Query> &query, const json &j) {
  auto request_id = j.value("request_id", "");
  json request = j.value("request", json::object());
  auto subtype = request.value("subtype", "");

  if (subtype != "can_use_tool") {
    spdlog::warn("[ClaudeCli] Unsupported control request: {}", subtype);
    write_line(query, {{"type", "control_response"},
                       {"response", {{"subtype", "error"}, {"request_id", request_id}, {"error", "Unsupported control request: " + subtype}}}});
    return;
  }

  auto tool_name = request.value("tool_name", "");
  json input = request.value("input", json::object());
  auto tool_use_id = request.value("tool_use_id", request_id);

  spdlog::info("[ClaudeCli] can_use_tool: tool={}, id={}", tool_name, tool_use_id);

  if (!callbacks_.on_permission_request) {
    write_line(query, make_permission_response(request_id, permission::PermissionResult::deny("No permission handler")));
    return;
  }

  std::future<permission::PermissionResult> future;
  try {
    future = callbacks_.on_permission_request(tool_name, input, tool_use_id);
  } catch (const std::exception &e) {
    spdlog::error("[ClaudeCli] Permission request failed: {}", e.what());
    write_line(query, make_permission_response(request_id, permission::PermissionResult::deny(e.what())));
    return;
  }

  // A human may take hours; poll on the io thread instead of blocking it
  auto wait = std::make_shared<PermissionWait>(io_ctx_, request_id, tool_name, std::move(future));
  poll_permission(query, wait);
}

void ClaudeCliService::poll_permission(const std::shared_ptr<Query> &query, const std::shared_ptr<PermissionWait> &wait) {
  if (wait->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    wait->timer.expires_after(kPermissionPoll);
    wait->timer.async_wait([self = shared_from_this(), query, wait](const asio::error_code &ec) {
      if (ec) {
        return;
      }
      self->poll_permission(query, wait);
    });
    return;
  }

  permission::PermissionResult result;
  try {
    result = wait->future.get();
  } catch (const permission::PermissionCancelled &e) {
    result = permission::PermissionResult::deny(e.what());
  } catch (const std::exception &e) {
    result = permission::PermissionResult::deny(e.what());
  }
  spdlog::info("[ClaudeCli] can_use_tool resolved: tool={}, behavior={}", wait->tool_name, permission::to_string(result.behavior));
  write_line(query, make_permission_response(wait->request_id, result));
}

bool ClaudeCliService::write_line(const std::shared_ptr<Query> &query, const json &j) {
  std::lock_guard lock(query->write_mutex);
  if (!query->in.is_open()) {
    spdlog::debug("[ClaudeCli] stdin closed, dropping {}", j.value("type", ""));
    return false;
  }

  std::string data = j.dump() + "\n";
  asio::error_code ec;
  asio::write(query->in, asio::buffer(data), ec);
  if (ec) {
    spdlog::warn("[ClaudeCli] Failed to write to CLI: {}", ec.message());
    return false;
  }
  return true;
}

void ClaudeCliService::close_stdin(const std::shared_ptr<Query> &query) {
  std::lock_guard lock(query->write_mutex);
  asio::error_code ec;
  query->in.close(ec);
}

void ClaudeCliService::finish(const std::shared_ptr<Query> &query, std::optional<std::string> error) {
  bool current = false;
  {
    std::lock_guard lock(mutex_);
    if (current_ == query) {
      current_.reset();
      current = true;
    }
  }

  std::optional<int> exit_status;
  bool still_running = false;
  {
    std::lock_guard lock(query->write_mutex);
    asio::error_code ec;
    query->in.close(ec);
    query->out.close(ec);
    query->err.close(ec);

    if (query->pid > 0) {
      int status = 0;
      if (waitpid(query->pid, &status, WNOHANG) == query->pid) {
        exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        query->pid = -1;
      }
    }
    still_running = query->pid > 0;
  }
  if (still_running) {
    terminate(query);
  }

  // Aborted queries report nothing
  if (!current || query->aborted) {
    return;
  }

  if (!error && !query->result_seen) {
    error = exit_status ? "Claude CLI exited before producing a result (status " + std::to_string(*exit_status) + ")"
                        : std::string("Claude CLI closed its output before producing a result");
  }

  if (error) {
    spdlog::error("[ClaudeCli] {}", *error);
    if (callbacks_.on_error) {
      callbacks_.on_error(*error);
    }
  } else {
    spdlog::info("[ClaudeCli] Query completed");
  }

  if (callbacks_.on_complete) {
    callbacks_.on_complete();
  }
}

void ClaudeCliService::terminate(const std::shared_ptr<Query> &query) {
  {
    std::lock_guard lock(query->write_mutex);
    if (query->pid <= 0) {
      return;
    }
    kill(query->pid, SIGTERM);
  }

  // Force kill if still running after the grace period
  query->kill_timer.expires_after(kKillGrace);
  query->kill_timer.async_wait([query](const asio::error_code &ec) {
    if (ec) {
      return;
    }
    std::lock_guard lock(query->write_mutex);
    if (query->pid <= 0) {
      return;
    }
    if (waitpid(query->pid, nullptr, WNOHANG) == 0) {
      kill(query->pid, SIGKILL);
      waitpid(query->pid, nullptr, 0);
    }
    query->pid = -1;
  });
}

}  // namespace tether::agent
