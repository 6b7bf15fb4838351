#pragma once

#include <sys/types.h>

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "agent/agent_service.hpp"

namespace tether::agent {

// AgentService backed by the `claude` CLI in stream-json mode.
// One CLI process per query; the conversation id captured at init resumes the next one.
// Tool permission prompts arrive as `can_use_tool` control requests on stdout and are
// answered with control responses on stdin.
class ClaudeCliService : public AgentService, public std::enable_shared_from_this<ClaudeCliService> {
 public:
  static std::shared_ptr<ClaudeCliService> create(asio::io_context &io_ctx, const AgentServiceOptions &options,
                                                  AgentServiceCallbacks callbacks);

  ~ClaudeCliService() override;

  std::string name() const override {
    return "claude-cli";
  }

  void start(const std::string &prompt) override;
  void abort() override;
  void set_permission_mode(PermissionMode mode) override;
  bool is_active() const override;
  std::optional<std::string> conversation_id() const override;

  // Command line for one query (without the executable itself)
  static std::vector<std::string> build_args(const AgentServiceOptions &options, const std::optional<std::string> &resume_id,
                                             PermissionMode mode);

  // Wire messages
  static json make_user_message(const std::string &prompt);
  static json make_permission_response(const std::string &request_id, const permission::PermissionResult &result);
  static json make_control_request(const std::string &request_id, const json &request);

 private:
  ClaudeCliService(asio::io_context &io_ctx, const AgentServiceOptions &options, AgentServiceCallbacks callbacks);

  // A running CLI process and its pipes
  struct Query {
    explicit Query(asio::io_context &io) : in(io), out(io), err(io), kill_timer(io) {}

    pid_t pid = -1;
    asio::posix::stream_descriptor in;
    asio::posix::stream_descriptor out;
    asio::posix::stream_descriptor err;
    asio::streambuf out_buf;
    asio::streambuf err_buf;
    asio::steady_timer kill_timer;
    std::mutex write_mutex;

    bool result_seen = false;
    bool restore_bypass = false;
    std::atomic<bool> aborted{false};
  };

  // A can_use_tool request waiting for its decision
  struct PermissionWait {
    PermissionWait(asio::io_context &io, std::string request_id, std::string tool_name,
                   std::future<permission::PermissionResult> future)
        : request_id(std::move(request_id)), tool_name(std::move(tool_name)), future(std::move(future)), timer(io) {}

    std::string request_id;
    std::string tool_name;
    std::future<permission::PermissionResult> future;
    asio::steady_timer timer;
  };

  // Child pid, or why the process could not be started
  Result<pid_t> spawn(const std::shared_ptr<Query> &query, const std::vector<std::string> &args);

  void read_stdout(std::shared_ptr<Query> query);
  void read_stderr(std::shared_ptr<Query> query);

  void handle_line(const std::shared_ptr<Query> &query, const std::string &line);
  void dispatch_line(const std::shared_ptr<Query> &query, const json &j);
  void handle_control_request(const std::shared_ptr<Query> &query, const json &j);
  void poll_permission(const std::shared_ptr<Query> &query, const std::shared_ptr<PermissionWait> &wait);

  bool write_line(const std::shared_ptr<Query> &query, const json &j);
  void close_stdin(const std::shared_ptr<Query> &query);

  // Reap the process and report the outcome to callbacks
  void finish(const std::shared_ptr<Query> &query, std::optional<std::string> error);
  void terminate(const std::shared_ptr<Query> &query);

  asio::io_context &io_ctx_;
  AgentServiceCallbacks callbacks_;

  mutable std::mutex mutex_;
  AgentServiceOptions options_;
  std::shared_ptr<Query> current_;
  std::optional<std::string> conversation_id_;
};

}  // namespace tether::agent
