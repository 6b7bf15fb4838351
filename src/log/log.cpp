#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

#include "core/config.hpp"

namespace tether {

namespace {

// 每次启动时轮转日志文件
// 策略：<stem>.log -> <stem>.0.log -> ... -> <stem>.{max_files-1}.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  // 如果当前日志文件不存在，无需轮转
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  const auto log_dir = current_log.parent_path();
  const auto stem = current_log.stem().string();
  auto backup = [&](size_t index) { return log_dir / (stem + "." + std::to_string(index) + ".log"); };

  std::error_code ec;

  // 删除最旧的日志文件
  fs::path oldest = backup(max_files - 1);
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  // 从后往前依次重命名
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = backup(static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, backup(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, backup(0), ec);
  if (ec) {
    std::cerr << "Failed to rotate log file: " << ec.message() << "\n";
  }
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level, bool console) {
  try {
    namespace fs = std::filesystem;

    // 确定日志目录和文件路径
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "tetherd.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true));
    if (console) {
      sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("tether", sinks.begin(), sinks.end());

    // 未知级别按 info 处理
    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // 设置日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志都立即刷新，避免缓存导致日志不及时
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("tether");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== tetherd started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace tether
