#ifndef TETHER_LOG_H
#define TETHER_LOG_H

#include <cstddef>
#include <string>

namespace tether {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动 tetherd 时，当前的 tetherd.log 会被清空
 * - 上次的日志重命名为 tetherd.0.log
 * - 历史日志依次向后移动：tetherd.0.log -> tetherd.1.log -> ... -> tetherd.9.log
 * - 最旧的日志（tetherd.9.log）被删除
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/tether/log/tetherd.log）
 * @param max_files 保留的历史日志文件数量，默认 10 个
 * @param level 日志级别，默认 info
 * @param console 同时输出到 stderr（前台运行时使用）
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info", bool console = false);

}  // namespace tether

#endif  // TETHER_LOG_H
