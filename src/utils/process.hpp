#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace utils {

struct ProcessResult {
  int exitCode = -1;  // 被信号终止时为 -1
  std::string out;
  std::string err;
  bool timedOut = false;
  bool aborted = false;
};

/**
 * @brief 运行外部程序并收集 stdout/stderr
 *
 * 每 100ms 检查一次 shouldAbort 和超时，满足任一条件就 SIGKILL 子进程，
 * 函数总是等子进程退出后才返回。fork/pipe 失败抛 std::system_error；
 * exec 失败表现为退出码 127。
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         const std::function<bool()>& shouldAbort = nullptr);

}  // namespace utils
