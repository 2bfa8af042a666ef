#ifndef TBB_MANAGER_HPP_
#define TBB_MANAGER_HPP_

#include <gflags/gflags.h>
#include <tbb/tbb.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "logger.hpp"

DECLARE_string(custom_tbb_parallel_control);

namespace utils {

struct TBBState {
  bool initialized = false;
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
};

/**
 * @brief TBB任务管理器，按名称管理arena
 *
 * 每个 arena 的并发度来自 --custom_tbb_parallel_control（如 "transfer:8"），
 * 未配置时使用调用方给出的默认值。arena 中的任务允许阻塞在网络 I/O 上，
 * 因此会同步放宽 TBB 的全局并行度上限，保证每个 arena 都能拿到足够的线程。
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name,
                                        int default_concurrency = 0);

  // 异步执行一个任务，异常在任务内部记录日志，不会传播到 TBB
  void Enqueue(const std::string& tbb_name, std::function<void()> task);

  int Concurrency(const std::string& tbb_name);

  void Release();
  ~TBBManager();

  static std::map<std::string, int> ParseParallelControl(
      const std::string& cfg);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId();
  void UpdateGlobalParallelismLocked();

  std::unordered_map<std::string, TBBState> task_arenas_;
  std::unique_ptr<tbb::global_control> parallelism_;
  std::atomic<uint64_t> task_id_{0};

  mutable std::mutex arenas_mutex_;
};

}  // namespace utils

#endif  // TBB_MANAGER_HPP_
