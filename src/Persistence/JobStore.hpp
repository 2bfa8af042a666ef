#ifndef MEDIAGRAB_JOB_STORE_HPP_
#define MEDIAGRAB_JOB_STORE_HPP_

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "Job/Job.hpp"

namespace mediagrab {

class SystemError : public std::runtime_error {
 public:
  enum class Kind {
    PersistenceCorrupt,
    PersistenceUnavailable  // 状态文件无法写入
  };

  SystemError(Kind kind, const std::string& detail);

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

const char* toString(SystemError::Kind kind);

struct StoredState {
  JobId nextJobId = 1;
  std::vector<Job> jobs;
  size_t dropped = 0;  // 加载时因损坏丢弃的任务数
};

/**
 * @brief 任务表的 JSON 持久化
 *
 * 文件格式：{"version": 1, "nextJobId": N, "jobs": [...]}。
 * 写入先落到 `<path>.tmp` 再 rename，进程在任何时刻崩溃都只会留下
 * 旧文件或新文件之一。
 */
class JobStore {
 public:
  static constexpr int kFormatVersion = 1;

  explicit JobStore(std::string path);

  const std::string& path() const { return path_; }

  // 失败抛 SystemError{PersistenceUnavailable}
  void save(const std::vector<Job>& jobs, JobId nextJobId);

  /**
   * @brief 读取任务表，从不抛异常
   *
   * 文件不存在返回空表；整个文件无法解析时打 WARN 返回空表；
   * 单个任务损坏时打 WARN 丢弃该任务。Downloading / Resolving 的任务
   * 恢复为 Paused，等待用户恢复时重新校验磁盘上的分片。
   */
  StoredState load() const;

  static std::string serialize(const std::vector<Job>& jobs, JobId nextJobId);
  // 整个文档损坏时抛 SystemError{PersistenceCorrupt}
  static StoredState deserialize(const std::string& text);

 private:
  std::string path_;
  std::mutex saveMutex_;
};

// 在 `<finalPath>.info.json` 写下载信息，失败只记录日志
bool writeInfoSidecar(const Job& job, const std::string& finalPath);

}  // namespace mediagrab

#endif  // MEDIAGRAB_JOB_STORE_HPP_
