#ifndef MEDIAGRAB_JOB_HPP_
#define MEDIAGRAB_JOB_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "Resolver/MediaVariant.hpp"

namespace mediagrab {

using JobId = uint64_t;
using Clock = std::chrono::system_clock;

enum class JobStatus {
  Queued,
  Resolving,
  Downloading,
  Paused,
  Completed,
  Failed,
  Cancelled
};

// 数值越小越先被调度
enum class Priority { High = 0, Normal = 1, Low = 2 };

const char* toString(JobStatus status);
const char* toString(Priority priority);
std::optional<JobStatus> parseStatus(const std::string& name);
std::optional<Priority> parsePriority(const std::string& name);

std::ostream& operator<<(std::ostream& os, JobStatus status);
std::ostream& operator<<(std::ostream& os, Priority priority);

// Completed / Failed / Cancelled
bool isTerminal(JobStatus status);

/**
 * @brief 状态机允许的边
 *
 * Queued      -> Downloading | Paused | Failed | Cancelled
 * Resolving   -> Queued | Failed | Cancelled
 * Downloading -> Completed | Paused | Failed | Cancelled | Queued(自动重试)
 * Paused      -> Queued | Resolving(尚未选定变体) | Cancelled
 * Failed      -> Queued | Resolving(显式重试)
 */
bool canTransition(JobStatus from, JobStatus to);

/**
 * @brief 一个用户请求的下载：一个 URL，一个选定的变体
 *
 * 只由 Scheduler 的任务表持有；其他地方拿到的都是拷贝。
 */
struct Job {
  JobId id = 0;
  std::string sourceUrl;
  std::optional<MediaVariant> selectedVariant;
  VariantPreference preference;
  std::string destinationDir;
  std::string destinationPath;  // 选定变体后确定
  std::string stagingPath;      // destinationPath + ".<id>.part"
  JobStatus status = JobStatus::Queued;
  uint64_t bytesDownloaded = 0;
  std::optional<uint64_t> bytesTotal;
  Clock::time_point createdAt;
  Clock::time_point updatedAt;
  int retryCount = 0;
  std::optional<std::string> lastError;
  Priority priority = Priority::Normal;
  bool restartedFromZero = false;
  // 因关闭或异常退出而停在 Paused，区别于用户主动暂停
  bool interrupted = false;

  // 非法的边抛 std::logic_error
  void transitionTo(JobStatus next);

  /**
   * @brief 更新进度
   *
   * bytesDownloaded 只增不减，bytesTotal 一旦确定不再改变。
   * @return 是否有字段发生变化
   */
  bool applyProgress(uint64_t bytes, std::optional<uint64_t> total);

  // 唯一允许 bytesDownloaded 回到 0 的入口（源不支持断点续传或本地分片损坏）
  void resetProgress();

  std::string title() const;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_JOB_HPP_
