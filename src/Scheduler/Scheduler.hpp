#ifndef MEDIAGRAB_SCHEDULER_HPP_
#define MEDIAGRAB_SCHEDULER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "EventBus/EventBus.hpp"
#include "Job/Job.hpp"
#include "Transfer/CancelSignal.hpp"
#include "Transfer/TransferEngine.hpp"
#include "utils/timer.hpp"

namespace mediagrab {

class SchedulerError : public std::runtime_error {
 public:
  enum class Kind { DestinationUnwritable, DuplicateSubmission };

  SchedulerError(Kind kind, const std::string& detail);

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

const char* toString(SchedulerError::Kind kind);

struct SchedulerOptions {
  int maxConcurrency = 3;
  int maxRetries = 3;
  std::chrono::milliseconds retryBaseDelay{1000};
  std::chrono::milliseconds retryMaxDelay{60000};
  bool writeInfoJson = false;
};

// 第 n 次自动重试前的等待时间：min(base * 2^(n-1), max)
std::chrono::milliseconds retryDelay(const SchedulerOptions& options,
                                     int retryCount);

/**
 * @brief 任务表的唯一所有者，负责准入、并发上限和状态迁移
 *
 * 所有对任务表的修改都在同一把锁内完成，状态事件也在锁内发布，
 * 因此同一任务的事件顺序与状态迁移顺序一致。传输在 executor 提供的
 * 工作线程上执行，默认是 TBBManager 的 "transfer" arena。
 *
 * 占用的槽位按绑定的工作线程计数：被取消的任务在工作线程退出前仍占着槽位，
 * 所以任何时刻处于 Downloading 的任务数都不会超过 maxConcurrency。
 */
class Scheduler {
 public:
  using Executor = std::function<void(std::function<void()>)>;
  // 任务进入 Resolving 时调用，实现方解析完成后回调 attachVariant 或 failResolution
  using ResolutionHandler = std::function<void(
      JobId, const std::string& url, std::shared_ptr<const CancelSignal>)>;

  Scheduler(TransferEngine& engine, EventBus& bus, SchedulerOptions options,
            Executor executor = nullptr);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void setResolutionHandler(ResolutionHandler handler);

  // 变体已选定，任务直接进入 Queued；重复提交抛 SchedulerError
  JobId submit(const std::string& url, const MediaVariant& variant,
               const std::string& destinationDir,
               Priority priority = Priority::Normal);
  // 变体未定，任务进入 Resolving
  JobId submitUnresolved(const std::string& url,
                         const std::string& destinationDir,
                         Priority priority = Priority::Normal,
                         VariantPreference preference = VariantPreference());

  bool attachVariant(JobId id, const MediaVariant& variant);
  bool failResolution(JobId id, const std::string& reason);

  bool cancel(JobId id);
  bool pause(JobId id);
  bool resume(JobId id);
  bool retry(JobId id);
  bool remove(JobId id);
  bool setPriority(JobId id, Priority priority);

  // 立即生效；调低不会打断正在下载的任务
  void setConcurrency(int maxConcurrency);
  int concurrency() const;
  int concurrencyCeiling() const { return ceiling_; }
  int activeCount() const;

  // 按 id 排序的只读拷贝
  std::vector<Job> snapshot() const;
  std::optional<Job> get(JobId id) const;
  JobId nextJobId() const;

  // 启动时恢复任务表，必须在提交新任务之前调用
  void restore(std::vector<Job> jobs, JobId nextJobId);

  // 暂停所有传输、放弃所有解析，等待工作线程全部退出
  void shutdown();

 private:
  struct Entry {
    Job job;
    std::shared_ptr<CancelSignal> signal;  // 绑定工作线程或解析期间有效
    bool workerBound = false;
    bool removePending = false;
    bool restartNoted = false;  // 本次工作线程已记录过从 0 重新下载
    std::optional<TransferError::Kind> lastFailure;
    uint64_t queueSeq = 0;     // 在准入队列中时有效
    uint64_t retryToken = 0;   // 等待退避重试时非 0
    utils::Timer::TaskId retryTask = 0;
  };

  struct Launch {
    JobId id;
    std::shared_ptr<CancelSignal> signal;
  };

  struct Resolution {
    JobId id;
    std::string url;
    std::shared_ptr<CancelSignal> signal;
  };

  // 锁外执行的副作用
  struct Effects {
    std::vector<Launch> launches;
    std::vector<Resolution> resolutions;
    std::vector<std::string> filesToRemove;
    std::vector<Job> completed;
  };

  using QueueKey = std::tuple<int, uint64_t, JobId>;

  JobId createLocked(const std::string& url, const std::string& dir,
                     Priority priority);
  void checkDuplicateLocked(const std::string& url,
                            const std::string* formatId) const;
  void assignDestinationLocked(Entry& entry);
  void transitionLocked(Entry& entry, JobStatus next,
                        const std::string& message = "");
  void publishLocked(const Job& job, EventKind kind,
                     const std::string& message = "");
  void enqueueLocked(Entry& entry);
  void dequeueLocked(Entry& entry);
  void cancelRetryLocked(Entry& entry);
  void startResolutionLocked(Entry& entry, Effects& effects);
  void admitLocked(Effects& effects);
  void apply(Effects& effects);

  void runWorker(JobId id, std::shared_ptr<CancelSignal> signal);
  void onProgress(JobId id, const TransferProgress& progress);
  // 每次工作线程只重置一次进度，返回是否为首次
  bool noteRestartLocked(Entry& entry);
  void finishWorker(JobId id, const std::optional<TransferResult>& result,
                    const std::optional<TransferError>& error,
                    const std::string& unexpected);
  // 工作线程的最后一步，此后不再访问 Scheduler
  void releaseWorker();
  void scheduleRetryLocked(Entry& entry);
  void onRetryDue(JobId id, uint64_t token);

  TransferEngine& engine_;
  EventBus& bus_;
  SchedulerOptions options_;
  Executor executor_;
  ResolutionHandler resolutionHandler_;
  int ceiling_;

  std::map<JobId, Entry> jobs_;
  std::set<QueueKey> queue_;
  JobId nextJobId_ = 1;
  uint64_t nextQueueSeq_ = 1;
  uint64_t nextRetryToken_ = 1;
  int maxConcurrency_;
  int activeSlots_ = 0;
  int liveWorkers_ = 0;  // 尚未执行完 releaseWorker 的工作线程
  bool shuttingDown_ = false;

  utils::Timer timer_;
  mutable std::mutex mutex_;
  std::condition_variable idleCv_;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_SCHEDULER_HPP_
