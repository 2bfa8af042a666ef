#ifndef MEDIAGRAB_DOWNLOADER_HPP_
#define MEDIAGRAB_DOWNLOADER_HPP_

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "EventBus/EventBus.hpp"
#include "Job/Job.hpp"
#include "Persistence/JobStore.hpp"
#include "Resolver/Resolver.hpp"
#include "Scheduler/Scheduler.hpp"
#include "Transfer/TransferEngine.hpp"
#include "utils/config.hpp"
#include "utils/timer.hpp"

namespace mediagrab {

/**
 * @brief 下载管理器的对外入口
 *
 * 拥有解析器、传输引擎、事件总线、调度器和持久化，生命周期由
 * start()/shutdown() 控制。URL 的解析在 TBB 的 "resolve" arena 中异步进行，
 * 解析完成后任务才进入准入队列。
 */
class Downloader {
 public:
  // 为空的组件使用默认实现（yt-dlp 解析器、libcurl 传输引擎）
  struct Components {
    std::unique_ptr<ResolverRegistry> registry;
    std::unique_ptr<TransferEngine> engine;
  };

  explicit Downloader(utils::Config config,
                      Components components = Components());
  ~Downloader();

  Downloader(const Downloader&) = delete;
  Downloader& operator=(const Downloader&) = delete;

  // 加载持久化的任务表并开始调度
  void start();
  // 暂停所有下载、保存任务表，之后不再接受新任务
  void shutdown();

  /**
   * @brief 提交一个 URL
   *
   * 不支持的 URL 立即抛 ResolutionError{NotSupported}；同一个 URL 已有未结束的
   * 任务时抛 SchedulerError{DuplicateSubmission}。其余解析错误体现在任务的
   * Failed 状态上。
   */
  JobId submit(const std::string& url,
               std::optional<VariantPreference> preference = std::nullopt,
               const std::string& destinationDir = "",
               Priority priority = Priority::Normal);

  // 同步展开播放列表，逐项提交；已存在或不支持的条目被跳过
  std::vector<JobId> submitPlaylist(
      const std::string& url,
      std::optional<VariantPreference> preference = std::nullopt,
      const std::string& destinationDir = "",
      Priority priority = Priority::Normal, size_t maxEntries = 100);

  bool pause(JobId id);
  bool resume(JobId id);
  bool cancel(JobId id);
  bool retry(JobId id);
  bool remove(JobId id);
  bool setPriority(JobId id, Priority priority);
  void setConcurrency(int maxConcurrency);

  std::vector<Job> list() const;
  std::optional<Job> get(JobId id) const;
  std::shared_ptr<Subscription> subscribe(EventFilter filter = EventFilter());
  void unsubscribe(const std::shared_ptr<Subscription>& subscription);
  // 每个任务最近一次的进度
  std::vector<Event> progressSnapshot() const;

  // 没有配置 state_file 时直接返回 true
  bool saveState();

 private:
  void resolveJob(JobId id, const std::string& url,
                  std::shared_ptr<const CancelSignal> signal);
  VariantPreference defaultPreference() const;

  utils::Config config_;
  std::unique_ptr<ResolverRegistry> registry_;
  std::unique_ptr<TransferEngine> engine_;
  EventBus bus_;
  std::unique_ptr<JobStore> store_;
  std::unique_ptr<Scheduler> scheduler_;
  utils::Timer autosave_;
  EventBus::ObserverId persistObserver_ = 0;

  std::mutex resolveMutex_;
  std::condition_variable resolveCv_;
  int pendingResolutions_ = 0;

  bool started_ = false;
  bool stopped_ = false;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_DOWNLOADER_HPP_
