#ifndef MEDIAGRAB_EVENT_BUS_HPP_
#define MEDIAGRAB_EVENT_BUS_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "Job/Job.hpp"

namespace mediagrab {

enum class EventKind { StatusChanged, Progress, Removed };

const char* toString(EventKind kind);

struct Event {
  EventKind kind = EventKind::StatusChanged;
  JobId jobId = 0;
  JobStatus status = JobStatus::Queued;
  uint64_t bytesDownloaded = 0;
  std::optional<uint64_t> bytesTotal;
  uint64_t bytesPerSecond = 0;
  std::string message;  // 失败原因等
  Clock::time_point timestamp;
  uint64_t sequence = 0;  // 总线内全局递增
};

struct EventFilter {
  std::optional<JobId> jobId;  // 为空表示所有任务
  bool includeProgress = true;

  bool matches(const Event& event) const;
};

/**
 * @brief 一个观察者的有界缓冲区
 *
 * 缓冲区满时先丢最旧的进度事件；状态事件永远不丢，必要时允许超出容量。
 * 没有可丢的进度事件时丢弃新到的进度事件，最新进度仍可以通过
 * EventBus::snapshot() 取到。
 */
class Subscription {
 public:
  Subscription(EventFilter filter, size_t capacity);
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  // 超时或已关闭且为空时返回 std::nullopt
  std::optional<Event> poll(std::chrono::milliseconds timeout);
  std::vector<Event> drain();

  uint64_t dropped() const;
  size_t pending() const;
  bool closed() const;
  const EventFilter& filter() const { return filter_; }

 private:
  friend class EventBus;

  void push(const Event& event);
  void close();

  const EventFilter filter_;
  const size_t capacity_;
  std::deque<Event> buffer_;
  uint64_t dropped_ = 0;
  bool closed_ = false;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

/**
 * @brief 把任务状态和进度分发给外部观察者
 *
 * publish 从不阻塞调用方（Scheduler 和传输线程）；每个观察者有自己的缓冲区，
 * 回调型观察者由各自的分发线程调用。同一任务的事件按发布顺序送达。
 */
class EventBus {
 public:
  using Observer = std::function<void(const Event&)>;
  using ObserverId = uint64_t;

  explicit EventBus(size_t defaultCapacity = 256);
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // capacity 为 0 时使用默认容量
  std::shared_ptr<Subscription> subscribe(EventFilter filter = EventFilter(),
                                          size_t capacity = 0);
  void unsubscribe(const std::shared_ptr<Subscription>& subscription);

  // 不要在观察者回调内部调用 removeObserver 移除自己以外的观察者
  ObserverId addObserver(Observer observer, EventFilter filter = EventFilter(),
                         size_t capacity = 0);
  void removeObserver(ObserverId id);

  void publish(Event event);

  // 每个任务最近一次的进度/状态
  std::vector<Event> snapshot() const;
  std::optional<Event> latest(JobId id) const;

  // 关闭所有订阅并等待分发线程退出
  void shutdown();

 private:
  struct ObserverEntry {
    std::shared_ptr<Subscription> subscription;
    std::thread thread;
  };

  void dispatchLoop(std::shared_ptr<Subscription> subscription,
                    Observer observer);

  const size_t defaultCapacity_;
  uint64_t nextSequence_ = 1;
  ObserverId nextObserverId_ = 1;
  std::vector<std::shared_ptr<Subscription>> subscriptions_;
  std::map<ObserverId, ObserverEntry> observers_;
  std::map<JobId, Event> latest_;
  mutable std::mutex mutex_;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_EVENT_BUS_HPP_
