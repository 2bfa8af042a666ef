#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>

namespace utils {
class Timer {
 public:
  using TaskId = uint64_t;

  struct TimerTask {
    TaskId id;
    std::chrono::steady_clock::time_point execTimestamp;
    std::function<void()> callback;
    bool isPeriodic;
    std::chrono::milliseconds period;

    TimerTask(
        TaskId taskId, std::chrono::steady_clock::time_point execTime,
        std::function<void()> cb, bool periodic = false,
        std::chrono::milliseconds periodDuration = std::chrono::milliseconds(0))
        : id(taskId),
          execTimestamp(execTime),
          callback(std::move(cb)),
          isPeriodic(periodic),
          period(periodDuration) {}
    bool operator>(const TimerTask& other) const {
      return execTimestamp > other.execTimestamp;
    }
  };

  explicit Timer();
  ~Timer();

  TaskId addOnceTask(std::chrono::milliseconds delay,
                     std::function<void()> callback);
  TaskId addPeriodicTask(std::chrono::milliseconds delay,
                         std::chrono::milliseconds period,
                         std::function<void()> callback);
  // 尚未执行的任务被丢弃；正在执行的回调不受影响。
  // 任务已执行过或不存在时返回 false
  bool cancel(TaskId id);
  void start();
  void stop();

 private:
  TaskId push(TimerTask task);

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  std::unordered_set<TaskId> pending_;  // 仍在 taskQueue_ 中的任务
  std::unordered_set<TaskId> cancelled_;
  TaskId nextTaskId_;
  std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  bool running_;
};
}  // namespace utils
