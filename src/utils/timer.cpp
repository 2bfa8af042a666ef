#include "timer.hpp"

#include <exception>

#include "logger.hpp"

namespace utils {

Timer::Timer() : nextTaskId_(1), running_(false) {}
Timer::~Timer() { stop(); }

Timer::TaskId Timer::addOnceTask(std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return push(TimerTask(0, execution_time, std::move(callback)));
}

Timer::TaskId Timer::addPeriodicTask(std::chrono::milliseconds delay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> callback) {
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return push(TimerTask(0, execution_time, std::move(callback), true, period));
}

Timer::TaskId Timer::push(TimerTask task) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  task.id = nextTaskId_++;
  TaskId id = task.id;
  pending_.insert(id);
  taskQueue_.push(std::move(task));
  tasksCv_.notify_one();
  return id;
}

bool Timer::cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  if (pending_.count(id) == 0) return false;
  cancelled_.insert(id);
  tasksCv_.notify_one();
  return true;
}

void Timer::start() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (running_) return;  // Already running
    running_ = true;
  }

  timerThread_ = std::thread([this]() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
      if (taskQueue_.empty()) {
        tasksCv_.wait(lock,
                      [this]() { return !taskQueue_.empty() || !running_; });
        continue;
      }

      auto now = std::chrono::steady_clock::now();
      auto nextTask = taskQueue_.top();

      if (cancelled_.erase(nextTask.id) > 0) {
        taskQueue_.pop();
        pending_.erase(nextTask.id);
        continue;
      }

      if (nextTask.execTimestamp <= now) {
        taskQueue_.pop();

        if (nextTask.isPeriodic && running_) {
          TimerTask again = nextTask;
          again.execTimestamp += again.period;
          taskQueue_.push(std::move(again));
        } else {
          pending_.erase(nextTask.id);
        }

        lock.unlock();  // Unlock before executing the callback
        try {
          nextTask.callback();
        } catch (const std::exception& e) {
          LOG(ERROR) << "[Timer] Exception in task " << nextTask.id << ": "
                     << e.what();
        }
        std::this_thread::yield();
        lock.lock();
      } else {
        auto deadline = nextTask.execTimestamp;
        auto id = nextTask.id;
        tasksCv_.wait_until(lock, deadline, [this, deadline, id]() {
          return !running_ || cancelled_.count(id) > 0 ||
                 (!taskQueue_.empty() &&
                  taskQueue_.top().execTimestamp < deadline);
        });
      }
    }
  });
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    tasksCv_.notify_all();  // Notify the thread to wake up and exit
  }

  if (timerThread_.joinable()) {
    timerThread_.join();
  }
}

}  // namespace utils
