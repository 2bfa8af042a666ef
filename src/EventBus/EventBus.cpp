#include "EventBus.hpp"

#include <algorithm>
#include <exception>

#include "utils/logger.hpp"

namespace mediagrab {

const char* toString(EventKind kind) {
  switch (kind) {
    case EventKind::StatusChanged:
      return "StatusChanged";
    case EventKind::Progress:
      return "Progress";
    case EventKind::Removed:
      return "Removed";
  }
  return "Unknown";
}

bool EventFilter::matches(const Event& event) const {
  if (jobId && *jobId != event.jobId) return false;
  if (!includeProgress && event.kind == EventKind::Progress) return false;
  return true;
}

Subscription::Subscription(EventFilter filter, size_t capacity)
    : filter_(std::move(filter)), capacity_(std::max<size_t>(1, capacity)) {}

void Subscription::push(const Event& event) {
  if (!filter_.matches(event)) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    if (buffer_.size() >= capacity_) {
      auto oldest = std::find_if(buffer_.begin(), buffer_.end(), [](const Event& e) {
        return e.kind == EventKind::Progress;
      });
      if (oldest != buffer_.end()) {
        LOG(DEBUG) << "[EventBus] Buffer full, dropping progress of job "
                   << oldest->jobId;
        buffer_.erase(oldest);
        ++dropped_;
      } else if (event.kind == EventKind::Progress) {
        LOG(DEBUG) << "[EventBus] Buffer full of status events, dropping "
                      "progress of job "
                   << event.jobId;
        ++dropped_;
        return;
      }
    }
    buffer_.push_back(event);
  }
  cv_.notify_one();
}

std::optional<Event> Subscription::poll(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return !buffer_.empty() || closed_; });
  if (buffer_.empty()) return std::nullopt;
  Event event = std::move(buffer_.front());
  buffer_.pop_front();
  return event;
}

std::vector<Event> Subscription::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Event> events(std::make_move_iterator(buffer_.begin()),
                            std::make_move_iterator(buffer_.end()));
  buffer_.clear();
  return events;
}

uint64_t Subscription::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

size_t Subscription::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void Subscription::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

EventBus::EventBus(size_t defaultCapacity)
    : defaultCapacity_(std::max<size_t>(1, defaultCapacity)) {}

EventBus::~EventBus() { shutdown(); }

std::shared_ptr<Subscription> EventBus::subscribe(EventFilter filter,
                                                  size_t capacity) {
  auto subscription = std::make_shared<Subscription>(
      std::move(filter), capacity == 0 ? defaultCapacity_ : capacity);
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.push_back(subscription);
  return subscription;
}

void EventBus::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(
        std::remove(subscriptions_.begin(), subscriptions_.end(), subscription),
        subscriptions_.end());
  }
  if (subscription) subscription->close();
}

EventBus::ObserverId EventBus::addObserver(Observer observer,
                                           EventFilter filter,
                                           size_t capacity) {
  auto subscription = subscribe(std::move(filter), capacity);
  std::lock_guard<std::mutex> lock(mutex_);
  ObserverId id = nextObserverId_++;
  ObserverEntry& entry = observers_[id];
  entry.subscription = subscription;
  entry.thread = std::thread(&EventBus::dispatchLoop, this, subscription,
                             std::move(observer));
  return id;
}

void EventBus::removeObserver(ObserverId id) {
  ObserverEntry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = observers_.find(id);
    if (it == observers_.end()) return;
    entry = std::move(it->second);
    observers_.erase(it);
  }
  unsubscribe(entry.subscription);
  if (!entry.thread.joinable()) return;
  if (entry.thread.get_id() == std::this_thread::get_id()) {
    entry.thread.detach();
  } else {
    entry.thread.join();
  }
}

void EventBus::dispatchLoop(std::shared_ptr<Subscription> subscription,
                            Observer observer) {
  while (true) {
    auto event = subscription->poll(std::chrono::milliseconds(200));
    // 关闭后 poll 仍会先交付缓冲区里剩下的事件
    if (!event) {
      if (subscription->closed()) break;
      continue;
    }
    try {
      observer(*event);
    } catch (const std::exception& e) {
      LOG(ERROR) << "[EventBus] Observer failed on " << toString(event->kind)
                 << " of job " << event->jobId << ": " << e.what();
    }
  }
}

void EventBus::publish(Event event) {
  size_t delivered = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    event.sequence = nextSequence_++;
    if (event.timestamp == Clock::time_point()) event.timestamp = Clock::now();
    if (event.kind == EventKind::Removed) {
      latest_.erase(event.jobId);
    } else {
      latest_[event.jobId] = event;
    }
    // 在锁内投递，保证同一任务的事件在每个缓冲区中保持发布顺序
    for (const auto& subscription : subscriptions_) subscription->push(event);
    delivered = subscriptions_.size();
  }
  if (event.kind != EventKind::Progress) {
    LOG(DEBUG) << "[EventBus] " << toString(event.kind) << " job "
               << event.jobId << " -> " << event.status << " delivered to "
               << delivered << " subscribers";
  }
}

std::vector<Event> EventBus::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Event> events;
  events.reserve(latest_.size());
  for (const auto& kv : latest_) events.push_back(kv.second);
  return events;
}

std::optional<Event> EventBus::latest(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = latest_.find(id);
  if (it == latest_.end()) return std::nullopt;
  return it->second;
}

void EventBus::shutdown() {
  std::map<ObserverId, ObserverEntry> observers;
  std::vector<std::shared_ptr<Subscription>> subscriptions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observers.swap(observers_);
    subscriptions.swap(subscriptions_);
  }
  for (auto& subscription : subscriptions) subscription->close();
  for (auto& kv : observers) {
    if (!kv.second.thread.joinable()) continue;
    if (kv.second.thread.get_id() == std::this_thread::get_id()) {
      kv.second.thread.detach();
    } else {
      kv.second.thread.join();
    }
  }
}

}  // namespace mediagrab
