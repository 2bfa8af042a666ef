#include "EventBus/EventBus.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using mediagrab::Event;
using mediagrab::EventBus;
using mediagrab::EventFilter;
using mediagrab::EventKind;
using mediagrab::JobStatus;

namespace {

Event progress(mediagrab::JobId id, uint64_t bytes) {
  Event e;
  e.kind = EventKind::Progress;
  e.jobId = id;
  e.status = JobStatus::Downloading;
  e.bytesDownloaded = bytes;
  return e;
}

Event status(mediagrab::JobId id, JobStatus s) {
  Event e;
  e.kind = EventKind::StatusChanged;
  e.jobId = id;
  e.status = s;
  return e;
}

}  // namespace

TEST(EventBusTest, FilterByJobAndKind) {
  EventBus bus;
  EventFilter onlyJob2;
  onlyJob2.jobId = 2;
  auto job2 = bus.subscribe(onlyJob2);
  EventFilter statusOnly;
  statusOnly.includeProgress = false;
  auto statuses = bus.subscribe(statusOnly);

  bus.publish(progress(1, 10));
  bus.publish(progress(2, 20));
  bus.publish(status(1, JobStatus::Completed));

  auto got = job2->drain();
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].bytesDownloaded, 20u);

  got = statuses->drain();
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].status, JobStatus::Completed);
}

TEST(EventBusTest, OverflowDropsProgressButNeverStatus) {
  EventBus bus;
  auto sub = bus.subscribe(EventFilter(), 3);

  bus.publish(status(1, JobStatus::Downloading));
  for (uint64_t i = 1; i <= 5; ++i) bus.publish(progress(1, i * 100));
  bus.publish(status(1, JobStatus::Completed));

  auto got = sub->drain();
  EXPECT_GT(sub->dropped(), 0u);
  ASSERT_GE(got.size(), 2u);
  EXPECT_EQ(got.front().kind, EventKind::StatusChanged);
  EXPECT_EQ(got.front().status, JobStatus::Downloading);
  EXPECT_EQ(got.back().kind, EventKind::StatusChanged);
  EXPECT_EQ(got.back().status, JobStatus::Completed);

  // 被保留的事件仍按发布顺序排列
  for (size_t i = 1; i < got.size(); ++i) {
    EXPECT_LT(got[i - 1].sequence, got[i].sequence);
  }
}

TEST(EventBusTest, StatusEventsMayExceedCapacity) {
  EventBus bus;
  auto sub = bus.subscribe(EventFilter(), 2);
  for (mediagrab::JobId id = 1; id <= 4; ++id) {
    bus.publish(status(id, JobStatus::Queued));
  }
  EXPECT_EQ(sub->pending(), 4u);
  EXPECT_EQ(sub->dropped(), 0u);
}

TEST(EventBusTest, SnapshotKeepsLatestPerJob) {
  EventBus bus;
  bus.publish(progress(1, 100));
  bus.publish(progress(1, 200));
  bus.publish(progress(2, 50));

  EXPECT_EQ(bus.snapshot().size(), 2u);
  auto latest = bus.latest(1);
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->bytesDownloaded, 200u);

  Event removed;
  removed.kind = EventKind::Removed;
  removed.jobId = 1;
  bus.publish(removed);
  EXPECT_FALSE(bus.latest(1).has_value());
  EXPECT_EQ(bus.snapshot().size(), 1u);
}

TEST(EventBusTest, ObserverSeesEventsInOrder) {
  EventBus bus;
  std::mutex mutex;
  std::vector<uint64_t> seen;
  auto id = bus.addObserver([&](const Event& e) {
    std::lock_guard<std::mutex> lock(mutex);
    seen.push_back(e.bytesDownloaded);
  });

  for (uint64_t i = 1; i <= 20; ++i) bus.publish(progress(7, i));
  // removeObserver 会先把缓冲区剩下的事件交付完
  bus.removeObserver(id);

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQ(seen.size(), 20u);
  for (size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(seen[i], i + 1);
}

TEST(EventBusTest, ThrowingObserverKeepsReceiving) {
  EventBus bus;
  std::atomic<int> calls{0};
  bus.addObserver([&calls](const Event&) {
    ++calls;
    throw std::runtime_error("observer bug");
  });
  bus.publish(status(1, JobStatus::Queued));
  bus.publish(status(1, JobStatus::Downloading));
  bus.shutdown();
  EXPECT_EQ(calls.load(), 2);
}

TEST(EventBusTest, PollTimesOutAndClosesOnUnsubscribe) {
  EventBus bus;
  auto sub = bus.subscribe();
  EXPECT_FALSE(sub->poll(10ms).has_value());
  bus.unsubscribe(sub);
  EXPECT_TRUE(sub->closed());
  bus.publish(status(1, JobStatus::Queued));
  EXPECT_EQ(sub->pending(), 0u);
}
