#include "Job/Job.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using mediagrab::Job;
using mediagrab::JobStatus;
using mediagrab::Priority;

TEST(JobTest, FollowsDownloadLifecycle) {
  Job job;
  job.id = 7;
  EXPECT_EQ(job.status, JobStatus::Queued);
  job.transitionTo(JobStatus::Downloading);
  job.transitionTo(JobStatus::Paused);
  job.transitionTo(JobStatus::Queued);
  job.transitionTo(JobStatus::Downloading);
  job.transitionTo(JobStatus::Completed);
  EXPECT_TRUE(mediagrab::isTerminal(job.status));
}

TEST(JobTest, RejectsIllegalTransitions) {
  Job job;
  job.transitionTo(JobStatus::Downloading);
  job.transitionTo(JobStatus::Completed);
  EXPECT_THROW(job.transitionTo(JobStatus::Queued), std::logic_error);
  EXPECT_THROW(job.transitionTo(JobStatus::Cancelled), std::logic_error);
  EXPECT_EQ(job.status, JobStatus::Completed);

  Job paused;
  paused.transitionTo(JobStatus::Paused);
  // 恢复必须重新经过准入
  EXPECT_FALSE(mediagrab::canTransition(JobStatus::Paused, JobStatus::Downloading));
  EXPECT_THROW(paused.transitionTo(JobStatus::Downloading), std::logic_error);
}

TEST(JobTest, FailedCanOnlyBeRetried) {
  EXPECT_TRUE(mediagrab::canTransition(JobStatus::Failed, JobStatus::Queued));
  EXPECT_TRUE(mediagrab::canTransition(JobStatus::Failed, JobStatus::Resolving));
  EXPECT_FALSE(mediagrab::canTransition(JobStatus::Failed, JobStatus::Cancelled));
  EXPECT_FALSE(mediagrab::canTransition(JobStatus::Failed, JobStatus::Downloading));
}

TEST(JobTest, EveryNonTerminalStateCanBeCancelled) {
  for (JobStatus s : {JobStatus::Queued, JobStatus::Resolving,
                      JobStatus::Downloading, JobStatus::Paused}) {
    EXPECT_TRUE(mediagrab::canTransition(s, JobStatus::Cancelled)) << s;
  }
}

TEST(JobTest, ProgressIsMonotonicAndTotalIsImmutable) {
  Job job;
  EXPECT_TRUE(job.applyProgress(1000, std::nullopt));
  EXPECT_TRUE(job.applyProgress(2000, 10000));
  EXPECT_FALSE(job.applyProgress(1500, std::nullopt));
  EXPECT_EQ(job.bytesDownloaded, 2000u);
  job.applyProgress(3000, 20000);
  EXPECT_EQ(job.bytesTotal.value(), 10000u);
  EXPECT_EQ(job.bytesDownloaded, 3000u);
}

TEST(JobTest, ResetProgressIsTheOnlyWayBack) {
  Job job;
  job.applyProgress(5000, 8000);
  job.resetProgress();
  EXPECT_EQ(job.bytesDownloaded, 0u);
  EXPECT_TRUE(job.restartedFromZero);
  EXPECT_EQ(job.bytesTotal.value(), 8000u);
}

TEST(JobTest, ParsesNamesBack) {
  EXPECT_EQ(mediagrab::parseStatus("Paused"), JobStatus::Paused);
  EXPECT_FALSE(mediagrab::parseStatus("paused-ish").has_value());
  EXPECT_EQ(mediagrab::parsePriority("High"), Priority::High);
  EXPECT_FALSE(mediagrab::parsePriority("Urgent").has_value());
}

TEST(JobTest, TitleFallsBackToUrl) {
  Job job;
  job.sourceUrl = "https://youtu.be/abc";
  EXPECT_EQ(job.title(), "https://youtu.be/abc");
  mediagrab::MediaVariant variant;
  variant.title = "Clip";
  job.selectedVariant = variant;
  EXPECT_EQ(job.title(), "Clip");
}
