#include "Persistence/JobStore.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace mediagrab;

namespace {

class JobStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("mediagrab_store_" + std::to_string(::getpid()));
    fs::create_directories(dir_);
    path_ = (dir_ / "state" / "jobs.json").string();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  Job pausedJob(JobId id) {
    Job job;
    job.id = id;
    job.sourceUrl = "https://youtu.be/" + std::to_string(id);
    MediaVariant variant;
    variant.sourceUrl = job.sourceUrl;
    variant.formatId = "22";
    variant.container = "mp4";
    variant.resolutionLabel = "720p";
    variant.height = 720;
    variant.estimatedSizeBytes = 2000000;
    variant.title = "Clip " + std::to_string(id);
    variant.fetch.url = "https://cdn/" + std::to_string(id);
    variant.fetch.headers["Referer"] = "https://www.youtube.com/";
    variant.fetch.cookies = "SID=1";
    job.selectedVariant = variant;
    job.preference.resolution = "720p";
    job.destinationDir = (dir_ / "out").string();
    job.destinationPath = job.destinationDir + "/Clip.mp4";
    job.stagingPath = job.destinationPath + "." + std::to_string(id) + ".part";
    job.status = JobStatus::Paused;
    job.bytesDownloaded = 500000;
    job.bytesTotal = 2000000;
    job.createdAt = Clock::time_point(std::chrono::milliseconds(1700000000000));
    job.updatedAt = Clock::time_point(std::chrono::milliseconds(1700000005000));
    job.retryCount = 1;
    job.lastError = "network error: reset";
    job.priority = Priority::High;
    return job;
  }

  void writeState(const std::string& text) {
    fs::create_directories(fs::path(path_).parent_path());
    std::ofstream(path_) << text;
  }

  fs::path dir_;
  std::string path_;
};

}  // namespace

TEST_F(JobStoreTest, PausedJobSurvivesRestart) {
  JobStore store(path_);
  store.save({pausedJob(4)}, 5);
  EXPECT_FALSE(fs::exists(path_ + ".tmp"));

  StoredState state = JobStore(path_).load();
  ASSERT_EQ(state.jobs.size(), 1u);
  EXPECT_EQ(state.nextJobId, 5u);
  EXPECT_EQ(state.dropped, 0u);

  const Job& job = state.jobs[0];
  Job expected = pausedJob(4);
  EXPECT_EQ(job.id, 4u);
  EXPECT_EQ(job.status, JobStatus::Paused);
  // 用户主动暂停的任务不会被当作中断
  EXPECT_FALSE(job.interrupted);
  EXPECT_EQ(job.bytesDownloaded, 500000u);
  EXPECT_EQ(job.bytesTotal.value(), 2000000u);
  EXPECT_EQ(job.stagingPath, expected.stagingPath);
  EXPECT_EQ(job.destinationPath, expected.destinationPath);
  EXPECT_EQ(job.priority, Priority::High);
  EXPECT_EQ(job.retryCount, 1);
  EXPECT_EQ(job.lastError.value(), "network error: reset");
  EXPECT_EQ(job.createdAt, expected.createdAt);
  EXPECT_EQ(job.preference.resolution, "720p");
  ASSERT_TRUE(job.selectedVariant.has_value());
  EXPECT_EQ(job.selectedVariant->fetch.url, "https://cdn/4");
  EXPECT_EQ(job.selectedVariant->fetch.headers.at("Referer"),
            "https://www.youtube.com/");
  EXPECT_EQ(job.selectedVariant->fetch.cookies, "SID=1");
  EXPECT_EQ(job.selectedVariant->estimatedSizeBytes.value(), 2000000u);
}

TEST_F(JobStoreTest, InFlightJobsComeBackPaused) {
  Job downloading = pausedJob(1);
  downloading.status = JobStatus::Downloading;
  Job resolving;
  resolving.id = 2;
  resolving.sourceUrl = "https://pin.it/x";
  resolving.status = JobStatus::Resolving;
  Job done = pausedJob(3);
  done.status = JobStatus::Completed;

  auto state = JobStore::deserialize(
      JobStore::serialize({downloading, resolving, done}, 4));
  ASSERT_EQ(state.jobs.size(), 3u);
  EXPECT_EQ(state.jobs[0].status, JobStatus::Paused);
  EXPECT_TRUE(state.jobs[0].interrupted);
  EXPECT_EQ(state.jobs[0].bytesDownloaded, 500000u);
  EXPECT_EQ(state.jobs[1].status, JobStatus::Paused);
  EXPECT_TRUE(state.jobs[1].interrupted);
  EXPECT_FALSE(state.jobs[1].selectedVariant.has_value());
  EXPECT_EQ(state.jobs[2].status, JobStatus::Completed);
}

TEST_F(JobStoreTest, CorruptEntriesAreDropped) {
  nlohmann::json doc = nlohmann::json::parse(JobStore::serialize({pausedJob(1)}, 2));
  doc["jobs"].push_back({{"id", 9}, {"url", "https://youtu.be/9"}, {"status", "Sleeping"}});
  doc["jobs"].push_back({{"url", "https://youtu.be/10"}});
  doc["jobs"].push_back("not an object");
  doc["jobs"].push_back(doc["jobs"][0]);  // 重复 id
  writeState(doc.dump());

  StoredState state = JobStore(path_).load();
  ASSERT_EQ(state.jobs.size(), 1u);
  EXPECT_EQ(state.jobs[0].id, 1u);
  EXPECT_EQ(state.dropped, 4u);
}

TEST_F(JobStoreTest, UnreadableFileLoadsEmpty) {
  EXPECT_TRUE(JobStore(path_).load().jobs.empty());

  writeState("{\"jobs\": [trunc");
  StoredState state = JobStore(path_).load();
  EXPECT_TRUE(state.jobs.empty());
  EXPECT_EQ(state.nextJobId, 1u);

  EXPECT_THROW(JobStore::deserialize("[]"), SystemError);
  EXPECT_THROW(JobStore::deserialize("{\"version\": 1}"), SystemError);
}

TEST_F(JobStoreTest, NextIdNeverReusesStoredIds) {
  auto state = JobStore::deserialize(JobStore::serialize({pausedJob(12)}, 3));
  EXPECT_EQ(state.nextJobId, 13u);
}

TEST_F(JobStoreTest, SaveFailsWhenDirectoryIsAFile) {
  std::ofstream(dir_ / "blocker") << "x";
  JobStore store((dir_ / "blocker" / "jobs.json").string());
  try {
    store.save({pausedJob(1)}, 2);
    FAIL() << "expected SystemError";
  } catch (const SystemError& e) {
    EXPECT_EQ(e.kind(), SystemError::Kind::PersistenceUnavailable);
  }
}

TEST_F(JobStoreTest, SaveReplacesPreviousStateCompletely) {
  JobStore store(path_);
  store.save({pausedJob(1), pausedJob(2)}, 3);
  // 新表更短，旧内容不能残留在文件尾部
  store.save({pausedJob(2)}, 7);
  EXPECT_FALSE(fs::exists(path_ + ".tmp"));

  std::ifstream in(path_);
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(text, JobStore::serialize({pausedJob(2)}, 7));

  StoredState state = JobStore(path_).load();
  ASSERT_EQ(state.jobs.size(), 1u);
  EXPECT_EQ(state.jobs[0].id, 2u);
  EXPECT_EQ(state.nextJobId, 7u);
}

TEST_F(JobStoreTest, WritesInfoSidecar) {
  Job job = pausedJob(1);
  job.status = JobStatus::Completed;
  std::string finalPath = (dir_ / "Clip.mp4").string();
  ASSERT_TRUE(writeInfoSidecar(job, finalPath));

  std::ifstream in(finalPath + ".info.json");
  auto info = nlohmann::json::parse(std::string(std::istreambuf_iterator<char>(in),
                                                std::istreambuf_iterator<char>()));
  EXPECT_EQ(info["url"], "https://youtu.be/1");
  EXPECT_EQ(info["title"], "Clip 1");
  EXPECT_EQ(info["resolution"], "720p");
  EXPECT_EQ(info["bytes"], 500000);
}
