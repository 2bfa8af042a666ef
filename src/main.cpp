#include <gflags/gflags.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "Downloader/Downloader.hpp"
#include "utils/config.hpp"
#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

DEFINE_bool(playlist, false, "Treat every URL as a playlist and queue its entries");
DEFINE_int32(playlist_max_entries, 100, "Maximum entries taken from a playlist");
DEFINE_string(priority, "Normal", "High, Normal or Low");
DEFINE_bool(resume_paused, false,
            "Also resume jobs the user paused; interrupted jobs always resume");

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onSignal(int) { g_interrupted = 1; }

std::string describeProgress(const mediagrab::Event& event) {
  std::string line = utils::FormatBytes(event.bytesDownloaded);
  if (event.bytesTotal && *event.bytesTotal > 0) {
    line += " / " + utils::FormatBytes(*event.bytesTotal) + " (" +
            std::to_string(event.bytesDownloaded * 100 / *event.bytesTotal) +
            "%)";
  }
  line += " " + utils::FormatBytes(event.bytesPerSecond) + "/s";
  return line;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("mediagrab [flags] <url>...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  utils::Config config = utils::LoadConfigFromFlags();
  utils::Logger::initialize(config.log);

  if (argc < 2 && config.stateFile.empty()) {
    std::cerr << "Usage: " << argv[0] << " [flags] <url>..." << std::endl;
    return 1;
  }
  auto priority = mediagrab::parsePriority(FLAGS_priority);
  if (!priority) {
    std::cerr << "Unknown priority: " << FLAGS_priority << std::endl;
    return 1;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  mediagrab::Downloader downloader(config);
  auto events = downloader.subscribe();
  downloader.start();

  std::set<mediagrab::JobId> tracked;
  int submitFailures = 0;
  for (const auto& job : downloader.list()) {
    if (mediagrab::isTerminal(job.status)) continue;
    tracked.insert(job.id);
    if (job.status == mediagrab::JobStatus::Paused &&
        (job.interrupted || FLAGS_resume_paused)) {
      downloader.resume(job.id);
    }
  }
  for (int i = 1; i < argc; ++i) {
    std::string url = argv[i];
    try {
      if (FLAGS_playlist) {
        for (auto id : downloader.submitPlaylist(
                 url, std::nullopt, "", *priority,
                 static_cast<size_t>(std::max(1, FLAGS_playlist_max_entries)))) {
          tracked.insert(id);
        }
      } else {
        tracked.insert(downloader.submit(url, std::nullopt, "", *priority));
      }
    } catch (const std::exception& e) {
      std::cerr << url << ": " << e.what() << std::endl;
      ++submitFailures;
    }
  }

  std::map<mediagrab::JobId, mediagrab::Clock::time_point> lastPrinted;
  auto unfinished = [&]() {
    for (auto id : tracked) {
      auto job = downloader.get(id);
      if (job && !mediagrab::isTerminal(job->status) &&
          job->status != mediagrab::JobStatus::Paused) {
        return true;
      }
    }
    return false;
  };

  while (!g_interrupted && unfinished()) {
    auto event = events->poll(std::chrono::milliseconds(200));
    if (!event || tracked.count(event->jobId) == 0) continue;
    if (event->kind == mediagrab::EventKind::Progress) {
      auto& last = lastPrinted[event->jobId];
      if (event->timestamp - last < std::chrono::seconds(1)) continue;
      last = event->timestamp;
      std::cout << "[" << event->jobId << "] " << describeProgress(*event)
                << std::endl;
    } else if (event->kind == mediagrab::EventKind::StatusChanged) {
      std::cout << "[" << event->jobId << "] " << event->status
                << (event->message.empty() ? "" : ": ") << event->message
                << std::endl;
    }
  }

  if (g_interrupted) {
    std::cout << "Interrupted, pausing downloads..." << std::endl;
  }
  downloader.shutdown();

  int failed = submitFailures;
  for (const auto& job : downloader.list()) {
    if (tracked.count(job.id) == 0) continue;
    if (job.status == mediagrab::JobStatus::Failed) {
      std::cerr << "[" << job.id << "] " << job.sourceUrl << " failed: "
                << job.lastError.value_or("unknown error") << std::endl;
      ++failed;
    } else if (job.status == mediagrab::JobStatus::Completed) {
      std::cout << "[" << job.id << "] " << job.destinationPath << " ("
                << utils::FormatBytes(job.bytesDownloaded) << ")" << std::endl;
    }
  }
  gflags::ShutDownCommandLineFlags();
  if (g_interrupted) return 130;
  return failed > 0 ? 1 : 0;
}
