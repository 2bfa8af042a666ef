#include "Job.hpp"

#include <stdexcept>

namespace mediagrab {

const char* toString(JobStatus status) {
  switch (status) {
    case JobStatus::Queued:
      return "Queued";
    case JobStatus::Resolving:
      return "Resolving";
    case JobStatus::Downloading:
      return "Downloading";
    case JobStatus::Paused:
      return "Paused";
    case JobStatus::Completed:
      return "Completed";
    case JobStatus::Failed:
      return "Failed";
    case JobStatus::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

const char* toString(Priority priority) {
  switch (priority) {
    case Priority::High:
      return "High";
    case Priority::Normal:
      return "Normal";
    case Priority::Low:
      return "Low";
  }
  return "Normal";
}

std::optional<JobStatus> parseStatus(const std::string& name) {
  for (JobStatus s :
       {JobStatus::Queued, JobStatus::Resolving, JobStatus::Downloading,
        JobStatus::Paused, JobStatus::Completed, JobStatus::Failed,
        JobStatus::Cancelled}) {
    if (name == toString(s)) return s;
  }
  return std::nullopt;
}

std::optional<Priority> parsePriority(const std::string& name) {
  for (Priority p : {Priority::High, Priority::Normal, Priority::Low}) {
    if (name == toString(p)) return p;
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, JobStatus status) {
  return os << toString(status);
}

std::ostream& operator<<(std::ostream& os, Priority priority) {
  return os << toString(priority);
}

bool isTerminal(JobStatus status) {
  return status == JobStatus::Completed || status == JobStatus::Failed ||
         status == JobStatus::Cancelled;
}

bool canTransition(JobStatus from, JobStatus to) {
  switch (from) {
    case JobStatus::Queued:
      return to == JobStatus::Downloading || to == JobStatus::Paused ||
             to == JobStatus::Failed || to == JobStatus::Cancelled;
    case JobStatus::Resolving:
      return to == JobStatus::Queued || to == JobStatus::Failed ||
             to == JobStatus::Cancelled;
    case JobStatus::Downloading:
      return to == JobStatus::Completed || to == JobStatus::Paused ||
             to == JobStatus::Failed || to == JobStatus::Cancelled ||
             to == JobStatus::Queued;
    case JobStatus::Paused:
      return to == JobStatus::Queued || to == JobStatus::Resolving ||
             to == JobStatus::Cancelled;
    case JobStatus::Failed:
      return to == JobStatus::Queued || to == JobStatus::Resolving;
    case JobStatus::Completed:
    case JobStatus::Cancelled:
      return false;
  }
  return false;
}

void Job::transitionTo(JobStatus next) {
  if (!canTransition(status, next)) {
    throw std::logic_error("job " + std::to_string(id) +
                           ": illegal transition " + toString(status) +
                           " -> " + toString(next));
  }
  status = next;
  updatedAt = Clock::now();
}

bool Job::applyProgress(uint64_t bytes, std::optional<uint64_t> total) {
  bool changed = false;
  if (total && !bytesTotal) {
    bytesTotal = total;
    changed = true;
  }
  if (bytes > bytesDownloaded) {
    bytesDownloaded = bytes;
    changed = true;
  }
  if (changed) updatedAt = Clock::now();
  return changed;
}

void Job::resetProgress() {
  bytesDownloaded = 0;
  restartedFromZero = true;
  updatedAt = Clock::now();
}

std::string Job::title() const {
  if (selectedVariant && !selectedVariant->title.empty()) {
    return selectedVariant->title;
  }
  return sourceUrl;
}

}  // namespace mediagrab
