#include "Scheduler.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "Persistence/JobStore.hpp"
#include "utils/config.hpp"
#include "utils/file_utils.hpp"
#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace fs = std::filesystem;

namespace mediagrab {

namespace {

const char* kTransferArena = "transfer";

}  // namespace

SchedulerError::SchedulerError(Kind kind, const std::string& detail)
    : std::runtime_error(std::string(toString(kind)) + ": " + detail),
      kind_(kind) {}

const char* toString(SchedulerError::Kind kind) {
  switch (kind) {
    case SchedulerError::Kind::DestinationUnwritable:
      return "destination unwritable";
    case SchedulerError::Kind::DuplicateSubmission:
      return "duplicate submission";
  }
  return "scheduler error";
}

std::chrono::milliseconds retryDelay(const SchedulerOptions& options,
                                     int retryCount) {
  auto delay = options.retryBaseDelay;
  for (int i = 1; i < retryCount && delay < options.retryMaxDelay; ++i) {
    delay *= 2;
  }
  return std::min(delay, options.retryMaxDelay);
}

Scheduler::Scheduler(TransferEngine& engine, EventBus& bus,
                     SchedulerOptions options, Executor executor)
    : engine_(engine),
      bus_(bus),
      options_(options),
      executor_(std::move(executor)),
      ceiling_(utils::kMaxConcurrencyCeiling) {
  if (!executor_) {
    auto& tbb = utils::TBBManager::GetInstance();
    tbb.Init(kTransferArena, utils::kMaxConcurrencyCeiling);
    ceiling_ = std::min(ceiling_, tbb.Concurrency(kTransferArena));
    executor_ = [](std::function<void()> task) {
      utils::TBBManager::GetInstance().Enqueue(kTransferArena, std::move(task));
    };
  }
  maxConcurrency_ = std::max(1, std::min(options_.maxConcurrency, ceiling_));
  timer_.start();
  LOG(INFO) << "[Scheduler] Started with maxConcurrency=" << maxConcurrency_
            << " (ceiling " << ceiling_ << "), maxRetries="
            << options_.maxRetries;
}

Scheduler::~Scheduler() { shutdown(); }

void Scheduler::setResolutionHandler(ResolutionHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  resolutionHandler_ = std::move(handler);
}

JobId Scheduler::createLocked(const std::string& url, const std::string& dir,
                              Priority priority) {
  if (shuttingDown_) throw std::logic_error("scheduler is shut down");
  JobId id = nextJobId_++;
  Entry& entry = jobs_[id];
  entry.job.id = id;
  entry.job.sourceUrl = url;
  entry.job.destinationDir = dir.empty() ? "." : dir;
  entry.job.priority = priority;
  entry.job.createdAt = entry.job.updatedAt = Clock::now();
  return id;
}

void Scheduler::checkDuplicateLocked(const std::string& url,
                                     const std::string* formatId) const {
  for (const auto& kv : jobs_) {
    const Job& job = kv.second.job;
    if (isTerminal(job.status) || job.sourceUrl != url) continue;
    if (formatId && job.selectedVariant &&
        job.selectedVariant->formatId != *formatId) {
      continue;
    }
    throw SchedulerError(SchedulerError::Kind::DuplicateSubmission,
                         url + " is already job " + std::to_string(job.id));
  }
}

JobId Scheduler::submit(const std::string& url, const MediaVariant& variant,
                        const std::string& destinationDir, Priority priority) {
  Effects effects;
  JobId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    checkDuplicateLocked(url, &variant.formatId);
    id = createLocked(url, destinationDir, priority);
    Entry& entry = jobs_[id];
    entry.job.selectedVariant = variant;
    assignDestinationLocked(entry);
    LOG(INFO) << "[Scheduler] Job " << id << " submitted: " << url << " ["
              << variant.resolutionLabel << " " << variant.container << "] -> "
              << entry.job.destinationPath;
    publishLocked(entry.job, EventKind::StatusChanged);
    enqueueLocked(entry);
    admitLocked(effects);
  }
  apply(effects);
  return id;
}

JobId Scheduler::submitUnresolved(const std::string& url,
                                  const std::string& destinationDir,
                                  Priority priority,
                                  VariantPreference preference) {
  Effects effects;
  JobId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    checkDuplicateLocked(url, nullptr);
    id = createLocked(url, destinationDir, priority);
    Entry& entry = jobs_[id];
    entry.job.status = JobStatus::Resolving;
    entry.job.preference = std::move(preference);
    LOG(INFO) << "[Scheduler] Job " << id << " submitted for resolution: "
              << url;
    publishLocked(entry.job, EventKind::StatusChanged);
    startResolutionLocked(entry, effects);
  }
  apply(effects);
  return id;
}

bool Scheduler::attachVariant(JobId id, const MediaVariant& variant) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.job.status != JobStatus::Resolving ||
        shuttingDown_) {
      return false;
    }
    Entry& entry = it->second;
    // 只有尚未选定变体的任务会进入 Resolving
    entry.job.selectedVariant = variant;
    entry.signal.reset();
    assignDestinationLocked(entry);
    transitionLocked(entry, JobStatus::Queued,
                     variant.resolutionLabel + " " + variant.container);
    enqueueLocked(entry);
    admitLocked(effects);
  }
  apply(effects);
  return true;
}

bool Scheduler::failResolution(JobId id, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second.job.status != JobStatus::Resolving) {
    return false;
  }
  Entry& entry = it->second;
  entry.signal.reset();
  entry.job.lastError = reason;
  LOG(ERROR) << "[Scheduler] Job " << id << " resolution failed: " << reason;
  transitionLocked(entry, JobStatus::Failed, reason);
  return true;
}

void Scheduler::assignDestinationLocked(Entry& entry) {
  Job& job = entry.job;
  const MediaVariant& variant = *job.selectedVariant;
  std::string name = utils::SanitizeFileName(variant.title);
  std::string ext = variant.container.empty() ? "bin" : variant.container;
  std::string wanted = (fs::path(job.destinationDir) / (name + "." + ext)).string();
  JobId self = job.id;
  job.destinationPath =
      utils::UniquePath(wanted, [this, self](const std::string& candidate) {
        for (const auto& kv : jobs_) {
          if (kv.first == self) continue;
          const Job& other = kv.second.job;
          if (other.status == JobStatus::Cancelled) continue;
          if (other.destinationPath == candidate) return true;
        }
        return false;
      });
  job.stagingPath = job.destinationPath + "." + std::to_string(job.id) + ".part";
}

void Scheduler::publishLocked(const Job& job, EventKind kind,
                              const std::string& message) {
  Event event;
  event.kind = kind;
  event.jobId = job.id;
  event.status = job.status;
  event.bytesDownloaded = job.bytesDownloaded;
  event.bytesTotal = job.bytesTotal;
  event.message = message;
  bus_.publish(std::move(event));
}

void Scheduler::transitionLocked(Entry& entry, JobStatus next,
                                 const std::string& message) {
  JobStatus previous = entry.job.status;
  entry.job.transitionTo(next);
  LOG(INFO) << "[Scheduler] Job " << entry.job.id << " " << previous << " -> "
            << next << (message.empty() ? "" : ": ") << message;
  publishLocked(entry.job, EventKind::StatusChanged, message);
}

void Scheduler::enqueueLocked(Entry& entry) {
  entry.queueSeq = nextQueueSeq_++;
  queue_.emplace(static_cast<int>(entry.job.priority), entry.queueSeq,
                 entry.job.id);
}

void Scheduler::dequeueLocked(Entry& entry) {
  if (entry.queueSeq == 0) return;
  queue_.erase(QueueKey(static_cast<int>(entry.job.priority), entry.queueSeq,
                        entry.job.id));
  entry.queueSeq = 0;
}

void Scheduler::cancelRetryLocked(Entry& entry) {
  if (entry.retryToken == 0) return;
  timer_.cancel(entry.retryTask);
  entry.retryToken = 0;
  entry.retryTask = 0;
}

void Scheduler::startResolutionLocked(Entry& entry, Effects& effects) {
  entry.signal = std::make_shared<CancelSignal>();
  effects.resolutions.push_back(
      Resolution{entry.job.id, entry.job.sourceUrl, entry.signal});
}

void Scheduler::admitLocked(Effects& effects) {
  while (!shuttingDown_ && activeSlots_ < maxConcurrency_ && !queue_.empty()) {
    auto key = *queue_.begin();
    queue_.erase(queue_.begin());
    auto it = jobs_.find(std::get<2>(key));
    if (it == jobs_.end()) continue;
    Entry& entry = it->second;
    entry.queueSeq = 0;
    if (entry.job.status != JobStatus::Queued) continue;

    std::string error;
    if (!utils::EnsureWritableDirectory(entry.job.destinationDir, &error)) {
      SchedulerError failure(SchedulerError::Kind::DestinationUnwritable,
                             entry.job.destinationDir + ": " + error);
      entry.job.lastError = failure.what();
      LOG(ERROR) << "[Scheduler] Job " << entry.job.id
                 << " not admitted: " << failure.what();
      transitionLocked(entry, JobStatus::Failed, failure.what());
      continue;
    }

    entry.signal = std::make_shared<CancelSignal>();
    entry.workerBound = true;
    ++activeSlots_;
    ++liveWorkers_;
    transitionLocked(entry, JobStatus::Downloading);
    effects.launches.push_back(Launch{entry.job.id, entry.signal});
  }
}

void Scheduler::apply(Effects& effects) {
  for (const auto& path : effects.filesToRemove) {
    if (path.empty()) continue;
    std::error_code ec;
    if (fs::remove(path, ec)) {
      LOG(DEBUG) << "[Scheduler] Removed " << path;
    } else if (ec) {
      LOG(WARN) << "[Scheduler] Failed to remove " << path << ": "
                << ec.message();
    }
  }
  for (const auto& job : effects.completed) {
    writeInfoSidecar(job, job.destinationPath);
  }

  ResolutionHandler handler;
  if (!effects.resolutions.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = resolutionHandler_;
  }
  for (auto& resolution : effects.resolutions) {
    if (!handler) {
      LOG(WARN) << "[Scheduler] No resolver attached, job " << resolution.id
                << " waits in Resolving";
      continue;
    }
    handler(resolution.id, resolution.url, resolution.signal);
  }

  for (auto& launch : effects.launches) {
    JobId id = launch.id;
    auto signal = launch.signal;
    try {
      executor_([this, id, signal]() { runWorker(id, signal); });
    } catch (const std::exception& e) {
      LOG(ERROR) << "[Scheduler] Failed to start worker for job " << id << ": "
                 << e.what();
      finishWorker(id, std::nullopt, std::nullopt, e.what());
      releaseWorker();
    }
  }
}

void Scheduler::runWorker(JobId id, std::shared_ptr<CancelSignal> signal) {
  TransferRequest request;
  bool known = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      known = false;
    } else {
      it->second.restartNoted = false;
      const Job& job = it->second.job;
      request.fetch = job.selectedVariant->fetch;
      request.destinationPath = job.destinationPath;
      request.stagingPath = job.stagingPath;
      request.resumeOffset = job.bytesDownloaded;
    }
  }
  if (!known) {
    releaseWorker();
    return;
  }
  LOG(DEBUG) << "[Scheduler] Worker for job " << id << " starts at offset "
             << request.resumeOffset;

  std::optional<TransferResult> result;
  std::optional<TransferError> error;
  std::string unexpected;
  try {
    result = engine_.transfer(
        request,
        [this, id](const TransferProgress& progress) { onProgress(id, progress); },
        *signal);
  } catch (const TransferError& e) {
    error = e;
  } catch (const std::exception& e) {
    unexpected = e.what();
  }
  finishWorker(id, result, error, unexpected);
  releaseWorker();
}

void Scheduler::releaseWorker() {
  std::lock_guard<std::mutex> lock(mutex_);
  --liveWorkers_;
  // 在锁内通知，shutdown 返回前本线程已不再触碰成员
  idleCv_.notify_all();
}

void Scheduler::onProgress(JobId id, const TransferProgress& progress) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return;
  Entry& entry = it->second;
  Job& job = entry.job;
  if (job.status != JobStatus::Downloading) return;
  bool restarted = progress.restartedFromZero && noteRestartLocked(entry);
  job.applyProgress(progress.bytesDownloaded, progress.bytesTotal);

  Event event;
  event.kind = EventKind::Progress;
  event.jobId = id;
  event.status = job.status;
  event.bytesDownloaded = job.bytesDownloaded;
  event.bytesTotal = job.bytesTotal;
  event.bytesPerSecond = progress.bytesPerSecond;
  if (restarted) event.message = "restarted from zero";
  bus_.publish(std::move(event));
}

bool Scheduler::noteRestartLocked(Entry& entry) {
  if (entry.restartNoted) return false;
  entry.restartNoted = true;
  LOG(WARN) << "[Scheduler] Job " << entry.job.id
            << " source cannot resume, restarting from zero";
  entry.job.resetProgress();
  return true;
}

void Scheduler::finishWorker(JobId id, const std::optional<TransferResult>& result,
                             const std::optional<TransferError>& error,
                             const std::string& unexpected) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    Entry& entry = it->second;
    Job& job = entry.job;
    entry.workerBound = false;
    entry.signal.reset();
    --activeSlots_;

    if (job.status == JobStatus::Cancelled) {
      // 取消请求可能晚于引擎返回，这里补删残留文件
      effects.filesToRemove.push_back(job.stagingPath);
      if (result && result->outcome == TransferOutcome::Completed) {
        effects.filesToRemove.push_back(result->finalPath);
      }
    } else if (result) {
      if (result->restartedFromZero) noteRestartLocked(entry);
      job.applyProgress(result->bytesDownloaded, result->bytesTotal);
      switch (result->outcome) {
        case TransferOutcome::Completed:
          if (!result->finalPath.empty()) job.destinationPath = result->finalPath;
          job.lastError.reset();
          entry.lastFailure.reset();
          transitionLocked(entry, JobStatus::Completed, job.destinationPath);
          if (options_.writeInfoJson) effects.completed.push_back(job);
          break;
        case TransferOutcome::Paused:
          job.interrupted = shuttingDown_;
          transitionLocked(entry, JobStatus::Paused);
          break;
        case TransferOutcome::Cancelled:
          transitionLocked(entry, JobStatus::Cancelled);
          effects.filesToRemove.push_back(job.stagingPath);
          break;
      }
    } else if (error) {
      entry.lastFailure = error->kind();
      job.lastError = error->what();
      if (error->retryable() && job.retryCount < options_.maxRetries) {
        ++job.retryCount;
        transitionLocked(entry, JobStatus::Queued,
                         std::string(error->what()) + ", retry " +
                             std::to_string(job.retryCount) + "/" +
                             std::to_string(options_.maxRetries));
        scheduleRetryLocked(entry);
      } else {
        LOG(ERROR) << "[Scheduler] Job " << id << " failed: " << error->what();
        transitionLocked(entry, JobStatus::Failed, error->what());
      }
    } else {
      job.lastError = unexpected.empty() ? "internal error" : unexpected;
      LOG(ERROR) << "[Scheduler] Job " << id << " failed: " << *job.lastError;
      transitionLocked(entry, JobStatus::Failed, *job.lastError);
    }

    if (entry.removePending) {
      LOG(INFO) << "[Scheduler] Job " << id << " removed";
      publishLocked(job, EventKind::Removed);
      jobs_.erase(it);
    }
    admitLocked(effects);
  }
  apply(effects);
}

void Scheduler::scheduleRetryLocked(Entry& entry) {
  if (shuttingDown_) return;  // 保持 Queued，下次启动时恢复
  auto delay = retryDelay(options_, entry.job.retryCount);
  uint64_t token = nextRetryToken_++;
  JobId id = entry.job.id;
  entry.retryToken = token;
  entry.retryTask =
      timer_.addOnceTask(delay, [this, id, token]() { onRetryDue(id, token); });
  LOG(INFO) << "[Scheduler] Job " << id << " will retry in " << delay.count()
            << "ms";
}

void Scheduler::onRetryDue(JobId id, uint64_t token) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    Entry& entry = it->second;
    if (entry.retryToken != token || entry.job.status != JobStatus::Queued) {
      return;
    }
    entry.retryToken = 0;
    entry.retryTask = 0;
    enqueueLocked(entry);
    admitLocked(effects);
  }
  apply(effects);
}

bool Scheduler::cancel(JobId id) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || isTerminal(it->second.job.status)) {
      LOG(WARN) << "[Scheduler] Cannot cancel job " << id;
      return false;
    }
    Entry& entry = it->second;
    if (entry.signal) entry.signal->request(CancelMode::Cancel);
    dequeueLocked(entry);
    cancelRetryLocked(entry);
    transitionLocked(entry, JobStatus::Cancelled);
    // 绑定了工作线程时由它退出后清理
    if (!entry.workerBound) {
      entry.signal.reset();
      effects.filesToRemove.push_back(entry.job.stagingPath);
    }
    admitLocked(effects);
  }
  apply(effects);
  return true;
}

bool Scheduler::pause(JobId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return false;
  Entry& entry = it->second;
  switch (entry.job.status) {
    case JobStatus::Downloading:
      // 状态在工作线程返回 Paused 后才改变
      entry.signal->request(CancelMode::Pause);
      LOG(INFO) << "[Scheduler] Job " << id << " pause requested";
      return true;
    case JobStatus::Queued:
      dequeueLocked(entry);
      cancelRetryLocked(entry);
      entry.job.interrupted = false;
      transitionLocked(entry, JobStatus::Paused);
      return true;
    default:
      LOG(WARN) << "[Scheduler] Cannot pause job " << id << " in "
                << entry.job.status;
      return false;
  }
}

bool Scheduler::resume(JobId id) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.job.status != JobStatus::Paused ||
        shuttingDown_) {
      LOG(WARN) << "[Scheduler] Cannot resume job " << id;
      return false;
    }
    Entry& entry = it->second;
    entry.job.interrupted = false;
    if (entry.job.selectedVariant) {
      transitionLocked(entry, JobStatus::Queued);
      enqueueLocked(entry);
      admitLocked(effects);
    } else {
      transitionLocked(entry, JobStatus::Resolving);
      startResolutionLocked(entry, effects);
    }
  }
  apply(effects);
  return true;
}

bool Scheduler::retry(JobId id) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.job.status != JobStatus::Failed ||
        shuttingDown_) {
      LOG(WARN) << "[Scheduler] Cannot retry job " << id;
      return false;
    }
    Entry& entry = it->second;
    Job& job = entry.job;
    ++job.retryCount;
    job.lastError.reset();
    if (entry.lastFailure == TransferError::Kind::ServerRejectedRange ||
        entry.lastFailure == TransferError::Kind::Corrupt) {
      // 分片不可信，从头开始
      effects.filesToRemove.push_back(job.stagingPath);
      job.resetProgress();
    }
    entry.lastFailure.reset();
    if (job.selectedVariant) {
      transitionLocked(entry, JobStatus::Queued, "manual retry");
      enqueueLocked(entry);
      admitLocked(effects);
    } else {
      transitionLocked(entry, JobStatus::Resolving, "manual retry");
      startResolutionLocked(entry, effects);
    }
  }
  apply(effects);
  return true;
}

bool Scheduler::remove(JobId id) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || !isTerminal(it->second.job.status)) {
      LOG(WARN) << "[Scheduler] Cannot remove job " << id;
      return false;
    }
    Entry& entry = it->second;
    if (entry.job.status != JobStatus::Completed) {
      effects.filesToRemove.push_back(entry.job.stagingPath);
    }
    if (entry.workerBound) {
      entry.removePending = true;
    } else {
      LOG(INFO) << "[Scheduler] Job " << id << " removed";
      publishLocked(entry.job, EventKind::Removed);
      jobs_.erase(it);
    }
  }
  apply(effects);
  return true;
}

bool Scheduler::setPriority(JobId id, Priority priority) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || isTerminal(it->second.job.status)) return false;
  Entry& entry = it->second;
  bool queued = entry.queueSeq != 0;
  uint64_t seq = entry.queueSeq;
  dequeueLocked(entry);
  entry.job.priority = priority;
  if (queued) {
    // 保留原来的入队顺序
    entry.queueSeq = seq;
    queue_.emplace(static_cast<int>(priority), seq, id);
  }
  return true;
}

void Scheduler::setConcurrency(int maxConcurrency) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    int clamped = std::max(1, std::min(maxConcurrency, ceiling_));
    if (clamped != maxConcurrency) {
      LOG(WARN) << "[Scheduler] maxConcurrency " << maxConcurrency
                << " clamped to " << clamped;
    }
    LOG(INFO) << "[Scheduler] maxConcurrency " << maxConcurrency_ << " -> "
              << clamped << " (" << activeSlots_ << " active)";
    maxConcurrency_ = clamped;
    admitLocked(effects);
  }
  apply(effects);
}

int Scheduler::concurrency() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return maxConcurrency_;
}

int Scheduler::activeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return activeSlots_;
}

std::vector<Job> Scheduler::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> jobs;
  jobs.reserve(jobs_.size());
  for (const auto& kv : jobs_) {
    if (!kv.second.removePending) jobs.push_back(kv.second.job);
  }
  return jobs;
}

std::optional<Job> Scheduler::get(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second.removePending) return std::nullopt;
  return it->second.job;
}

JobId Scheduler::nextJobId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nextJobId_;
}

void Scheduler::restore(std::vector<Job> jobs, JobId nextJobId) {
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::sort(jobs.begin(), jobs.end(),
              [](const Job& a, const Job& b) { return a.id < b.id; });
    for (auto& job : jobs) {
      if (jobs_.count(job.id) > 0) {
        LOG(WARN) << "[Scheduler] Skipping restored job " << job.id
                  << ", id already in use";
        continue;
      }
      // 没有工作线程的 Downloading/Resolving 只能从 Paused 重新开始
      if (job.status == JobStatus::Downloading ||
          job.status == JobStatus::Resolving ||
          (job.status == JobStatus::Queued && !job.selectedVariant)) {
        job.status = JobStatus::Paused;
        job.interrupted = true;
      }
      nextJobId_ = std::max(nextJobId_, job.id + 1);
      Entry& entry = jobs_[job.id];
      entry.job = std::move(job);
      publishLocked(entry.job, EventKind::StatusChanged, "restored");
      if (entry.job.status == JobStatus::Queued) enqueueLocked(entry);
    }
    nextJobId_ = std::max(nextJobId_, nextJobId);
    LOG(INFO) << "[Scheduler] Restored " << jobs_.size() << " jobs, next id "
              << nextJobId_;
    admitLocked(effects);
  }
  apply(effects);
}

void Scheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shuttingDown_) return;
    shuttingDown_ = true;
    for (auto& kv : jobs_) {
      Entry& entry = kv.second;
      if (!entry.signal) continue;
      if (entry.workerBound) {
        entry.signal->request(CancelMode::Pause);
      } else if (entry.job.status == JobStatus::Resolving) {
        entry.signal->request(CancelMode::Cancel);
      }
    }
    LOG(INFO) << "[Scheduler] Shutting down, waiting for " << liveWorkers_
              << " workers";
  }
  timer_.stop();
  std::unique_lock<std::mutex> lock(mutex_);
  idleCv_.wait(lock, [this]() { return liveWorkers_ == 0; });
  for (auto& kv : jobs_) kv.second.retryToken = 0;
  LOG(INFO) << "[Scheduler] All workers stopped";
}

}  // namespace mediagrab
