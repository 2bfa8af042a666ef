#include "Downloader.hpp"

#include <exception>

#include "Resolver/CredentialStore.hpp"
#include "Resolver/Platforms.hpp"
#include "Transfer/CurlTransferEngine.hpp"
#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace mediagrab {

namespace {

const char* kResolveArena = "resolve";
// 解析主要是等待子进程，不占 CPU
const int kResolveConcurrency = 4;

}  // namespace

Downloader::Downloader(utils::Config config, Components components)
    : config_(std::move(config)),
      registry_(std::move(components.registry)),
      engine_(std::move(components.engine)),
      bus_(config_.eventBufferSize) {
  if (!registry_) {
    ResolverSettings settings;
    settings.ytdlpPath = config_.ytdlpPath;
    settings.browserHelper = config_.browserHelper;
    settings.timeout = config_.resolveTimeout;
    settings.credentials = std::make_shared<const CredentialStore>(
        CredentialStore::load(config_.credentialsFile));
    registry_ = buildDefaultRegistry(settings);
  }
  if (!engine_) {
    CurlTransferEngine::globalInit();
    TransferOptions options;
    options.connectTimeout = config_.connectTimeout;
    options.stallTimeout = config_.stallTimeout;
    options.progressInterval = config_.progressInterval;
    engine_ = std::make_unique<CurlTransferEngine>(options);
  }
  if (!config_.stateFile.empty()) {
    store_ = std::make_unique<JobStore>(config_.stateFile);
  }

  SchedulerOptions options;
  options.maxConcurrency = config_.maxConcurrency;
  options.maxRetries = config_.maxRetries;
  options.retryBaseDelay = config_.retryBaseDelay;
  options.retryMaxDelay = config_.retryMaxDelay;
  options.writeInfoJson = config_.writeInfoJson;
  scheduler_ = std::make_unique<Scheduler>(*engine_, bus_, options);

  utils::TBBManager::GetInstance().Init(kResolveArena, kResolveConcurrency);
  scheduler_->setResolutionHandler(
      [this](JobId id, const std::string& url,
             std::shared_ptr<const CancelSignal> signal) {
        {
          std::lock_guard<std::mutex> lock(resolveMutex_);
          ++pendingResolutions_;
        }
        auto done = [this]() {
          std::lock_guard<std::mutex> lock(resolveMutex_);
          --pendingResolutions_;
          resolveCv_.notify_all();
        };
        try {
          utils::TBBManager::GetInstance().Enqueue(
              kResolveArena, [this, id, url, signal, done]() {
                resolveJob(id, url, signal);
                done();
              });
        } catch (const std::exception& e) {
          done();
          scheduler_->failResolution(id, e.what());
        }
      });
}

Downloader::~Downloader() { shutdown(); }

void Downloader::start() {
  if (started_) return;
  started_ = true;
  if (store_) {
    StoredState state = store_->load();
    scheduler_->restore(std::move(state.jobs), state.nextJobId);
    // 只在状态变化时保存，进度由定时保存覆盖
    EventFilter filter;
    filter.includeProgress = false;
    persistObserver_ =
        bus_.addObserver([this](const Event&) { saveState(); }, filter);
    autosave_.addPeriodicTask(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            config_.autosaveInterval),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            config_.autosaveInterval),
        [this]() { saveState(); });
    autosave_.start();
  }
  LOG(INFO) << "[Downloader] Started, " << scheduler_->snapshot().size()
            << " jobs in table";
}

void Downloader::shutdown() {
  if (stopped_) return;
  stopped_ = true;
  LOG(INFO) << "[Downloader] Shutting down";
  scheduler_->shutdown();
  {
    std::unique_lock<std::mutex> lock(resolveMutex_);
    resolveCv_.wait(lock, [this]() { return pendingResolutions_ == 0; });
  }
  autosave_.stop();
  if (persistObserver_ != 0) bus_.removeObserver(persistObserver_);
  saveState();
  bus_.shutdown();
  LOG(INFO) << "[Downloader] Stopped";
}

VariantPreference Downloader::defaultPreference() const {
  VariantPreference preference;
  preference.resolution = config_.preferredResolution;
  preference.container = config_.preferredContainer;
  return preference;
}

JobId Downloader::submit(const std::string& url,
                         std::optional<VariantPreference> preference,
                         const std::string& destinationDir, Priority priority) {
  registry_->resolverFor(url);
  return scheduler_->submitUnresolved(
      url, destinationDir.empty() ? config_.downloadDir : destinationDir,
      priority, preference ? *preference : defaultPreference());
}

std::vector<JobId> Downloader::submitPlaylist(
    const std::string& url, std::optional<VariantPreference> preference,
    const std::string& destinationDir, Priority priority, size_t maxEntries) {
  CancelSignal signal;
  std::vector<PlaylistEntry> entries =
      registry_->resolvePlaylist(url, maxEntries, signal);
  LOG(INFO) << "[Downloader] Playlist " << url << " has " << entries.size()
            << " entries";
  std::vector<JobId> ids;
  for (const auto& entry : entries) {
    try {
      ids.push_back(submit(entry.url, preference, destinationDir, priority));
    } catch (const SchedulerError& e) {
      LOG(WARN) << "[Downloader] Skipping playlist entry " << entry.url << ": "
                << e.what();
    } catch (const ResolutionError& e) {
      LOG(WARN) << "[Downloader] Skipping playlist entry " << entry.url << ": "
                << e.what();
    }
  }
  return ids;
}

void Downloader::resolveJob(JobId id, const std::string& url,
                            std::shared_ptr<const CancelSignal> signal) {
  auto job = scheduler_->get(id);
  if (!job || job->status != JobStatus::Resolving) return;
  try {
    std::vector<MediaVariant> variants = registry_->resolve(url, *signal);
    auto index = selectVariant(variants, job->preference);
    if (!index) {
      throw ResolutionError(ResolutionError::Kind::PlatformChanged,
                            "no downloadable formats");
    }
    const MediaVariant& chosen = variants[*index];
    LOG(INFO) << "[Downloader] Job " << id << " selected " << chosen.formatId
              << " (" << chosen.resolutionLabel << ", " << chosen.container
              << ")";
    scheduler_->attachVariant(id, chosen);
  } catch (const ResolutionError& e) {
    if (e.kind() == ResolutionError::Kind::Cancelled) {
      LOG(INFO) << "[Downloader] Resolution of job " << id << " abandoned";
      return;
    }
    scheduler_->failResolution(id, e.what());
  } catch (const std::exception& e) {
    scheduler_->failResolution(id, std::string("resolution failed: ") + e.what());
  }
}

bool Downloader::pause(JobId id) { return scheduler_->pause(id); }
bool Downloader::resume(JobId id) { return scheduler_->resume(id); }
bool Downloader::cancel(JobId id) { return scheduler_->cancel(id); }
bool Downloader::retry(JobId id) { return scheduler_->retry(id); }
bool Downloader::remove(JobId id) { return scheduler_->remove(id); }

bool Downloader::setPriority(JobId id, Priority priority) {
  return scheduler_->setPriority(id, priority);
}

void Downloader::setConcurrency(int maxConcurrency) {
  scheduler_->setConcurrency(maxConcurrency);
}

std::vector<Job> Downloader::list() const { return scheduler_->snapshot(); }

std::optional<Job> Downloader::get(JobId id) const {
  return scheduler_->get(id);
}

std::shared_ptr<Subscription> Downloader::subscribe(EventFilter filter) {
  return bus_.subscribe(std::move(filter));
}

void Downloader::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  bus_.unsubscribe(subscription);
}

std::vector<Event> Downloader::progressSnapshot() const {
  return bus_.snapshot();
}

bool Downloader::saveState() {
  if (!store_) return true;
  try {
    store_->save(scheduler_->snapshot(), scheduler_->nextJobId());
    return true;
  } catch (const SystemError& e) {
    LOG(ERROR) << "[Downloader] " << e.what();
    return false;
  }
}

}  // namespace mediagrab
