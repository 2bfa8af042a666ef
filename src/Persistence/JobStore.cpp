#include "JobStore.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace fs = std::filesystem;

namespace mediagrab {

using json = nlohmann::json;

namespace {

int64_t toMillis(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

Clock::time_point fromMillis(int64_t ms) {
  return Clock::time_point(std::chrono::milliseconds(ms));
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

std::optional<uint64_t> optionalSize(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<uint64_t>();
}

json variantToJson(const MediaVariant& v) {
  return json{{"sourceUrl", v.sourceUrl},
              {"formatId", v.formatId},
              {"container", v.container},
              {"resolutionLabel", v.resolutionLabel},
              {"height", v.height},
              {"estimatedSizeBytes", optionalToJson(v.estimatedSizeBytes)},
              {"title", v.title},
              {"fetch",
               {{"url", v.fetch.url},
                {"headers", v.fetch.headers},
                {"cookies", v.fetch.cookies}}}};
}

MediaVariant variantFromJson(const json& j) {
  MediaVariant v;
  v.sourceUrl = j.value("sourceUrl", "");
  v.formatId = j.value("formatId", "");
  v.container = j.value("container", "");
  v.resolutionLabel = j.value("resolutionLabel", "");
  v.height = j.value("height", 0);
  v.estimatedSizeBytes = optionalSize(j, "estimatedSizeBytes");
  v.title = j.value("title", "");
  const json& fetch = j.at("fetch");
  v.fetch.url = fetch.at("url").get<std::string>();
  if (fetch.contains("headers")) {
    v.fetch.headers =
        fetch.at("headers").get<std::map<std::string, std::string>>();
  }
  v.fetch.cookies = fetch.value("cookies", "");
  return v;
}

json jobToJson(const Job& job) {
  json j{{"id", job.id},
         {"url", job.sourceUrl},
         {"preference",
          {{"resolution", job.preference.resolution},
           {"container", job.preference.container}}},
         {"destinationDir", job.destinationDir},
         {"destinationPath", job.destinationPath},
         {"stagingPath", job.stagingPath},
         {"status", toString(job.status)},
         {"bytesDownloaded", job.bytesDownloaded},
         {"bytesTotal", optionalToJson(job.bytesTotal)},
         {"createdAt", toMillis(job.createdAt)},
         {"updatedAt", toMillis(job.updatedAt)},
         {"retryCount", job.retryCount},
         {"lastError", optionalToJson(job.lastError)},
         {"priority", toString(job.priority)},
         {"restartedFromZero", job.restartedFromZero},
         {"interrupted", job.interrupted}};
  j["variant"] = job.selectedVariant ? variantToJson(*job.selectedVariant)
                                     : json(nullptr);
  return j;
}

// 缺少必需字段或字段类型错误时抛异常
Job jobFromJson(const json& j) {
  Job job;
  job.id = j.at("id").get<JobId>();
  if (job.id == 0) throw std::invalid_argument("job id 0");
  job.sourceUrl = j.at("url").get<std::string>();
  if (job.sourceUrl.empty()) throw std::invalid_argument("empty url");

  auto status = parseStatus(j.at("status").get<std::string>());
  if (!status) throw std::invalid_argument("unknown status");
  job.status = *status;
  auto priority = parsePriority(j.value("priority", "Normal"));
  if (!priority) throw std::invalid_argument("unknown priority");
  job.priority = *priority;

  auto variant = j.find("variant");
  if (variant != j.end() && !variant->is_null()) {
    job.selectedVariant = variantFromJson(*variant);
  }
  auto preference = j.find("preference");
  if (preference != j.end() && preference->is_object()) {
    job.preference.resolution = preference->value("resolution", "best");
    job.preference.container = preference->value("container", "");
  }
  job.destinationDir = j.value("destinationDir", "");
  job.destinationPath = j.value("destinationPath", "");
  job.stagingPath = j.value("stagingPath", "");
  job.bytesDownloaded = j.value("bytesDownloaded", uint64_t{0});
  job.bytesTotal = optionalSize(j, "bytesTotal");
  job.createdAt = fromMillis(j.value("createdAt", int64_t{0}));
  job.updatedAt = fromMillis(j.value("updatedAt", int64_t{0}));
  job.retryCount = j.value("retryCount", 0);
  auto lastError = j.find("lastError");
  if (lastError != j.end() && lastError->is_string()) {
    job.lastError = lastError->get<std::string>();
  }
  job.restartedFromZero = j.value("restartedFromZero", false);
  job.interrupted = j.value("interrupted", false);

  if (job.status == JobStatus::Downloading && !job.selectedVariant) {
    throw std::invalid_argument("downloading job without variant");
  }
  if (job.bytesTotal && job.bytesDownloaded > *job.bytesTotal) {
    throw std::invalid_argument("bytesDownloaded exceeds bytesTotal");
  }
  return job;
}

}  // namespace

SystemError::SystemError(Kind kind, const std::string& detail)
    : std::runtime_error(std::string(toString(kind)) + ": " + detail),
      kind_(kind) {}

const char* toString(SystemError::Kind kind) {
  switch (kind) {
    case SystemError::Kind::PersistenceCorrupt:
      return "persistence corrupt";
    case SystemError::Kind::PersistenceUnavailable:
      return "persistence unavailable";
  }
  return "system error";
}

JobStore::JobStore(std::string path) : path_(std::move(path)) {}

std::string JobStore::serialize(const std::vector<Job>& jobs, JobId nextJobId) {
  json doc{{"version", kFormatVersion},
           {"nextJobId", nextJobId},
           {"jobs", json::array()}};
  for (const auto& job : jobs) doc["jobs"].push_back(jobToJson(job));
  return doc.dump(2);
}

StoredState JobStore::deserialize(const std::string& text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw SystemError(SystemError::Kind::PersistenceCorrupt,
                      "state file is not a JSON object");
  }
  auto jobs = doc.find("jobs");
  if (jobs == doc.end() || !jobs->is_array()) {
    throw SystemError(SystemError::Kind::PersistenceCorrupt,
                      "state file has no job list");
  }
  int version = doc.value("version", 0);
  if (version > kFormatVersion) {
    LOG(WARN) << "[Persistence] State file version " << version
              << " is newer than " << kFormatVersion << ", reading what we can";
  }

  StoredState state;
  std::set<JobId> seen;
  JobId maxId = 0;
  for (size_t i = 0; i < jobs->size(); ++i) {
    Job job;
    try {
      job = jobFromJson((*jobs)[i]);
    } catch (const std::exception& e) {
      LOG(WARN) << "[Persistence] Dropping corrupt job entry #" << i << ": "
                << e.what();
      ++state.dropped;
      continue;
    }
    if (!seen.insert(job.id).second) {
      LOG(WARN) << "[Persistence] Dropping duplicate job " << job.id;
      ++state.dropped;
      continue;
    }
    if (job.status == JobStatus::Downloading ||
        job.status == JobStatus::Resolving) {
      LOG(INFO) << "[Persistence] Job " << job.id << " was " << job.status
                << " at shutdown, restored as Paused";
      job.status = JobStatus::Paused;
      job.interrupted = true;
    }
    maxId = std::max(maxId, job.id);
    state.jobs.push_back(std::move(job));
  }

  JobId stored = 1;
  auto next = doc.find("nextJobId");
  if (next != doc.end() && next->is_number_unsigned()) {
    stored = next->get<JobId>();
  }
  state.nextJobId = std::max(stored, maxId + 1);
  return state;
}

void JobStore::save(const std::vector<Job>& jobs, JobId nextJobId) {
  std::string text = serialize(jobs, nextJobId);
  std::lock_guard<std::mutex> lock(saveMutex_);

  fs::path target(path_);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
  }
  std::string tmp = path_ + ".tmp";
  {
    std::unique_ptr<FILE, int (*)(FILE*)> out(std::fopen(tmp.c_str(), "wb"),
                                              &std::fclose);
    if (!out) {
      throw SystemError(SystemError::Kind::PersistenceUnavailable,
                        "cannot open " + tmp + ": " + std::strerror(errno));
    }
    // rename 之前落盘，崩溃后不会留下空的状态文件
    if (std::fwrite(text.data(), 1, text.size(), out.get()) != text.size() ||
        std::fflush(out.get()) != 0 || ::fsync(::fileno(out.get())) != 0) {
      int err = errno;
      out.reset();
      fs::remove(tmp, ec);
      throw SystemError(SystemError::Kind::PersistenceUnavailable,
                        "cannot write " + tmp + ": " + std::strerror(err));
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw SystemError(SystemError::Kind::PersistenceUnavailable,
                      "cannot replace " + path_);
  }
  LOG(DEBUG) << "[Persistence] Saved " << jobs.size() << " jobs to " << path_;
}

StoredState JobStore::load() const {
  std::ifstream in(path_);
  if (!in) {
    LOG(INFO) << "[Persistence] No state file at " << path_;
    return StoredState();
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    StoredState state = deserialize(buffer.str());
    LOG(INFO) << "[Persistence] Loaded " << state.jobs.size() << " jobs from "
              << path_ << " (" << state.dropped << " dropped)";
    return state;
  } catch (const std::exception& e) {
    LOG(WARN) << "[Persistence] Ignoring " << path_ << ": " << e.what();
    return StoredState();
  }
}

bool writeInfoSidecar(const Job& job, const std::string& finalPath) {
  json info{{"url", job.sourceUrl},
            {"title", job.title()},
            {"bytes", job.bytesDownloaded},
            {"completedAt", toMillis(job.updatedAt)}};
  if (job.selectedVariant) {
    info["formatId"] = job.selectedVariant->formatId;
    info["container"] = job.selectedVariant->container;
    info["resolution"] = job.selectedVariant->resolutionLabel;
  }
  std::string path = finalPath + ".info.json";
  std::ofstream out(path, std::ios::trunc);
  out << info.dump(2);
  if (!out) {
    LOG(WARN) << "[Persistence] Failed to write " << path;
    return false;
  }
  return true;
}

}  // namespace mediagrab
