#include "tbb_manager.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace utils {

TBBManager& TBBManager::GetInstance() {
  static TBBManager instance;
  return instance;
}

std::shared_ptr<tbb::task_arena> TBBManager::Init(const std::string& tbb_name,
                                                  int default_concurrency) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto& state = task_arenas_[tbb_name];
  if (!state.initialized) {
    int concurrency = 0;
    auto& defines = GetTBBParallelCountDefines();
    auto it = defines.find(tbb_name);
    if (it != defines.end()) {
      concurrency = it->second;
    }
    if (concurrency <= 0) {
      concurrency = default_concurrency;
    }
    if (concurrency <= 0) {
      concurrency = tbb::info::default_concurrency();
    }
    // 不为外部线程预留槽位，所有槽位都给 worker
    state.arena = std::make_shared<tbb::task_arena>(concurrency, 0);
    state.concurrency = concurrency;
    state.initialized = true;
    UpdateGlobalParallelismLocked();
    LOG(INFO) << "[TBBManager] Arena '" << tbb_name
              << "' initialized with concurrency: " << concurrency;
  }
  return state.arena;
}

void TBBManager::Enqueue(const std::string& tbb_name,
                         std::function<void()> task) {
  auto arena = Init(tbb_name);
  uint64_t task_id = GenerateUniqueTaskId();
  arena->enqueue([tbb_name, task_id, task = std::move(task)]() {
    try {
      task();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[TBBManager] Exception in task " << tbb_name << "_"
                 << task_id << ": " << e.what();
    }
  });
  LOG(DEBUG) << "[TBBManager] Enqueued task " << tbb_name << "_" << task_id;
}

int TBBManager::Concurrency(const std::string& tbb_name) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto it = task_arenas_.find(tbb_name);
  if (it == task_arenas_.end() || !it->second.initialized) {
    throw std::runtime_error("[TBBManager] Arena '" + tbb_name +
                             "' not initialized.");
  }
  return it->second.concurrency;
}

void TBBManager::UpdateGlobalParallelismLocked() {
  size_t total = 1;  // 主线程
  for (const auto& kv : task_arenas_) {
    if (kv.second.initialized) total += kv.second.concurrency;
  }
  size_t current = tbb::global_control::active_value(
      tbb::global_control::max_allowed_parallelism);
  if (total <= current && parallelism_ == nullptr) return;
  // 多个 global_control 同时存在时取最小值，必须先释放旧的
  parallelism_.reset();
  parallelism_ = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      std::max(total, static_cast<size_t>(tbb::info::default_concurrency())));
}

void TBBManager::Release() {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  for (auto& kv : task_arenas_) {
    if (kv.second.arena) {
      kv.second.arena->terminate();
      kv.second.arena.reset();
      kv.second.initialized = false;
      LOG(INFO) << "[TBBManager] Arena '" << kv.first << "' released.";
    }
  }
  task_arenas_.clear();
  parallelism_.reset();
}

TBBManager::~TBBManager() { Release(); }

std::map<std::string, int> TBBManager::ParseParallelControl(
    const std::string& cfg) {
  std::map<std::string, int> defines;
  // 格式如 "transfer:4,resolve:8"
  std::istringstream ss(cfg);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto pos = item.find(':');
    if (pos == std::string::npos) continue;
    std::string name = item.substr(0, pos);
    try {
      defines[name] = std::stoi(item.substr(pos + 1));
    } catch (const std::exception& e) {
      LOG(WARN) << "[TBBManager] Ignoring bad parallel control entry '" << item
                << "': " << e.what();
    }
  }
  return defines;
}

std::map<std::string, int>& TBBManager::GetTBBParallelCountDefines() {
  static std::map<std::string, int> defines =
      ParseParallelControl(FLAGS_custom_tbb_parallel_control);
  return defines;
}

uint64_t TBBManager::GenerateUniqueTaskId() {
  return task_id_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace utils
