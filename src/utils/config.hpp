#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "logger.hpp"

namespace utils {

// 同时运行的下载数的硬上限，也是 transfer arena 的默认并发度
constexpr int kMaxConcurrencyCeiling = 16;

struct Config {
  // 调度
  int maxConcurrency = 3;
  int maxRetries = 3;
  std::chrono::milliseconds retryBaseDelay{1000};
  std::chrono::milliseconds retryMaxDelay{60000};

  // 传输
  std::chrono::seconds stallTimeout{30};
  std::chrono::seconds connectTimeout{15};
  std::chrono::milliseconds progressInterval{250};
  bool writeInfoJson = false;

  // 事件
  size_t eventBufferSize = 256;

  // 存储
  std::string downloadDir = ".";
  std::string stateFile;  // 为空则不持久化
  std::chrono::seconds autosaveInterval{10};

  // 解析
  std::string ytdlpPath = "yt-dlp";
  std::string browserHelper;  // 为空则不渲染动态页面
  std::chrono::seconds resolveTimeout{120};
  std::string credentialsFile;
  std::string preferredResolution = "best";
  std::string preferredContainer;

  LogConfig log;
};

// 唯一读取 gflags 的地方
Config LoadConfigFromFlags();

}  // namespace utils
