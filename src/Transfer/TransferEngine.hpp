#ifndef MEDIAGRAB_TRANSFER_ENGINE_HPP_
#define MEDIAGRAB_TRANSFER_ENGINE_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "Resolver/MediaVariant.hpp"
#include "Transfer/CancelSignal.hpp"

namespace mediagrab {

class TransferError : public std::runtime_error {
 public:
  enum class Kind {
    NetworkError,
    DiskFull,
    PermissionDenied,
    ServerRejectedRange,
    Corrupt
  };

  TransferError(Kind kind, const std::string& detail);

  Kind kind() const { return kind_; }
  const std::string& detail() const { return detail_; }
  // 只有网络错误值得自动重试
  bool retryable() const { return kind_ == Kind::NetworkError; }

 private:
  Kind kind_;
  std::string detail_;
};

const char* toString(TransferError::Kind kind);

struct TransferRequest {
  FetchDescriptor fetch;
  std::string destinationPath;
  std::string stagingPath;
  uint64_t resumeOffset = 0;
};

struct TransferProgress {
  uint64_t bytesDownloaded = 0;  // 包含续传前已有的字节
  std::optional<uint64_t> bytesTotal;
  uint64_t bytesPerSecond = 0;
  bool restartedFromZero = false;  // 本次传输已放弃续传，字节数从 0 重新计
  bool final = false;  // 每条退出路径上的最后一次上报
};

using ProgressSink = std::function<void(const TransferProgress&)>;

enum class TransferOutcome { Completed, Paused, Cancelled };

const char* toString(TransferOutcome outcome);

struct TransferResult {
  TransferOutcome outcome = TransferOutcome::Completed;
  uint64_t bytesDownloaded = 0;
  std::optional<uint64_t> bytesTotal;
  // 源不支持 Range 或本地分片无效，已从 0 开始重新下载
  bool restartedFromZero = false;
  // Completed 时的实际文件名，目标名被占用时会带数字后缀
  std::string finalPath;
};

/**
 * @brief 把一个 FetchDescriptor 下载到本地
 *
 * 数据先写入 stagingPath，完整结束并 fsync 之后才原子 rename 到目标路径。
 * Pause 时保留分片，Cancel 时删除分片。失败抛 TransferError。
 * 实现必须可以被多个工作线程同时调用（每次调用使用独立的 staging 文件）。
 */
class TransferEngine {
 public:
  virtual ~TransferEngine() = default;

  virtual TransferResult transfer(const TransferRequest& request,
                                  const ProgressSink& progressSink,
                                  const CancelSignal& cancelSignal) = 0;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_TRANSFER_ENGINE_HPP_
