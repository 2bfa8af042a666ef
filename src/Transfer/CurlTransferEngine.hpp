#ifndef MEDIAGRAB_CURL_TRANSFER_ENGINE_HPP_
#define MEDIAGRAB_CURL_TRANSFER_ENGINE_HPP_

#include <chrono>
#include <string>

#include "Transfer/TransferEngine.hpp"

namespace mediagrab {

struct TransferOptions {
  std::chrono::seconds connectTimeout{15};
  std::chrono::seconds stallTimeout{30};
  std::chrono::milliseconds progressInterval{250};
  long bufferSize = 64 * 1024;
  std::string userAgent = "mediagrab/1.0";
};

/**
 * @brief 基于 libcurl easy 接口的传输引擎
 *
 * 每次 transfer 使用独立的 easy handle，支持 http(s) 和 file://。
 * 续传用 Range 请求；服务端返回 200 时截断分片从头下载并标记
 * restartedFromZero，返回 416 时抛 ServerRejectedRange。
 */
class CurlTransferEngine : public TransferEngine {
 public:
  explicit CurlTransferEngine(TransferOptions options = TransferOptions());
  ~CurlTransferEngine() override = default;

  CurlTransferEngine(const CurlTransferEngine&) = delete;
  CurlTransferEngine& operator=(const CurlTransferEngine&) = delete;

  TransferResult transfer(const TransferRequest& request,
                          const ProgressSink& progressSink,
                          const CancelSignal& cancelSignal) override;

  // curl_global_init，进程内只执行一次
  static void globalInit();

 private:
  TransferOptions options_;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_CURL_TRANSFER_ENGINE_HPP_
