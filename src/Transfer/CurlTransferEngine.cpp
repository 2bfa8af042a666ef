#include "CurlTransferEngine.hpp"

#include <curl/curl.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>

#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace mediagrab {

namespace {

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct FileCloser {
  void operator()(FILE* file) const { std::fclose(file); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;
using FileHandle = std::unique_ptr<FILE, FileCloser>;

bool isHttpUrl(const std::string& url) {
  std::string prefix = url.substr(0, 8);
  std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return prefix.rfind("http://", 0) == 0 || prefix.rfind("https://", 0) == 0;
}

TransferError::Kind kindFromErrno(int err) {
  switch (err) {
    case ENOSPC:
    case EDQUOT:
    case EFBIG:
      return TransferError::Kind::DiskFull;
    case EACCES:
    case EPERM:
    case EROFS:
    case ENOENT:
    case ENOTDIR:
      return TransferError::Kind::PermissionDenied;
    default:
      return TransferError::Kind::Corrupt;
  }
}

std::string trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

// "bytes 100-199/2000" -> 2000，总长未知（"*"）时返回空
std::optional<uint64_t> parseContentRangeTotal(const std::string& value) {
  auto slash = value.rfind('/');
  if (slash == std::string::npos || slash + 1 >= value.size()) {
    return std::nullopt;
  }
  std::string total = value.substr(slash + 1);
  if (total.empty() ||
      !std::all_of(total.begin(), total.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  return std::stoull(total);
}

struct TransferContext {
  FILE* file = nullptr;
  CURL* curl = nullptr;
  const CancelSignal* signal = nullptr;
  const ProgressSink* sink = nullptr;
  std::chrono::milliseconds interval{0};
  bool http = false;

  uint64_t offset = 0;   // 本次会话的起点
  uint64_t written = 0;  // 本次会话写入的字节
  bool bodyStarted = false;
  bool restartedFromZero = false;
  int writeErrno = 0;
  std::optional<uint64_t> total;
  std::optional<uint64_t> contentRangeTotal;

  std::chrono::steady_clock::time_point startTime;
  std::chrono::steady_clock::time_point lastEmit;

  uint64_t bytes() const { return offset + written; }

  uint64_t speed() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - startTime)
                       .count();
    return elapsed > 0 ? written * 1000 / static_cast<uint64_t>(elapsed) : 0;
  }

  void emit(bool final) {
    if (sink == nullptr || !*sink) return;
    auto now = std::chrono::steady_clock::now();
    if (!final && now - lastEmit < interval) return;
    lastEmit = now;
    TransferProgress progress;
    progress.bytesDownloaded = bytes();
    progress.bytesTotal = total;
    progress.bytesPerSecond = speed();
    progress.restartedFromZero = restartedFromZero;
    progress.final = final;
    try {
      (*sink)(progress);
    } catch (const std::exception& e) {
      // 回调运行在 libcurl 的 C 栈帧里，异常不能穿过去
      LOG(ERROR) << "[Transfer] progress sink threw: " << e.what();
    }
  }
};

size_t headerCallback(char* buffer, size_t size, size_t nitems,
                      void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  size_t len = size * nitems;
  std::string line(buffer, len);
  // 重定向时每个响应都有自己的状态行
  if (line.rfind("HTTP/", 0) == 0) {
    ctx->contentRangeTotal.reset();
    return len;
  }
  auto colon = line.find(':');
  if (colon == std::string::npos) return len;
  std::string name = line.substr(0, colon);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (name == "content-range") {
    ctx->contentRangeTotal = parseContentRangeTotal(trim(line.substr(colon + 1)));
  }
  return len;
}

// 第一块数据到达时响应头已经完整，在这里判断 Range 是否生效
bool beginBody(TransferContext* ctx) {
  ctx->bodyStarted = true;
  long code = 0;
  curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
  if (ctx->http && ctx->offset > 0 && code == 200) {
    LOG(WARN) << "[Transfer] Server ignored range request at offset "
              << ctx->offset << ", restarting from zero";
    if (::ftruncate(::fileno(ctx->file), 0) != 0 ||
        ::fseeko(ctx->file, 0, SEEK_SET) != 0) {
      ctx->writeErrno = errno;
      return false;
    }
    ctx->offset = 0;
    ctx->restartedFromZero = true;
  }
  if (ctx->http && ctx->offset > 0 && ctx->contentRangeTotal) {
    ctx->total = ctx->contentRangeTotal;
  } else {
    curl_off_t length = -1;
    curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0) ctx->total = ctx->offset + static_cast<uint64_t>(length);
  }
  return true;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  if (ctx->signal->requested()) return 0;
  if (!ctx->bodyStarted && !beginBody(ctx)) return 0;
  size_t len = size * nmemb;
  size_t n = std::fwrite(ptr, 1, len, ctx->file);
  if (n != len) {
    ctx->writeErrno = errno != 0 ? errno : EIO;
    return 0;
  }
  ctx->written += n;
  ctx->emit(false);
  return len;
}

// 没有数据流动时也要能及时响应暂停/取消
int xferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  auto* ctx = static_cast<TransferContext*>(clientp);
  return ctx->signal->requested() ? 1 : 0;
}

[[noreturn]] void fail(TransferContext& ctx, TransferError::Kind kind,
                       const std::string& detail) {
  ctx.emit(true);
  throw TransferError(kind, detail);
}

void removeQuietly(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    LOG(WARN) << "[Transfer] Cannot remove " << path << ": " << ec.message();
  }
}

}  // namespace

CurlTransferEngine::CurlTransferEngine(TransferOptions options)
    : options_(std::move(options)) {
  globalInit();
}

void CurlTransferEngine::globalInit() {
  static std::once_flag once;
  std::call_once(once, []() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      LOG(FATAL) << "curl_global_init failed: " << curl_easy_strerror(rc);
    }
  });
}

TransferResult CurlTransferEngine::transfer(const TransferRequest& request,
                                            const ProgressSink& progressSink,
                                            const CancelSignal& cancelSignal) {
  TransferContext ctx;
  ctx.signal = &cancelSignal;
  ctx.sink = &progressSink;
  ctx.interval = options_.progressInterval;
  ctx.http = isHttpUrl(request.fetch.url);
  ctx.startTime = std::chrono::steady_clock::now();
  ctx.lastEmit = ctx.startTime;

  // 以磁盘上真实存在的字节为准重新校验续传点
  uint64_t onDisk = utils::FileSizeOrZero(request.stagingPath);
  ctx.offset = request.resumeOffset;
  if (ctx.offset > 0 && onDisk < ctx.offset) {
    LOG(WARN) << "[Transfer] " << request.stagingPath << " holds " << onDisk
              << " bytes, expected " << ctx.offset
              << "; discarding partial data";
    ctx.offset = 0;
    ctx.restartedFromZero = true;
  }

  TransferResult result;
  if (cancelSignal.requested()) {
    result.bytesDownloaded = ctx.offset;
    if (cancelSignal.mode() == CancelMode::Cancel) {
      removeQuietly(request.stagingPath);
      result.outcome = TransferOutcome::Cancelled;
    } else {
      result.outcome = TransferOutcome::Paused;
    }
    ctx.emit(true);
    return result;
  }

  FileHandle file(
      std::fopen(request.stagingPath.c_str(), ctx.offset > 0 ? "r+b" : "wb"));
  if (!file) {
    int err = errno;
    fail(ctx, kindFromErrno(err),
         "cannot open " + request.stagingPath + ": " + std::strerror(err));
  }
  // 比记录多出来的字节没有被确认过，截掉
  if (::ftruncate(::fileno(file.get()), static_cast<off_t>(ctx.offset)) != 0 ||
      ::fseeko(file.get(), static_cast<off_t>(ctx.offset), SEEK_SET) != 0) {
    int err = errno;
    fail(ctx, kindFromErrno(err),
         "cannot prepare " + request.stagingPath + ": " + std::strerror(err));
  }
  ctx.file = file.get();

  CurlHandle curl(curl_easy_init());
  if (!curl) {
    fail(ctx, TransferError::Kind::NetworkError, "curl_easy_init failed");
  }
  ctx.curl = curl.get();

  HeaderList headers;
  for (const auto& kv : request.fetch.headers) {
    std::string line = kv.first + ": " + kv.second;
    curl_slist* head = curl_slist_append(headers.get(), line.c_str());
    if (head == nullptr) {
      fail(ctx, TransferError::Kind::NetworkError, "curl_slist_append failed");
    }
    if (!headers) headers.reset(head);
  }

  char errorBuffer[CURL_ERROR_SIZE] = {0};
  std::string range = std::to_string(ctx.offset) + "-";

  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, request.fetch.url.c_str());
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferInfoCallback);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errorBuffer);
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(options_.connectTimeout.count()));
  // 停滞检测：stallTimeout 内平均速度低于 1 B/s 视为网络错误
  curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME,
                   static_cast<long>(options_.stallTimeout.count()));
  curl_easy_setopt(h, CURLOPT_BUFFERSIZE, options_.bufferSize);
  curl_easy_setopt(h, CURLOPT_USERAGENT, options_.userAgent.c_str());
  if (headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  if (!request.fetch.cookies.empty()) {
    curl_easy_setopt(h, CURLOPT_COOKIE, request.fetch.cookies.c_str());
  }
  if (ctx.offset > 0) curl_easy_setopt(h, CURLOPT_RANGE, range.c_str());

  LOG(DEBUG) << "[Transfer] GET " << request.fetch.url << " -> "
             << request.stagingPath << " from offset " << ctx.offset;
  CURLcode rc = curl_easy_perform(h);

  result.restartedFromZero = ctx.restartedFromZero;
  result.bytesTotal = ctx.total;

  if (rc != CURLE_OK && cancelSignal.requested()) {
    result.bytesDownloaded = ctx.bytes();
    if (cancelSignal.mode() == CancelMode::Cancel) {
      file.reset();
      removeQuietly(request.stagingPath);
      result.outcome = TransferOutcome::Cancelled;
    } else {
      // 分片保留在磁盘上，续传时会重新校验
      if (std::fflush(file.get()) != 0 || ::fsync(::fileno(file.get())) != 0) {
        LOG(WARN) << "[Transfer] Flushing " << request.stagingPath
                  << " failed: " << std::strerror(errno);
      }
      file.reset();
      result.outcome = TransferOutcome::Paused;
    }
    ctx.emit(true);
    return result;
  }

  if (rc != CURLE_OK) {
    file.reset();
    if (ctx.writeErrno != 0) {
      fail(ctx, kindFromErrno(ctx.writeErrno),
           "writing " + request.stagingPath + ": " +
               std::strerror(ctx.writeErrno));
    }
    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    std::string detail = errorBuffer[0] != '\0' ? std::string(errorBuffer)
                                                : curl_easy_strerror(rc);
    if (rc == CURLE_HTTP_RETURNED_ERROR) {
      if (code == 416) {
        fail(ctx, TransferError::Kind::ServerRejectedRange,
             "HTTP 416 for range " + range);
      }
      if (code == 401 || code == 403) {
        fail(ctx, TransferError::Kind::PermissionDenied,
             "HTTP " + std::to_string(code));
      }
      fail(ctx, TransferError::Kind::NetworkError,
           "HTTP " + std::to_string(code));
    }
    if (rc == CURLE_RANGE_ERROR || rc == CURLE_BAD_DOWNLOAD_RESUME) {
      fail(ctx, TransferError::Kind::ServerRejectedRange, detail);
    }
    fail(ctx, TransferError::Kind::NetworkError, detail);
  }

  // 先落盘再改名，崩溃后至少能从磁盘上的字节数续传
  if (std::fflush(file.get()) != 0 || ::fsync(::fileno(file.get())) != 0) {
    int err = errno;
    file.reset();
    fail(ctx, kindFromErrno(err),
         "syncing " + request.stagingPath + ": " + std::strerror(err));
  }
  if (std::fclose(file.release()) != 0) {
    int err = errno;
    fail(ctx, kindFromErrno(err),
         "closing " + request.stagingPath + ": " + std::strerror(err));
  }

  uint64_t size = utils::FileSizeOrZero(request.stagingPath);
  if (ctx.total && size != *ctx.total) {
    removeQuietly(request.stagingPath);
    fail(ctx, TransferError::Kind::Corrupt,
         "expected " + std::to_string(*ctx.total) + " bytes, got " +
             std::to_string(size));
  }
  ctx.total = size;
  ctx.written = size - ctx.offset;

  std::string finalPath = utils::UniquePath(request.destinationPath);
  if (finalPath != request.destinationPath) {
    LOG(WARN) << "[Transfer] " << request.destinationPath
              << " already exists, saving as " << finalPath;
  }
  std::error_code ec;
  std::filesystem::rename(request.stagingPath, finalPath, ec);
  if (ec) {
    fail(ctx, kindFromErrno(ec.value()),
         "renaming to " + finalPath + ": " + ec.message());
  }

  result.outcome = TransferOutcome::Completed;
  result.bytesDownloaded = size;
  result.bytesTotal = size;
  result.finalPath = finalPath;
  ctx.emit(true);
  return result;
}

}  // namespace mediagrab
