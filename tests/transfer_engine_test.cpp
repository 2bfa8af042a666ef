#include "Transfer/CurlTransferEngine.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace mediagrab;

namespace {

/**
 * 本机回环上的最小 HTTP 服务，按 mode 返回固定的 200/206/416 响应。
 * 每个连接只处理一个请求，响应后关闭。
 */
class LoopbackServer {
 public:
  enum class Mode {
    HonourRange,     // Range 请求回 206
    IgnoreRange,     // 总是回 200 全量
    RejectRange,     // Range 请求回 416
    OverstateTotal,  // 206，但 Content-Range 声明的总长比实际多
    Trickle,         // 200，分小块慢慢发送
  };

  LoopbackServer(std::string body, Mode mode)
      : body_(std::move(body)), mode_(mode) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) throw std::runtime_error("socket failed");
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, 8) != 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      ::close(fd_);
      throw std::runtime_error("cannot listen on loopback");
    }
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this]() { serve(); });
  }

  ~LoopbackServer() {
    stopping_ = true;
    ::shutdown(fd_, SHUT_RDWR);
    thread_.join();
    ::close(fd_);
  }

  std::string url() const {
    return "http://127.0.0.1:" + std::to_string(port_) + "/media.bin";
  }

  // 每个请求的 Range 头，没有时为空串
  std::vector<std::string> ranges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ranges_;
  }

 private:
  void serve() {
    while (!stopping_) {
      int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        if (errno == EINTR) continue;
        return;
      }
      handle(client);
      ::close(client);
    }
  }

  void handle(int client) {
    std::string request;
    char buffer[4096];
    while (request.find("\r\n\r\n") == std::string::npos) {
      ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) return;
      request.append(buffer, static_cast<size_t>(n));
    }
    std::string range;
    auto pos = request.find("Range: bytes=");
    if (pos != std::string::npos) {
      pos += 13;
      range = request.substr(pos, request.find("\r\n", pos) - pos);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ranges_.push_back(range);
    }

    const size_t size = body_.size();
    if (!range.empty() && mode_ == Mode::RejectRange) {
      send(client, "HTTP/1.1 416 Range Not Satisfiable\r\n"
                   "Content-Range: bytes */" + std::to_string(size) + "\r\n"
                   "Content-Length: 0\r\nConnection: close\r\n\r\n");
      return;
    }
    if (!range.empty() &&
        (mode_ == Mode::HonourRange || mode_ == Mode::OverstateTotal)) {
      size_t offset = std::stoul(range);
      size_t declared = mode_ == Mode::OverstateTotal ? size + 1000 : size;
      send(client, "HTTP/1.1 206 Partial Content\r\n"
                   "Content-Range: bytes " + std::to_string(offset) + "-" +
                   std::to_string(size - 1) + "/" + std::to_string(declared) +
                   "\r\nContent-Length: " + std::to_string(size - offset) +
                   "\r\nConnection: close\r\n\r\n" + body_.substr(offset));
      return;
    }
    send(client, "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(size) +
                     "\r\nConnection: close\r\n\r\n");
    if (mode_ != Mode::Trickle) {
      send(client, body_);
      return;
    }
    for (size_t at = 0; at < size && !stopping_; at += 4096) {
      send(client, body_.substr(at, 4096));
      std::this_thread::sleep_for(10ms);
    }
  }

  static void send(int client, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n = ::send(client, data.data() + sent, data.size() - sent,
                         MSG_NOSIGNAL);
      if (n <= 0) return;
      sent += static_cast<size_t>(n);
    }
  }

  std::string body_;
  Mode mode_;
  int fd_ = -1;
  uint16_t port_ = 0;
  std::atomic<bool> stopping_{false};
  std::thread thread_;
  mutable std::mutex mutex_;
  std::vector<std::string> ranges_;
};

// file:// 源走和 HTTP 相同的写入、续传和改名路径
class TransferEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("mediagrab_transfer_" + std::to_string(::getpid()));
    fs::create_directories(dir_);
    source_ = dir_ / "source.bin";
    content_.resize(200 * 1024);
    for (size_t i = 0; i < content_.size(); ++i) {
      content_[i] = static_cast<char>('a' + i % 26);
    }
    writeFile(source_, content_);

    // 回环请求不能走环境里配置的代理
    ::setenv("no_proxy", "127.0.0.1,localhost", 1);
    ::setenv("NO_PROXY", "127.0.0.1,localhost", 1);

    TransferOptions options;
    options.progressInterval = std::chrono::milliseconds(0);
    // 小缓冲区让写回调被调用多次，便于在传输中途发信号
    options.bufferSize = 16 * 1024;
    engine_ = std::make_unique<CurlTransferEngine>(options);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  static void writeFile(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
  }

  static std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

  TransferRequest request(const std::string& name, uint64_t offset = 0) {
    TransferRequest req;
    req.fetch.url = "file://" + source_.string();
    req.destinationPath = (dir_ / name).string();
    req.stagingPath = req.destinationPath + ".1.part";
    req.resumeOffset = offset;
    return req;
  }

  TransferResult run(const TransferRequest& req) {
    return engine_->transfer(req, [this](const TransferProgress& p) {
      reports_.push_back(p);
    }, signal_);
  }

  size_t finalReports() const {
    size_t n = 0;
    for (const auto& p : reports_) n += p.final ? 1 : 0;
    return n;
  }

  fs::path dir_;
  fs::path source_;
  std::string content_;
  std::unique_ptr<CurlTransferEngine> engine_;
  CancelSignal signal_;
  std::vector<TransferProgress> reports_;
};

}  // namespace

TEST_F(TransferEngineTest, DownloadsWholeFile) {
  auto req = request("clip.mp4");
  auto result = run(req);

  EXPECT_EQ(result.outcome, TransferOutcome::Completed);
  EXPECT_EQ(result.finalPath, req.destinationPath);
  EXPECT_EQ(result.bytesDownloaded, content_.size());
  EXPECT_EQ(result.bytesTotal.value(), content_.size());
  EXPECT_FALSE(result.restartedFromZero);
  EXPECT_EQ(readFile(req.destinationPath), content_);
  EXPECT_FALSE(fs::exists(req.stagingPath));

  ASSERT_FALSE(reports_.empty());
  EXPECT_EQ(finalReports(), 1u);
  EXPECT_TRUE(reports_.back().final);
  EXPECT_EQ(reports_.back().bytesDownloaded, content_.size());
  for (size_t i = 1; i < reports_.size(); ++i) {
    EXPECT_GE(reports_[i].bytesDownloaded, reports_[i - 1].bytesDownloaded);
  }
}

TEST_F(TransferEngineTest, ResumesFromStagingFile) {
  const uint64_t offset = 40000;
  auto req = request("clip.mp4", offset);
  // 用不同的字节填充分片，结果里能看出前缀没有被重新下载；
  // 多出来的未确认字节会被截掉
  writeFile(req.stagingPath, std::string(offset + 5000, 'X'));

  auto result = run(req);
  ASSERT_EQ(result.outcome, TransferOutcome::Completed);
  EXPECT_FALSE(result.restartedFromZero);
  EXPECT_EQ(result.bytesDownloaded, content_.size());

  std::string got = readFile(result.finalPath);
  ASSERT_EQ(got.size(), content_.size());
  EXPECT_EQ(got.substr(0, offset), std::string(offset, 'X'));
  EXPECT_EQ(got.substr(offset), content_.substr(offset));
  EXPECT_GE(reports_.front().bytesDownloaded, offset);
}

TEST_F(TransferEngineTest, ShortStagingFileRestartsFromZero) {
  auto req = request("clip.mp4", 40000);
  writeFile(req.stagingPath, std::string(100, 'X'));

  auto result = run(req);
  ASSERT_EQ(result.outcome, TransferOutcome::Completed);
  EXPECT_TRUE(result.restartedFromZero);
  EXPECT_EQ(readFile(result.finalPath), content_);
  ASSERT_FALSE(reports_.empty());
  EXPECT_TRUE(reports_.front().restartedFromZero);
}

TEST_F(TransferEngineTest, CancelRemovesStagingFile) {
  auto req = request("clip.mp4", 100);
  writeFile(req.stagingPath, std::string(100, 'X'));
  signal_.request(CancelMode::Cancel);

  auto result = run(req);
  EXPECT_EQ(result.outcome, TransferOutcome::Cancelled);
  EXPECT_FALSE(fs::exists(req.stagingPath));
  EXPECT_FALSE(fs::exists(req.destinationPath));
  EXPECT_EQ(finalReports(), 1u);
}

TEST_F(TransferEngineTest, PauseKeepsStagingFile) {
  auto req = request("clip.mp4", 100);
  writeFile(req.stagingPath, std::string(100, 'X'));
  signal_.request(CancelMode::Pause);

  auto result = run(req);
  EXPECT_EQ(result.outcome, TransferOutcome::Paused);
  EXPECT_EQ(result.bytesDownloaded, 100u);
  EXPECT_EQ(fs::file_size(req.stagingPath), 100u);
  EXPECT_FALSE(fs::exists(req.destinationPath));
}

TEST_F(TransferEngineTest, CancelWinsOverPause) {
  signal_.request(CancelMode::Pause);
  signal_.request(CancelMode::Cancel);
  signal_.request(CancelMode::Pause);
  EXPECT_EQ(signal_.mode(), CancelMode::Cancel);
}

TEST_F(TransferEngineTest, MissingSourceIsNetworkError) {
  auto req = request("clip.mp4");
  req.fetch.url = "file://" + (dir_ / "nope.bin").string();
  try {
    run(req);
    FAIL() << "expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferError::Kind::NetworkError);
    EXPECT_TRUE(e.retryable());
  }
  EXPECT_FALSE(fs::exists(req.destinationPath));
  EXPECT_EQ(finalReports(), 1u);
}

TEST_F(TransferEngineTest, UnwritableStagingIsPermissionDenied) {
  auto req = request("clip.mp4");
  req.stagingPath = (dir_ / "missing-dir" / "clip.part").string();
  try {
    run(req);
    FAIL() << "expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferError::Kind::PermissionDenied);
    EXPECT_FALSE(e.retryable());
  }
}

TEST_F(TransferEngineTest, TakenDestinationGetsSuffix) {
  auto req = request("clip.mp4");
  writeFile(req.destinationPath, "old");

  auto result = run(req);
  ASSERT_EQ(result.outcome, TransferOutcome::Completed);
  EXPECT_EQ(result.finalPath, (dir_ / "clip (1).mp4").string());
  EXPECT_EQ(readFile(req.destinationPath), "old");
  EXPECT_EQ(readFile(result.finalPath), content_);
}

TEST_F(TransferEngineTest, PauseMidStreamThenResumeFromFlushedOffset) {
  auto req = request("clip.mp4");
  auto first = engine_->transfer(req, [this](const TransferProgress& p) {
    reports_.push_back(p);
    if (!p.final && p.bytesDownloaded >= 32 * 1024) {
      signal_.request(CancelMode::Pause);
    }
  }, signal_);

  ASSERT_EQ(first.outcome, TransferOutcome::Paused);
  const uint64_t offset = first.bytesDownloaded;
  EXPECT_GE(offset, 32u * 1024);
  EXPECT_LT(offset, content_.size());
  EXPECT_EQ(finalReports(), 1u);
  EXPECT_EQ(reports_.back().bytesDownloaded, offset);
  EXPECT_FALSE(fs::exists(req.destinationPath));
  // 暂停时磁盘上的分片正好是已上报的字节
  ASSERT_EQ(fs::file_size(req.stagingPath), offset);
  EXPECT_EQ(readFile(req.stagingPath), content_.substr(0, offset));

  CancelSignal again;
  reports_.clear();
  req.resumeOffset = offset;
  auto second = engine_->transfer(req, [this](const TransferProgress& p) {
    reports_.push_back(p);
  }, again);

  ASSERT_EQ(second.outcome, TransferOutcome::Completed);
  EXPECT_FALSE(second.restartedFromZero);
  EXPECT_EQ(second.bytesDownloaded, content_.size());
  // 没有重复也没有缺失的字节
  EXPECT_EQ(readFile(second.finalPath), content_);
  ASSERT_FALSE(reports_.empty());
  EXPECT_GE(reports_.front().bytesDownloaded, offset);
}

TEST_F(TransferEngineTest, CancelMidStreamRemovesPartialStaging) {
  auto req = request("clip.mp4");
  bool sawStaging = false;
  auto result = engine_->transfer(req, [&](const TransferProgress& p) {
    reports_.push_back(p);
    if (!p.final && p.bytesDownloaded >= 32 * 1024) {
      sawStaging = fs::exists(req.stagingPath);
      signal_.request(CancelMode::Cancel);
    }
  }, signal_);

  EXPECT_TRUE(sawStaging);
  EXPECT_EQ(result.outcome, TransferOutcome::Cancelled);
  EXPECT_LT(result.bytesDownloaded, content_.size());
  EXPECT_FALSE(fs::exists(req.stagingPath));
  EXPECT_FALSE(fs::exists(req.destinationPath));
  EXPECT_EQ(finalReports(), 1u);
}

TEST_F(TransferEngineTest, HttpRangeRequestResumes) {
  LoopbackServer server(content_, LoopbackServer::Mode::HonourRange);
  const uint64_t offset = 50000;
  auto req = request("clip.mp4", offset);
  req.fetch.url = server.url();
  writeFile(req.stagingPath, std::string(offset, 'X'));

  auto result = run(req);
  ASSERT_EQ(result.outcome, TransferOutcome::Completed);
  EXPECT_FALSE(result.restartedFromZero);
  EXPECT_EQ(result.bytesTotal.value(), content_.size());
  ASSERT_EQ(server.ranges().size(), 1u);
  EXPECT_EQ(server.ranges()[0], std::to_string(offset) + "-");

  std::string got = readFile(result.finalPath);
  EXPECT_EQ(got.substr(0, offset), std::string(offset, 'X'));
  EXPECT_EQ(got.substr(offset), content_.substr(offset));
}

TEST_F(TransferEngineTest, IgnoredRangeTruncatesAndRestarts) {
  LoopbackServer server(content_, LoopbackServer::Mode::IgnoreRange);
  auto req = request("clip.mp4", 50000);
  req.fetch.url = server.url();
  writeFile(req.stagingPath, std::string(50000, 'X'));

  auto result = run(req);
  ASSERT_EQ(result.outcome, TransferOutcome::Completed);
  EXPECT_TRUE(result.restartedFromZero);
  EXPECT_EQ(result.bytesDownloaded, content_.size());
  // 旧分片被截断，文件里没有残留的 'X'
  EXPECT_EQ(readFile(result.finalPath), content_);
  ASSERT_FALSE(reports_.empty());
  EXPECT_TRUE(reports_.back().restartedFromZero);
  ASSERT_EQ(server.ranges().size(), 1u);
  EXPECT_EQ(server.ranges()[0], "50000-");
}

TEST_F(TransferEngineTest, RejectedRangeIsServerRejectedRange) {
  LoopbackServer server(content_, LoopbackServer::Mode::RejectRange);
  auto req = request("clip.mp4", 1000);
  req.fetch.url = server.url();
  writeFile(req.stagingPath, std::string(1000, 'X'));

  try {
    run(req);
    FAIL() << "expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferError::Kind::ServerRejectedRange);
    EXPECT_FALSE(e.retryable());
  }
  EXPECT_FALSE(fs::exists(req.destinationPath));
  EXPECT_EQ(finalReports(), 1u);
}

TEST_F(TransferEngineTest, SizeMismatchIsCorrupt) {
  LoopbackServer server(content_, LoopbackServer::Mode::OverstateTotal);
  const uint64_t offset = 1000;
  auto req = request("clip.mp4", offset);
  req.fetch.url = server.url();
  writeFile(req.stagingPath, content_.substr(0, offset));

  try {
    run(req);
    FAIL() << "expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.kind(), TransferError::Kind::Corrupt);
    EXPECT_FALSE(e.retryable());
  }
  EXPECT_FALSE(fs::exists(req.stagingPath));
  EXPECT_FALSE(fs::exists(req.destinationPath));
}

TEST_F(TransferEngineTest, ProgressIsThrottled) {
  LoopbackServer server(content_.substr(0, 100 * 1024),
                        LoopbackServer::Mode::Trickle);
  TransferOptions options;
  options.progressInterval = 60ms;
  CurlTransferEngine engine(options);

  auto req = request("clip.mp4");
  req.fetch.url = server.url();
  std::vector<std::chrono::steady_clock::time_point> stamps;
  auto start = std::chrono::steady_clock::now();
  auto result = engine.transfer(req, [&](const TransferProgress& p) {
    reports_.push_back(p);
    stamps.push_back(std::chrono::steady_clock::now());
  }, signal_);

  ASSERT_EQ(result.outcome, TransferOutcome::Completed);
  EXPECT_EQ(result.bytesDownloaded, 100u * 1024);
  ASSERT_FALSE(reports_.empty());
  EXPECT_EQ(finalReports(), 1u);
  EXPECT_TRUE(reports_.back().final);
  // 25 块数据，节流后的中间上报远少于写回调次数
  EXPECT_LT(reports_.size(), 15u);

  auto previous = start;
  for (size_t i = 0; i + 1 < reports_.size(); ++i) {
    EXPECT_FALSE(reports_[i].final);
    EXPECT_GE(stamps[i] - previous, 55ms) << "report " << i;
    previous = stamps[i];
  }
}
