#include "BrowserSession.hpp"

#include <stdlib.h>

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

#include "Resolver/Resolver.hpp"
#include "utils/logger.hpp"
#include "utils/process.hpp"

namespace fs = std::filesystem;

namespace mediagrab {

BrowserCapture::BrowserCapture(std::string dir) : dir_(std::move(dir)) {}

BrowserCapture::~BrowserCapture() {
  std::error_code ec;
  fs::remove_all(dir_, ec);
  if (ec) {
    LOG(WARN) << "[Browser] Failed to remove " << dir_ << ": " << ec.message();
  }
}

std::string BrowserCapture::cookieFile() const {
  return (fs::path(dir_) / "cookies.txt").string();
}

bool BrowserCapture::hasCookies() const {
  std::error_code ec;
  return fs::file_size(cookieFile(), ec) > 0 && !ec;
}

ExternalBrowserSession::ExternalBrowserSession(std::string helper,
                                               std::chrono::seconds timeout)
    : helper_(std::move(helper)), timeout_(timeout) {}

std::unique_ptr<BrowserCapture> ExternalBrowserSession::render(
    const std::string& url, const CancelSignal& cancel) {
  std::string pattern =
      (fs::temp_directory_path() / "mediagrab-browser-XXXXXX").string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp");
  }
  // 从这里开始由 capture 负责清理
  auto capture = std::make_unique<BrowserCapture>(buffer.data());

  LOG(DEBUG) << "[Browser] Rendering " << url << " into " << capture->dir();
  utils::ProcessResult result = utils::RunProcess(
      {helper_, url, capture->cookieFile()}, timeout_,
      [&cancel]() { return cancel.requested(); });

  if (result.aborted) {
    throw ResolutionError(ResolutionError::Kind::Cancelled, url);
  }
  if (result.timedOut) {
    throw ResolutionError(ResolutionError::Kind::NetworkError,
                          "page rendering timed out: " + url);
  }
  if (result.exitCode != 0) {
    throw ResolutionError(ResolutionError::Kind::NetworkError,
                          "page rendering failed (" +
                              std::to_string(result.exitCode) + "): " + result.err);
  }
  return capture;
}

}  // namespace mediagrab
