#include "YtDlpResolver.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"
#include "utils/process.hpp"

namespace mediagrab {

using json = nlohmann::json;

namespace {

std::string stringField(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

std::optional<uint64_t> sizeField(const json& j) {
  for (const char* key : {"filesize", "filesize_approx"}) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number() && it->get<double>() > 0) {
      return static_cast<uint64_t>(it->get<double>());
    }
  }
  return std::nullopt;
}

int heightField(const json& j) {
  auto it = j.find("height");
  if (it == j.end() || !it->is_number()) return 0;
  return it->get<int>();
}

// 传输引擎只会普通 HTTP，分片协议跳过
bool fetchableProtocol(const std::string& protocol) {
  return protocol.empty() || protocol == "http" || protocol == "https";
}

bool hasCodec(const json& j, const char* key) {
  return stringField(j, key) != "none";
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
  for (const char* needle : needles) {
    if (text.find(needle) != std::string::npos) return true;
  }
  return false;
}

// 取最后一行 "ERROR: ..."，没有就取最后一个非空行
std::string errorLine(const std::string& stderrText) {
  std::istringstream in(stderrText);
  std::string line, lastError, lastLine;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    lastLine = line;
    if (line.rfind("ERROR:", 0) == 0) lastError = line.substr(6);
  }
  std::string result = lastError.empty() ? lastLine : lastError;
  auto begin = result.find_first_not_of(" \t");
  return begin == std::string::npos ? "" : result.substr(begin);
}

MediaVariant makeVariant(const json& format, const std::string& sourceUrl,
                         const std::string& title) {
  MediaVariant variant;
  variant.sourceUrl = sourceUrl;
  variant.title = title;
  variant.formatId = stringField(format, "format_id");
  variant.container = stringField(format, "ext");
  variant.height = heightField(format);
  variant.estimatedSizeBytes = sizeField(format);
  if (variant.height > 0) {
    variant.resolutionLabel = std::to_string(variant.height) + "p";
  } else if (!hasCodec(format, "vcodec")) {
    variant.resolutionLabel = "audio only";
  } else {
    variant.resolutionLabel = stringField(format, "format_note");
    if (variant.resolutionLabel.empty()) variant.resolutionLabel = "unknown";
  }
  variant.fetch.url = stringField(format, "url");
  auto headers = format.find("http_headers");
  if (headers != format.end() && headers->is_object()) {
    for (auto it = headers->begin(); it != headers->end(); ++it) {
      if (it.value().is_string()) {
        variant.fetch.headers[it.key()] = it.value().get<std::string>();
      }
    }
  }
  return variant;
}

}  // namespace

YtDlpResolver::YtDlpResolver(std::string platform, YtDlpOptions options,
                             std::shared_ptr<BrowserSession> browser,
                             std::shared_ptr<const CredentialStore> credentials)
    : platform_(std::move(platform)),
      options_(std::move(options)),
      browser_(std::move(browser)),
      credentials_(std::move(credentials)) {}

std::vector<MediaVariant> YtDlpResolver::resolve(const std::string& url,
                                                 const CancelSignal& cancel) {
  std::string output =
      runExtractor({"-J", "--no-playlist", "--no-warnings"}, url, cancel);
  std::vector<MediaVariant> variants = parseVariants(output, url);
  if (credentials_) {
    for (auto& variant : variants) credentials_->apply(platform_, variant.fetch);
  }
  LOG(INFO) << "[Resolver] " << platform_ << " found " << variants.size()
            << " variants for " << url;
  return variants;
}

std::vector<PlaylistEntry> YtDlpResolver::resolvePlaylist(
    const std::string& url, size_t maxEntries, const CancelSignal& cancel) {
  std::string output = runExtractor(
      {"-J", "--flat-playlist", "--no-warnings", "--playlist-end",
       std::to_string(maxEntries)},
      url, cancel);
  return parsePlaylist(output, url, maxEntries);
}

std::string YtDlpResolver::runExtractor(const std::vector<std::string>& args,
                                        const std::string& url,
                                        const CancelSignal& cancel) {
  std::unique_ptr<BrowserCapture> capture;
  if (browser_) capture = browser_->render(url, cancel);

  std::vector<std::string> argv{options_.executable};
  argv.insert(argv.end(), args.begin(), args.end());
  if (capture && capture->hasCookies()) {
    argv.push_back("--cookies");
    argv.push_back(capture->cookieFile());
  }
  argv.push_back("--");
  argv.push_back(url);

  utils::ProcessResult result = utils::RunProcess(
      argv, options_.timeout, [&cancel]() { return cancel.requested(); });
  if (result.aborted) {
    throw ResolutionError(ResolutionError::Kind::Cancelled, url);
  }
  if (result.timedOut) {
    throw ResolutionError(ResolutionError::Kind::NetworkError,
                          "extractor timed out after " +
                              std::to_string(options_.timeout.count()) + "s");
  }
  if (result.exitCode == 127) {
    throw ResolutionError(ResolutionError::Kind::NotSupported,
                          "extractor not found: " + options_.executable);
  }
  if (result.exitCode != 0) {
    LOG(DEBUG) << "[Resolver] " << options_.executable << " exited with "
               << result.exitCode << ": " << result.err;
    throw classifyFailure(result.err);
  }
  return result.out;
}

std::vector<MediaVariant> YtDlpResolver::parseVariants(
    const std::string& document, const std::string& sourceUrl) {
  json doc = json::parse(document, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw ResolutionError(ResolutionError::Kind::PlatformChanged,
                          "unreadable extractor output");
  }
  std::string title = stringField(doc, "title");
  // 音视频齐全 2，只有画面 1，只有声音 0
  std::vector<std::pair<int, MediaVariant>> ranked;

  auto formats = doc.find("formats");
  if (formats != doc.end() && formats->is_array()) {
    for (const auto& format : *formats) {
      if (!format.is_object()) continue;
      if (stringField(format, "url").empty()) continue;
      bool video = hasCodec(format, "vcodec");
      bool audio = hasCodec(format, "acodec");
      if (!video && !audio) continue;
      if (!fetchableProtocol(stringField(format, "protocol"))) continue;
      ranked.emplace_back(video ? (audio ? 2 : 1) : 0,
                          makeVariant(format, sourceUrl, title));
    }
  } else if (!stringField(doc, "url").empty()) {
    ranked.emplace_back(2, makeVariant(doc, sourceUrl, title));
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const std::pair<int, MediaVariant>& a,
                      const std::pair<int, MediaVariant>& b) {
                     if (a.first != b.first) return a.first > b.first;
                     if (a.second.height != b.second.height) {
                       return a.second.height > b.second.height;
                     }
                     return a.second.estimatedSizeBytes.value_or(0) >
                            b.second.estimatedSizeBytes.value_or(0);
                   });
  std::vector<MediaVariant> variants;
  variants.reserve(ranked.size());
  for (auto& entry : ranked) variants.push_back(std::move(entry.second));
  return variants;
}

std::vector<PlaylistEntry> YtDlpResolver::parsePlaylist(
    const std::string& document, const std::string& sourceUrl,
    size_t maxEntries) {
  json doc = json::parse(document, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw ResolutionError(ResolutionError::Kind::PlatformChanged,
                          "unreadable extractor output");
  }
  std::vector<PlaylistEntry> entries;
  auto list = doc.find("entries");
  if (list == doc.end() || !list->is_array()) {
    std::string url = stringField(doc, "webpage_url");
    entries.push_back(PlaylistEntry{url.empty() ? sourceUrl : url,
                                    stringField(doc, "title")});
    return entries;
  }
  for (const auto& entry : *list) {
    if (entries.size() >= maxEntries) break;
    if (!entry.is_object()) continue;
    std::string url = stringField(entry, "url");
    if (url.empty()) url = stringField(entry, "webpage_url");
    if (url.empty()) continue;
    entries.push_back(PlaylistEntry{url, stringField(entry, "title")});
  }
  return entries;
}

ResolutionError YtDlpResolver::classifyFailure(const std::string& stderrText) {
  std::string detail = errorLine(stderrText);
  if (detail.empty()) detail = "extractor failed";
  std::string text = toLower(stderrText);

  using Kind = ResolutionError::Kind;
  if (containsAny(text, {"unsupported url"})) {
    return ResolutionError(Kind::NotSupported, detail);
  }
  if (containsAny(text, {"private video", "is private", "has been removed",
                         "video unavailable", "not available", "http error 404",
                         "account associated with this video has been terminated",
                         "login required", "sign in to confirm"})) {
    return ResolutionError(Kind::PrivateOrRemoved, detail);
  }
  if (containsAny(text, {"timed out", "temporary failure", "name resolution",
                         "connection reset", "connection refused",
                         "network is unreachable", "http error 5",
                         "http error 429", "urlopen error"})) {
    return ResolutionError(Kind::NetworkError, detail);
  }
  // "unable to extract"、"no video formats" 等：提取逻辑跟不上页面变化
  return ResolutionError(Kind::PlatformChanged, detail);
}

}  // namespace mediagrab
