#ifndef MEDIAGRAB_YTDLP_RESOLVER_HPP_
#define MEDIAGRAB_YTDLP_RESOLVER_HPP_

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "Resolver/BrowserSession.hpp"
#include "Resolver/CredentialStore.hpp"
#include "Resolver/Resolver.hpp"

namespace mediagrab {

struct YtDlpOptions {
  std::string executable = "yt-dlp";
  std::chrono::seconds timeout{120};
};

/**
 * @brief 调用 yt-dlp 提取直链
 *
 * 每次解析启动一个 `yt-dlp -J` 子进程，超时或取消时杀掉子进程。
 * browser 不为空时先渲染页面，把导出的 cookie 交给 yt-dlp。
 */
class YtDlpResolver : public Resolver {
 public:
  YtDlpResolver(std::string platform, YtDlpOptions options,
                std::shared_ptr<BrowserSession> browser = nullptr,
                std::shared_ptr<const CredentialStore> credentials = nullptr);

  std::string name() const override { return platform_; }

  std::vector<MediaVariant> resolve(const std::string& url,
                                    const CancelSignal& cancel) override;
  std::vector<PlaylistEntry> resolvePlaylist(const std::string& url,
                                             size_t maxEntries,
                                             const CancelSignal& cancel) override;

  // 解析 `yt-dlp -J` 的输出，结果按从好到差排序
  static std::vector<MediaVariant> parseVariants(const std::string& document,
                                                 const std::string& sourceUrl);
  static std::vector<PlaylistEntry> parsePlaylist(const std::string& document,
                                                  const std::string& sourceUrl,
                                                  size_t maxEntries);
  // 根据 stderr 判断失败类型
  static ResolutionError classifyFailure(const std::string& stderrText);

 private:
  std::string runExtractor(const std::vector<std::string>& args,
                           const std::string& url, const CancelSignal& cancel);

  std::string platform_;
  YtDlpOptions options_;
  std::shared_ptr<BrowserSession> browser_;
  std::shared_ptr<const CredentialStore> credentials_;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_YTDLP_RESOLVER_HPP_
