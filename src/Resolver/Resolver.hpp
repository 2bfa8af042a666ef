#ifndef MEDIAGRAB_RESOLVER_HPP_
#define MEDIAGRAB_RESOLVER_HPP_

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "Resolver/MediaVariant.hpp"
#include "Transfer/CancelSignal.hpp"

namespace mediagrab {

class ResolutionError : public std::runtime_error {
 public:
  enum class Kind {
    NotSupported,
    NetworkError,
    PlatformChanged,
    PrivateOrRemoved,
    Cancelled  // 调用方放弃了解析
  };

  ResolutionError(Kind kind, const std::string& detail);

  Kind kind() const { return kind_; }
  const std::string& detail() const { return detail_; }

 private:
  Kind kind_;
  std::string detail_;
};

const char* toString(ResolutionError::Kind kind);

struct PlaylistEntry {
  std::string url;
  std::string title;
};

/**
 * @brief 把一个平台的页面 URL 解析成可下载的变体
 *
 * 实现必须可重入：多个线程可以同时解析不同的 URL，解析过程不修改共享状态。
 * 失败抛 ResolutionError；cancel 被触发后要尽快以 Cancelled 返回。
 */
class Resolver {
 public:
  virtual ~Resolver() = default;

  virtual std::string name() const = 0;

  // 按从好到差排序
  virtual std::vector<MediaVariant> resolve(const std::string& url,
                                            const CancelSignal& cancel) = 0;

  // 默认把 URL 本身当作只有一项的列表
  virtual std::vector<PlaylistEntry> resolvePlaylist(const std::string& url,
                                                     size_t maxEntries,
                                                     const CancelSignal& cancel);
};

// "https://m.YouTube.com:443/watch?v=1" -> "m.youtube.com"
std::string hostOf(const std::string& url);

// host 等于 domain 或是它的子域名
bool hostMatches(const std::string& host, const std::string& domain);

/**
 * @brief 按域名选择 Resolver
 *
 * 注册完成后只读，可以被多个解析线程共享。先注册的优先。
 */
class ResolverRegistry {
 public:
  void add(std::vector<std::string> domains, std::shared_ptr<Resolver> resolver);

  // 没有匹配时返回 nullptr
  std::shared_ptr<Resolver> find(const std::string& url) const;

  // 没有匹配时抛 ResolutionError{NotSupported}
  std::shared_ptr<Resolver> resolverFor(const std::string& url) const;

  std::vector<MediaVariant> resolve(const std::string& url,
                                    const CancelSignal& cancel) const;
  std::vector<PlaylistEntry> resolvePlaylist(const std::string& url,
                                             size_t maxEntries,
                                             const CancelSignal& cancel) const;

  size_t size() const { return handlers_.size(); }

 private:
  struct Handler {
    std::vector<std::string> domains;
    std::shared_ptr<Resolver> resolver;
  };
  std::vector<Handler> handlers_;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_RESOLVER_HPP_
