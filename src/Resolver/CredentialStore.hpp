#ifndef MEDIAGRAB_CREDENTIAL_STORE_HPP_
#define MEDIAGRAB_CREDENTIAL_STORE_HPP_

#include <map>
#include <optional>
#include <string>

#include "Resolver/MediaVariant.hpp"

namespace mediagrab {

struct PlatformCredentials {
  std::string cookies;  // "a=1; b=2"
  std::map<std::string, std::string> headers;
};

/**
 * @brief 各平台的登录 cookie 和额外请求头
 *
 * 文件格式：{"instagram": {"cookies": "...", "headers": {"X-IG-App-ID": "..."}}}
 * 加载后只读。
 */
class CredentialStore {
 public:
  // 文件不存在返回空表；格式错误打 WARN 并返回空表
  static CredentialStore load(const std::string& path);
  static CredentialStore parse(const std::string& text);

  void set(const std::string& platform, PlatformCredentials credentials);
  std::optional<PlatformCredentials> get(const std::string& platform) const;

  // 不覆盖 fetch 里已有的同名请求头，cookie 追加在后面
  void apply(const std::string& platform, FetchDescriptor& fetch) const;

  bool empty() const { return entries_.empty(); }

 private:
  std::map<std::string, PlatformCredentials> entries_;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_CREDENTIAL_STORE_HPP_
