#ifndef MEDIAGRAB_BROWSER_SESSION_HPP_
#define MEDIAGRAB_BROWSER_SESSION_HPP_

#include <chrono>
#include <memory>
#include <string>

#include "Transfer/CancelSignal.hpp"

namespace mediagrab {

/**
 * @brief 一次页面渲染留下的临时产物
 *
 * 持有一个私有临时目录，析构时整个删除，无论解析成功与否。
 */
class BrowserCapture {
 public:
  explicit BrowserCapture(std::string dir);
  ~BrowserCapture();

  BrowserCapture(const BrowserCapture&) = delete;
  BrowserCapture& operator=(const BrowserCapture&) = delete;

  const std::string& dir() const { return dir_; }
  // Netscape 格式的 cookie 文件，渲染器可能不写
  std::string cookieFile() const;
  bool hasCookies() const;

 private:
  std::string dir_;
};

// 动态页面渲染器，外部协作者
class BrowserSession {
 public:
  virtual ~BrowserSession() = default;

  // 失败抛 ResolutionError；cancel 触发后以 Cancelled 返回
  virtual std::unique_ptr<BrowserCapture> render(const std::string& url,
                                                 const CancelSignal& cancel) = 0;
};

/**
 * @brief 通过外部程序渲染页面
 *
 * 以 `<helper> <url> <cookie-file>` 运行，helper 退出码为 0 表示成功。
 */
class ExternalBrowserSession : public BrowserSession {
 public:
  ExternalBrowserSession(std::string helper, std::chrono::seconds timeout);

  std::unique_ptr<BrowserCapture> render(const std::string& url,
                                         const CancelSignal& cancel) override;

 private:
  std::string helper_;
  std::chrono::seconds timeout_;
};

}  // namespace mediagrab

#endif  // MEDIAGRAB_BROWSER_SESSION_HPP_
