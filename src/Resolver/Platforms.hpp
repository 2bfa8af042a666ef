#ifndef MEDIAGRAB_PLATFORMS_HPP_
#define MEDIAGRAB_PLATFORMS_HPP_

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "Resolver/CredentialStore.hpp"
#include "Resolver/Resolver.hpp"

namespace mediagrab {

struct PlatformProfile {
  std::string name;
  std::vector<std::string> domains;
  bool needsRenderedPage = false;  // 页面由 JavaScript 生成，需要先渲染
};

// YouTube, TikTok, Pinterest, Facebook, Instagram
const std::vector<PlatformProfile>& builtinPlatforms();

struct ResolverSettings {
  std::string ytdlpPath = "yt-dlp";
  std::string browserHelper;  // 为空则不渲染
  std::chrono::seconds timeout{120};
  std::shared_ptr<const CredentialStore> credentials;
};

// 每个内置平台注册一个 YtDlpResolver
std::unique_ptr<ResolverRegistry> buildDefaultRegistry(
    const ResolverSettings& settings);

}  // namespace mediagrab

#endif  // MEDIAGRAB_PLATFORMS_HPP_
