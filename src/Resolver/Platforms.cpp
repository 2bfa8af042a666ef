#include "Platforms.hpp"

#include "Resolver/BrowserSession.hpp"
#include "Resolver/YtDlpResolver.hpp"
#include "utils/logger.hpp"

namespace mediagrab {

const std::vector<PlatformProfile>& builtinPlatforms() {
  static const std::vector<PlatformProfile> platforms{
      {"youtube", {"youtube.com", "youtu.be"}, false},
      {"tiktok", {"tiktok.com"}, false},
      {"pinterest", {"pinterest.com", "pin.it"}, true},
      {"facebook", {"facebook.com", "fb.watch"}, true},
      {"instagram", {"instagram.com"}, true},
  };
  return platforms;
}

std::unique_ptr<ResolverRegistry> buildDefaultRegistry(
    const ResolverSettings& settings) {
  auto registry = std::make_unique<ResolverRegistry>();
  std::shared_ptr<BrowserSession> browser;
  if (!settings.browserHelper.empty()) {
    browser = std::make_shared<ExternalBrowserSession>(settings.browserHelper,
                                                       settings.timeout);
  }
  YtDlpOptions options;
  options.executable = settings.ytdlpPath;
  options.timeout = settings.timeout;

  for (const auto& platform : builtinPlatforms()) {
    std::shared_ptr<BrowserSession> session =
        platform.needsRenderedPage ? browser : nullptr;
    if (platform.needsRenderedPage && !session) {
      LOG(DEBUG) << "[Resolver] No browser helper, " << platform.name
                 << " pages are resolved without rendering";
    }
    registry->add(platform.domains,
                  std::make_shared<YtDlpResolver>(platform.name, options,
                                                  session, settings.credentials));
  }
  LOG(INFO) << "[Resolver] " << registry->size() << " platforms registered";
  return registry;
}

}  // namespace mediagrab
