#include "Resolver.hpp"

#include <algorithm>
#include <cctype>

#include "utils/logger.hpp"

namespace mediagrab {

ResolutionError::ResolutionError(Kind kind, const std::string& detail)
    : std::runtime_error(std::string(toString(kind)) + ": " + detail),
      kind_(kind),
      detail_(detail) {}

const char* toString(ResolutionError::Kind kind) {
  switch (kind) {
    case ResolutionError::Kind::NotSupported:
      return "unsupported URL";
    case ResolutionError::Kind::NetworkError:
      return "network error";
    case ResolutionError::Kind::PlatformChanged:
      return "platform changed";
    case ResolutionError::Kind::PrivateOrRemoved:
      return "private or removed";
    case ResolutionError::Kind::Cancelled:
      return "resolution cancelled";
  }
  return "resolution error";
}

std::vector<PlaylistEntry> Resolver::resolvePlaylist(const std::string& url,
                                                     size_t /*maxEntries*/,
                                                     const CancelSignal& /*cancel*/) {
  return {PlaylistEntry{url, ""}};
}

std::string hostOf(const std::string& url) {
  std::string rest = url;
  auto scheme = rest.find("://");
  if (scheme != std::string::npos) rest = rest.substr(scheme + 3);
  rest = rest.substr(0, rest.find_first_of("/?#"));
  auto at = rest.rfind('@');
  if (at != std::string::npos) rest = rest.substr(at + 1);
  auto colon = rest.find(':');
  if (colon != std::string::npos) rest = rest.substr(0, colon);
  std::transform(rest.begin(), rest.end(), rest.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return rest;
}

bool hostMatches(const std::string& host, const std::string& domain) {
  if (host == domain) return true;
  if (host.size() <= domain.size()) return false;
  return host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
         host[host.size() - domain.size() - 1] == '.';
}

void ResolverRegistry::add(std::vector<std::string> domains,
                           std::shared_ptr<Resolver> resolver) {
  LOG(DEBUG) << "[Resolver] Registered " << resolver->name() << " for "
             << domains.size() << " domains";
  handlers_.push_back(Handler{std::move(domains), std::move(resolver)});
}

std::shared_ptr<Resolver> ResolverRegistry::find(const std::string& url) const {
  std::string host = hostOf(url);
  if (host.empty()) return nullptr;
  for (const auto& handler : handlers_) {
    for (const auto& domain : handler.domains) {
      if (hostMatches(host, domain)) return handler.resolver;
    }
  }
  return nullptr;
}

std::shared_ptr<Resolver> ResolverRegistry::resolverFor(
    const std::string& url) const {
  auto resolver = find(url);
  if (!resolver) {
    throw ResolutionError(ResolutionError::Kind::NotSupported, url);
  }
  return resolver;
}

std::vector<MediaVariant> ResolverRegistry::resolve(
    const std::string& url, const CancelSignal& cancel) const {
  auto resolver = resolverFor(url);
  LOG(INFO) << "[Resolver] " << resolver->name() << " resolving " << url;
  auto variants = resolver->resolve(url, cancel);
  if (variants.empty()) {
    throw ResolutionError(ResolutionError::Kind::PlatformChanged,
                          "no downloadable formats for " + url);
  }
  return variants;
}

std::vector<PlaylistEntry> ResolverRegistry::resolvePlaylist(
    const std::string& url, size_t maxEntries,
    const CancelSignal& cancel) const {
  auto resolver = resolverFor(url);
  auto entries = resolver->resolvePlaylist(url, maxEntries, cancel);
  if (entries.size() > maxEntries) entries.resize(maxEntries);
  return entries;
}

}  // namespace mediagrab
