#include "CredentialStore.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace mediagrab {

using json = nlohmann::json;

CredentialStore CredentialStore::load(const std::string& path) {
  if (path.empty()) return CredentialStore();
  std::ifstream in(path);
  if (!in) {
    LOG(DEBUG) << "[Credentials] No credentials file at " << path;
    return CredentialStore();
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  CredentialStore store = parse(buffer.str());
  LOG(INFO) << "[Credentials] Loaded credentials from " << path;
  return store;
}

CredentialStore CredentialStore::parse(const std::string& text) {
  CredentialStore store;
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    LOG(WARN) << "[Credentials] Ignoring malformed credentials document";
    return store;
  }
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (!it.value().is_object()) {
      LOG(WARN) << "[Credentials] Skipping entry for " << it.key();
      continue;
    }
    PlatformCredentials credentials;
    const json& entry = it.value();
    if (entry.contains("cookies") && entry["cookies"].is_string()) {
      credentials.cookies = entry["cookies"].get<std::string>();
    }
    if (entry.contains("headers") && entry["headers"].is_object()) {
      for (auto h = entry["headers"].begin(); h != entry["headers"].end(); ++h) {
        if (h.value().is_string()) {
          credentials.headers[h.key()] = h.value().get<std::string>();
        }
      }
    }
    store.entries_[it.key()] = std::move(credentials);
  }
  return store;
}

void CredentialStore::set(const std::string& platform,
                          PlatformCredentials credentials) {
  entries_[platform] = std::move(credentials);
}

std::optional<PlatformCredentials> CredentialStore::get(
    const std::string& platform) const {
  auto it = entries_.find(platform);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void CredentialStore::apply(const std::string& platform,
                            FetchDescriptor& fetch) const {
  auto it = entries_.find(platform);
  if (it == entries_.end()) return;
  for (const auto& header : it->second.headers) {
    fetch.headers.emplace(header.first, header.second);
  }
  if (!it->second.cookies.empty()) {
    if (!fetch.cookies.empty()) fetch.cookies += "; ";
    fetch.cookies += it->second.cookies;
  }
}

}  // namespace mediagrab
