#include "MediaVariant.hpp"

#include <algorithm>
#include <cctype>

namespace mediagrab {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace

int parseResolutionLabel(const std::string& label) {
  std::string lower = toLower(label);
  size_t digits = 0;
  while (digits < lower.size() && std::isdigit(static_cast<unsigned char>(lower[digits]))) {
    ++digits;
  }
  if (digits == 0 || digits > 5) return 0;
  if (digits < lower.size() && lower[digits] != 'p') return 0;
  return std::stoi(lower.substr(0, digits));
}

std::optional<size_t> selectVariant(const std::vector<MediaVariant>& variants,
                                    const VariantPreference& preference) {
  if (variants.empty()) return std::nullopt;

  std::vector<size_t> candidates;
  if (!preference.container.empty()) {
    std::string wanted = toLower(preference.container);
    for (size_t i = 0; i < variants.size(); ++i) {
      if (toLower(variants[i].container) == wanted) candidates.push_back(i);
    }
  }
  if (candidates.empty()) {
    for (size_t i = 0; i < variants.size(); ++i) candidates.push_back(i);
  }

  int target = parseResolutionLabel(preference.resolution);
  if (target == 0) return candidates.front();

  for (size_t i : candidates) {
    if (variants[i].height == target) return i;
  }
  std::optional<size_t> below;
  for (size_t i : candidates) {
    int h = variants[i].height;
    if (h > 0 && h < target && (!below || h > variants[*below].height)) {
      below = i;
    }
  }
  if (below) return below;
  return candidates.front();
}

}  // namespace mediagrab
