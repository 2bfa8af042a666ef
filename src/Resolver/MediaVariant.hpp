#ifndef MEDIAGRAB_MEDIA_VARIANT_HPP_
#define MEDIAGRAB_MEDIA_VARIANT_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mediagrab {

// 传输引擎需要的全部信息：直链 + 必须带上的请求头/cookie
struct FetchDescriptor {
  std::string url;
  std::map<std::string, std::string> headers;
  std::string cookies;  // "a=1; b=2"
};

/**
 * @brief 同一个媒体的一个可选清晰度/格式
 *
 * 由 Resolver 产出后不再修改。
 */
struct MediaVariant {
  std::string sourceUrl;
  std::string formatId;
  std::string container;        // "mp4", "webm", "jpg" ...
  std::string resolutionLabel;  // "1080p", "audio only" ...
  int height = 0;               // 0 表示未知或纯音频
  std::optional<uint64_t> estimatedSizeBytes;
  std::string title;
  FetchDescriptor fetch;
};

struct VariantPreference {
  std::string resolution = "best";  // "best" 或 "720p" 这样的标签
  std::string container;            // 为空表示不限
};

// "1080p" -> 1080，"best"/无法识别 -> 0
int parseResolutionLabel(const std::string& label);

/**
 * @brief 按偏好选一个变体
 *
 * 先按容器过滤（过滤后为空则忽略容器偏好），再找分辨率完全相同的；
 * 没有则取不超过目标的最高分辨率，仍没有则取最好的那个。
 * variants 须已按从好到差排序，为空时返回 std::nullopt。
 */
std::optional<size_t> selectVariant(const std::vector<MediaVariant>& variants,
                                    const VariantPreference& preference);

}  // namespace mediagrab

#endif  // MEDIAGRAB_MEDIA_VARIANT_HPP_
