#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace utils {

// 把标题转成可用的文件名：去掉路径分隔符和控制字符，空标题返回 fallback
std::string SanitizeFileName(const std::string& name,
                             const std::string& fallback = "download");

/**
 * @brief 数字后缀去重："a.mp4" -> "a (1).mp4" -> "a (2).mp4" ...
 *
 * isTaken 为空时只检查磁盘；否则磁盘上已存在或 isTaken 返回 true 的都跳过。
 */
std::string UniquePath(const std::string& path,
                       const std::function<bool(const std::string&)>& isTaken =
                           nullptr);

// 1536 -> "1.50 KB"
std::string FormatBytes(uint64_t size);

// 目录不存在时创建；不可写时返回 false 并填写 error
bool EnsureWritableDirectory(const std::string& dir, std::string* error);

// 文件不存在返回 0
uint64_t FileSizeOrZero(const std::string& path);

}  // namespace utils
