#include "file_utils.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace utils {

std::string SanitizeFileName(const std::string& name,
                             const std::string& fallback) {
  std::string out;
  out.reserve(name.size());
  for (unsigned char c : name) {
    if (c < 0x20 || c == 0x7f) continue;
    switch (c) {
      case '/':
      case '\\':
      case ':':
      case '*':
      case '?':
      case '"':
      case '<':
      case '>':
      case '|':
        out.push_back('_');
        break;
      default:
        out.push_back(static_cast<char>(c));
    }
  }
  // 去掉首尾空白和点，避免生成隐藏文件或 ".."
  size_t begin = out.find_first_not_of(" .");
  size_t end = out.find_last_not_of(" .");
  if (begin == std::string::npos) return fallback;
  out = out.substr(begin, end - begin + 1);
  // 留出后缀和 ".<id>.part" 的长度
  if (out.size() > 180) out.resize(180);
  return out;
}

std::string UniquePath(const std::string& path,
                       const std::function<bool(const std::string&)>& isTaken) {
  auto taken = [&isTaken](const std::string& candidate) {
    std::error_code ec;
    return fs::exists(candidate, ec) || (isTaken && isTaken(candidate));
  };
  if (!taken(path)) return path;

  fs::path p(path);
  std::string stem = p.stem().string();
  std::string ext = p.extension().string();
  fs::path parent = p.parent_path();
  for (int i = 1;; ++i) {
    std::string candidate =
        (parent / (stem + " (" + std::to_string(i) + ")" + ext)).string();
    if (!taken(candidate)) return candidate;
  }
}

std::string FormatBytes(uint64_t size) {
  static const char* kLabels[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(size);
  size_t n = 0;
  while (value >= 1024.0 && n + 1 < sizeof(kLabels) / sizeof(kLabels[0])) {
    value /= 1024.0;
    ++n;
  }
  std::ostringstream oss;
  if (n == 0) {
    oss << size << " B";
  } else {
    oss << std::fixed << std::setprecision(2) << value << " " << kLabels[n];
  }
  return oss.str();
}

bool EnsureWritableDirectory(const std::string& dir, std::string* error) {
  std::error_code ec;
  fs::path target = dir.empty() ? fs::path(".") : fs::path(dir);
  if (!fs::exists(target, ec)) {
    fs::create_directories(target, ec);
    if (ec) {
      if (error) *error = "cannot create " + target.string() + ": " + ec.message();
      return false;
    }
  }
  if (!fs::is_directory(target, ec)) {
    if (error) *error = target.string() + " is not a directory";
    return false;
  }
  if (::access(target.c_str(), W_OK | X_OK) != 0) {
    if (error) *error = target.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

uint64_t FileSizeOrZero(const std::string& path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

}  // namespace utils
