#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include "errors.hpp"
#include "utils/strings.hpp"

namespace stele {

using namespace std::filesystem;

inline const std::string DEFAULT_EXTENSION = ".html";

// 由文件名约定推导站点内路径
class UrlResolver final {
public:
  UrlResolver(std::string post_out_subdir, path pages_root)
      : post_out_subdir_(std::move(post_out_subdir)), pages_root_(std::move(pages_root)) {}

  [[nodiscard]] std::string post_url(const path& post_path) const;
  [[nodiscard]] std::string site_url(const path& page_path, const std::string& extension = "") const;

  static std::string absolute_url(const std::string& base, const std::string& url);
  static std::string index_file(const std::string& url);
  static std::string normalize_extension(const std::string& extension);

private:
  std::string post_out_subdir_;
  path pages_root_;
};

// 2023-01-02-hello-world.md -> /2023/01/02/hello-world/
inline std::string UrlResolver::post_url(const path& post_path) const {
  const std::string name = utils::base_name(post_path);
  std::vector<std::string> parts = absl::StrSplit(name, absl::MaxSplits('-', 3));
  if (parts.size() < 4) {
    throw DateParseError(post_path.string(),
                         fmt::format("post name '{}' is not of the form yyyy-MM-dd-slug", name));
  }
  for (const auto& part : parts) {
    if (part.empty()) {
      throw DateParseError(post_path.string(), fmt::format("post name '{}' has an empty segment", name));
    }
  }
  std::string url = fmt::format("/{}/{}/{}/{}/", parts[0], parts[1], parts[2], parts[3]);
  if (post_out_subdir_.empty()) {
    return url;
  }
  return fmt::format("/{}{}", post_out_subdir_, url);
}

// site/about/me.md -> about/me.html
inline std::string UrlResolver::site_url(const path& page_path, const std::string& extension) const {
  path relative = page_path.lexically_relative(pages_root_);
  if (relative.empty() || *relative.begin() == "..") {
    relative = page_path.filename();
  }
  relative.replace_extension(normalize_extension(extension));
  return relative.generic_string();
}

inline std::string UrlResolver::normalize_extension(const std::string& extension) {
  if (extension.empty()) {
    return DEFAULT_EXTENSION;
  }
  if (extension[0] == '.') {
    return extension;
  }
  return "." + extension;
}

// 与浏览器中 new URL(url, base) 的解析方式一致
inline std::string UrlResolver::absolute_url(const std::string& base, const std::string& url) {
  if (absl::StartsWith(url, "http://") || absl::StartsWith(url, "https://")) {
    return url;
  }
  const size_t scheme_end = base.find("://");
  const size_t path_start = scheme_end == std::string::npos ? std::string::npos : base.find('/', scheme_end + 3);
  const std::string origin = path_start == std::string::npos ? base : base.substr(0, path_start);
  if (!url.empty() && url[0] == '/') {
    return origin + url;
  }
  if (path_start == std::string::npos) {
    return origin + "/" + url;
  }
  return base.substr(0, base.rfind('/') + 1) + url;
}

// /2023/01/02/hello/ -> 2023/01/02/hello/index.html
inline std::string UrlResolver::index_file(const std::string& url) {
  std::string relative = url;
  while (!relative.empty() && relative.front() == '/') {
    relative.erase(0, 1);
  }
  if (!relative.empty() && relative.back() != '/') {
    relative.push_back('/');
  }
  return relative + "index.html";
}

}  // namespace stele
