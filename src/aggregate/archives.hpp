#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/str_replace.h>
#include <fmt/format.h>

#include "../content.hpp"
#include "../template/markup.hpp"
#include "../utils/time.hpp"

namespace stele {

// yyyy-MM -> 文章数，按月份从新到旧
using ArchiveIndex = std::map<std::string, size_t, std::greater<>>;

inline std::string month_key_of(const ContentUnit& post) {
  const std::string name = post.basename();
  utils::parse_month_token(post.path_str(), name);
  return name.substr(0, 7);
}

inline ArchiveIndex build_archive_index(const std::vector<ContentUnitPtr>& posts) {
  ArchiveIndex index;
  for (const auto& post : posts) {
    index[month_key_of(*post)]++;
  }
  return index;
}

// 文件名以 month_key 开头的文章，从新到旧
inline std::vector<ContentUnitPtr> posts_for_month(const std::vector<ContentUnitPtr>& posts,
                                                   const std::string& month_key) {
  std::vector<ContentUnitPtr> matched;
  for (auto it = posts.rbegin(); it != posts.rend(); ++it) {
    if (absl::StartsWith((*it)->basename(), month_key)) {
      matched.emplace_back(*it);
    }
  }
  return matched;
}

// 2023-01 -> /archives/2023/01/
inline std::string archive_url(const std::string& month_key) {
  return fmt::format("/archives/{}/", absl::StrReplaceAll(month_key, {{"-", "/"}}));
}

inline std::string render_archive_index(const ArchiveIndex& index) {
  std::string items;
  for (const auto& [month_key, count] : index) {
    absl::CivilMonth month;
    if (!absl::ParseCivilTime(month_key, &month)) {
      throw DateParseError(month_key, "illegal archive month");
    }
    items += markup::element(
        "li", markup::link_to(archive_url(month_key), utils::format_month_title(month)) + fmt::format(" ({})", count));
  }
  return markup::element("h2", "Archives") + markup::element("ul", items);
}

}  // namespace stele
