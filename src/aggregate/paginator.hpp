#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "../content.hpp"
#include "../template/markup.hpp"

namespace stele {

class Page final {
public:
  size_t index = 0;
  std::vector<ContentUnitPtr> posts;
  bool has_older = false;
  bool has_newer = false;

  [[nodiscard]] size_t older_index() const {
    return index - 1;
  }
  [[nodiscard]] size_t newer_index() const {
    return index + 1;
  }
};

/*
newest_first 按固定大小切分，最后一页可以不满。
下标 0 是最旧的一页，最大下标是最新的一页：
  - 文章总数不超过 page_size 时没有翻页链接
  - 下标 0 只有指向 1 的 newer 链接
  - 最大下标只有指向 max-1 的 older 链接
  - 其余两者都有
*/
inline std::vector<Page> build_pages(const std::vector<ContentUnitPtr>& newest_first, const size_t page_size) {
  std::vector<std::vector<ContentUnitPtr>> windows;
  for (size_t start = 0; start < newest_first.size(); start += page_size) {
    const size_t end = std::min(start + page_size, newest_first.size());
    windows.emplace_back(newest_first.begin() + static_cast<long>(start), newest_first.begin() + static_cast<long>(end));
  }
  std::reverse(windows.begin(), windows.end());
  //
  const bool paginated = newest_first.size() > page_size;
  std::vector<Page> pages;
  pages.reserve(windows.size());
  for (size_t idx = 0; idx < windows.size(); idx++) {
    Page page;
    page.index = idx;
    page.posts = std::move(windows[idx]);
    if (paginated) {
      const size_t max_index = windows.size() - 1;
      page.has_older = idx > 0;
      page.has_newer = idx < max_index;
    }
    pages.emplace_back(std::move(page));
  }
  return pages;
}

inline std::string latest_posts_url(const size_t index) {
  return fmt::format("/latest-posts/{}/", index);
}

inline std::string render_pager(const Page& page) {
  std::string html;
  if (page.has_older) {
    html += markup::element("div", markup::Attrs{{"class", "pager-left"}},
                            markup::link_to(latest_posts_url(page.older_index()), "&laquo; Older Entries"));
  }
  if (page.has_newer) {
    html += markup::element("div", markup::Attrs{{"class", "pager-right"}},
                            markup::link_to(latest_posts_url(page.newer_index()), "Newer Entries &raquo;"));
  }
  return html;
}

}  // namespace stele
