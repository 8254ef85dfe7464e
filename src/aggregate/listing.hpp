#pragma once

#include <string>
#include <vector>

#include "../content.hpp"
#include "../template/markup.hpp"
#include "../url.hpp"
#include "../utils/time.hpp"

namespace stele {

// 列表页中的文章摘要：标题链接、发布日期、正文
inline std::string render_snippet(const ContentUnit& post, const UrlResolver& resolver) {
  const auto day = utils::parse_date_token(post.path_str(), post.basename());
  return markup::element(
      "div", markup::element("h2", markup::link_to(resolver.post_url(post.file_path()), post.title())) +
                 markup::element("p", markup::Attrs{{"class", "publish_date"}}, utils::format_short_date(day)) +
                 post.body());
}

inline std::string render_snippets(const std::vector<ContentUnitPtr>& posts, const UrlResolver& resolver) {
  std::string html;
  for (const auto& post : posts) {
    html += render_snippet(*post, resolver);
  }
  return html;
}

}  // namespace stele
