#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "../content.hpp"
#include "../template/markup.hpp"
#include "../url.hpp"

namespace stele {

// (url, title)
using TagEntry = std::pair<std::string, std::string>;
// 标签按字典序升序；同一标签下的文章保持存储顺序（从旧到新）
using TagIndex = std::map<std::string, std::vector<TagEntry>>;

inline TagIndex build_tag_index(const std::vector<ContentUnitPtr>& posts, const UrlResolver& resolver) {
  TagIndex index;
  for (const auto& post : posts) {
    if (!post->has_tags()) {
      continue;
    }
    const TagEntry entry{resolver.post_url(post->file_path()), post->title()};
    for (const auto& tag : post->tags()) {
      index[tag].emplace_back(entry);
    }
  }
  return index;
}

inline std::string render_tag_index(const TagIndex& index) {
  std::string html = markup::element("h2", "Tags");
  for (const auto& [tag, entries] : index) {
    std::string items;
    for (const auto& [url, title] : entries) {
      items += markup::element("li", markup::link_to(url, title));
    }
    html += markup::element("h4", markup::element("a", markup::Attrs{{"name", tag}}, tag) + markup::element("ul", items));
  }
  return html;
}

}  // namespace stele
