#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include <tinyxml2.h>

#include "../config.hpp"
#include "../content.hpp"
#include "../url.hpp"
#include "../utils/executor.hpp"
#include "../utils/time.hpp"

namespace stele::feed {

using namespace tinyxml2;

static constexpr size_t RSS_ITEM_LIMIT = 10;
static auto RSS_ROOT_ELE_NAME = "rss";
static auto XHTML_STRICT_DOCTYPE =
    R"(DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.0 Strict//EN" "http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd")";

class RssItem {
public:
  RssItem() = default;
  std::string title;
  std::string link;
  std::string pub_date;
  std::string description;
};

class RssChannel {
public:
  std::string title;
  std::string link;
  std::string description;
};

// 存储顺序反转后取前 limit 篇
inline std::vector<ContentUnitPtr> newest_posts(const std::vector<ContentUnitPtr>& posts, const size_t limit) {
  std::vector<ContentUnitPtr> newest(posts.rbegin(), posts.rend());
  if (newest.size() > limit) {
    newest.resize(limit);
  }
  return newest;
}

// 日期解析失败直接抛出，不在单个条目上吞掉
inline RssItem make_rss_item(const ContentUnit& post, const UrlResolver& resolver, const std::string& site_url) {
  RssItem item;
  item.title = post.title();
  item.link = UrlResolver::absolute_url(site_url, resolver.post_url(post.file_path()));
  item.pub_date = utils::format_rfc822(utils::parse_date_token(post.path_str(), post.basename()));
  item.description = post.body();
  return item;
}

namespace detail {

inline void append_text(XMLDocument& doc, XMLElement* parent, const char* name, const std::string& text) {
  auto* ele = doc.NewElement(name);
  ele->SetText(text.c_str());
  parent->InsertEndChild(ele);
}

}  // namespace detail

// https://www.rssboard.org/rss-specification
inline std::string build_rss(const RssChannel& channel, const std::vector<RssItem>& items) {
  XMLDocument doc;
  doc.InsertEndChild(doc.NewDeclaration());
  doc.InsertEndChild(doc.NewUnknown(XHTML_STRICT_DOCTYPE));
  auto* root_ele = doc.NewElement(RSS_ROOT_ELE_NAME);
  root_ele->SetAttribute("version", "2.0");
  doc.InsertEndChild(root_ele);
  auto* channel_ele = doc.NewElement("channel");
  root_ele->InsertEndChild(channel_ele);
  detail::append_text(doc, channel_ele, "title", channel.title);
  detail::append_text(doc, channel_ele, "link", channel.link);
  detail::append_text(doc, channel_ele, "description", channel.description);
  //
  for (const auto& item : items) {
    auto* item_ele = doc.NewElement("item");
    detail::append_text(doc, item_ele, "title", item.title);
    detail::append_text(doc, item_ele, "link", item.link);
    detail::append_text(doc, item_ele, "pubDate", item.pub_date);
    detail::append_text(doc, item_ele, "description", item.description);
    channel_ele->InsertEndChild(item_ele);
  }
  XMLPrinter printer;
  doc.Print(&printer);
  return {printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1)};
}

// 条目在执行器上并行构建，结果保持从新到旧的顺序
inline std::string build_rss(const Config& conf,
                             const std::vector<ContentUnitPtr>& posts,
                             const UrlResolver& resolver,
                             utils::Executor& executor) {
  const RssChannel channel{conf.site_title, conf.site_url, conf.site_description};
  const auto newest = newest_posts(posts, RSS_ITEM_LIMIT);
  const auto items = utils::parallel_map(executor, newest, [&](const ContentUnitPtr& post) {
    return make_rss_item(*post, resolver, conf.site_url);
  });
  return build_rss(channel, items);
}

}  // namespace stele::feed
