#pragma once

#include <string>
#include <vector>

#include <tinyxml2.h>

#include "../content.hpp"
#include "../url.hpp"

namespace stele::feed {

using namespace tinyxml2;

static auto SITEMAP_NAMESPACE = "http://www.sitemaps.org/schemas/sitemap/0.9";

inline std::string trim_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

// https://www.sitemaps.org/protocol.html
inline std::string build_sitemap(const std::vector<std::string>& locations) {
  XMLDocument doc;
  doc.InsertEndChild(doc.NewDeclaration());
  auto* urlset_ele = doc.NewElement("urlset");
  urlset_ele->SetAttribute("xmlns", SITEMAP_NAMESPACE);
  doc.InsertEndChild(urlset_ele);
  for (const auto& loc : locations) {
    auto* url_ele = doc.NewElement("url");
    auto* loc_ele = doc.NewElement("loc");
    loc_ele->SetText(loc.c_str());
    url_ele->InsertEndChild(loc_ele);
    urlset_ele->InsertEndChild(url_ele);
  }
  XMLPrinter printer;
  doc.Print(&printer);
  return {printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1)};
}

// 站点根、每篇文章、每个页面，依次排列
inline std::vector<std::string> sitemap_locations(const std::string& site_url,
                                                  const std::vector<ContentUnitPtr>& posts,
                                                  const std::vector<ContentUnitPtr>& pages,
                                                  const UrlResolver& resolver) {
  const std::string base = trim_trailing_slash(site_url);
  std::vector<std::string> locations;
  locations.reserve(1 + posts.size() + pages.size());
  locations.emplace_back(site_url);
  for (const auto& post : posts) {
    locations.emplace_back(base + resolver.post_url(post->file_path()));
  }
  for (const auto& page : pages) {
    locations.emplace_back(base + "/" + resolver.site_url(page->file_path(), page->meta_str("extension")));
  }
  return locations;
}

}  // namespace stele::feed
