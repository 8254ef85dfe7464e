#pragma once

#include <map>
#include <string>
#include <unordered_set>

#include <fmt/format.h>

#include "../utils/strings.hpp"

namespace stele::markup {

// 属性按名称排序输出，保证结果稳定
using Attrs = std::map<std::string, std::string>;

inline bool is_void_tag(const std::string& tag) {
  static const std::unordered_set<std::string> void_tags{"area", "base", "br",   "col",   "embed",  "hr",    "img",
                                                         "input", "link", "meta", "param", "source", "track", "wbr"};
  return void_tags.count(tag) > 0;
}

inline std::string render_attrs(const Attrs& attrs) {
  std::string out;
  for (const auto& [name, value] : attrs) {
    out += fmt::format(R"( {}="{}")", name, utils::escape_html(value));
  }
  return out;
}

inline std::string element(const std::string& tag, const Attrs& attrs, const std::string& inner) {
  if (is_void_tag(tag) && inner.empty()) {
    return fmt::format("<{}{} />", tag, render_attrs(attrs));
  }
  return fmt::format("<{0}{1}>{2}</{0}>", tag, render_attrs(attrs), inner);
}

inline std::string element(const std::string& tag, const std::string& inner) {
  return element(tag, Attrs{}, inner);
}

inline std::string link_to(const std::string& href, const std::string& inner) {
  return element("a", Attrs{{"href", href}}, inner);
}

inline std::string doctype(const std::string& kind) {
  if (kind == "html5") {
    return "<!DOCTYPE html>\n";
  }
  if (kind == "xhtml-strict") {
    return "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\" "
           "\"http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd\">\n";
  }
  if (kind == "xhtml-transitional") {
    return "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Transitional//EN\" "
           "\"http://www.w3.org/TR/xhtml1/DTD/xhtml1-transitional.dtd\">\n";
  }
  return "";
}

}  // namespace stele::markup
