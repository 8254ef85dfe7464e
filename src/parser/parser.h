#pragma once

#include <memory>
#include <string>

#include <inja/inja.hpp>

namespace stele {

// 元信息：字符串键到值的映射
using Metadata = inja::json;

// 以正文本身作为模板代码
inline const std::string NONE_TEMPLATE = "none";

class Parser {
public:
  virtual ~Parser() = default;
  virtual bool parse_str(const std::string& content) = 0;
  virtual std::string to_html() = 0;
};

using ParserPtr = std::shared_ptr<Parser>;

// 原样输出的正文（html、模板代码）
class Passthrough final : public Parser {
public:
  bool parse_str(const std::string& content) override {
    content_ = content;
    return true;
  }

  std::string to_html() override {
    return content_;
  }

private:
  std::string content_;
};

class FrontMatter final {
public:
  Metadata metadata = Metadata::object();
  std::string body;
  bool has_header = false;
};

/*
元信息部分的格式：

---
title: 示例文章
tags: markdown c++
template: default.html
---

没有元信息头时 metadata 为空；头部未闭合或者某行缺少 ':' 时抛出 ContentParseError。
*/
FrontMatter parse_front_matter(const std::string& raw, const std::string& origin);

}  // namespace stele
