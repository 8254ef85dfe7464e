#pragma once

/*
- https://daringfireball.net/projects/markdown/syntax
- https://www.markdownguide.org/basic-syntax
 */

#include <absl/strings/string_view.h>

#include <memory>
#include <string>
#include <vector>

#include "parser.h"

namespace stele {

class Block {
public:
  virtual std::string render() = 0;
  virtual ~Block() = default;
};

using BlockPtr = std::shared_ptr<Block>;

class HeadingBlock final : public Block {
public:
  HeadingBlock(const size_t level, std::string title) : level_(level), title_(std::move(title)) {}
  std::string render() override;

  size_t level_;
  std::string title_;
};

class TextBlock final : public Block {
public:
  explicit TextBlock(std::string text) : text_(std::move(text)) {}
  std::string render() override;

private:
  std::string text_;
};

class FencedCode final : public Block {
public:
  FencedCode(std::string lang, std::string code) : lang_(std::move(lang)), code_(std::move(code)) {}
  std::string render() override;

private:
  std::string lang_;
  std::string code_;
};

class QuoteBlock final : public Block {
public:
  explicit QuoteBlock(std::vector<BlockPtr> children) : children_(std::move(children)) {}
  std::string render() override;

private:
  std::vector<BlockPtr> children_;
};

class ListBlock final : public Block {
public:
  explicit ListBlock(const bool is_ordered) : is_ordered_(is_ordered) {}
  std::string render() override;

  bool is_ordered_;
  std::vector<std::string> items_;
};

class RuleBlock final : public Block {
public:
  std::string render() override {
    return "<hr />";
  }
};

class RawHtml final : public Block {
public:
  explicit RawHtml(std::string raw) : raw_(std::move(raw)) {}
  std::string render() override {
    return raw_;
  }

private:
  std::string raw_;
};

// 行内元素：`code`、**strong**、*em*、[text](url)、![alt](src)
std::string render_inline(absl::string_view text);

class Markdown final : public Parser {
public:
  bool parse_str(const std::string& md_content) override;
  std::string to_html() override;

  [[nodiscard]] const std::vector<BlockPtr>& blocks() const {
    return blocks_;
  }

private:
  size_t parse_fenced_code(size_t line_idx);
  size_t parse_heading(size_t line_idx);
  size_t parse_quote(size_t line_idx);
  size_t parse_list(size_t line_idx, bool is_ordered);
  size_t parse_html_block(size_t line_idx);
  size_t parse_text(size_t line_idx);

  static bool is_horizontal_rule(absl::string_view line);
  static size_t unordered_marker_len(absl::string_view line);
  static size_t ordered_marker_len(absl::string_view line);
  static bool starts_block(absl::string_view line);

private:
  std::vector<std::string> lines_;
  std::vector<BlockPtr> blocks_;
};

using MarkdownPtr = std::shared_ptr<Markdown>;

}  // namespace stele
