#include "markdown.h"

#include <absl/strings/match.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include "../utils/strings.hpp"

namespace stele {

namespace {

// [label](target)，成功时 next 指向 ')' 之后
bool parse_link(absl::string_view text, size_t open_pos, std::string* label, std::string* target, size_t* next) {
  const size_t close = text.find(']', open_pos + 1);
  if (close == absl::string_view::npos || close + 1 >= text.size() || text[close + 1] != '(') {
    return false;
  }
  const size_t end = text.find(')', close + 2);
  if (end == absl::string_view::npos) {
    return false;
  }
  *label = std::string(text.substr(open_pos + 1, close - open_pos - 1));
  *target = std::string(utils::view_strip_empty(text.substr(close + 2, end - close - 2)));
  *next = end + 1;
  return true;
}

}  // namespace

std::string render_inline(absl::string_view text) {
  std::string html;
  html.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    const char c = text[pos];
    if (c == '\\' && pos + 1 < text.size()) {
      html.push_back(text[pos + 1]);
      pos += 2;
      continue;
    }
    if (c == '`') {
      const size_t end = text.find('`', pos + 1);
      if (end != absl::string_view::npos) {
        html += fmt::format("<code>{}</code>", utils::escape_html(text.substr(pos + 1, end - pos - 1)));
        pos = end + 1;
        continue;
      }
    } else if (c == '*' && pos + 1 < text.size() && text[pos + 1] == '*') {
      const size_t end = text.find("**", pos + 2);
      if (end != absl::string_view::npos && end > pos + 2) {
        html += fmt::format("<strong>{}</strong>", render_inline(text.substr(pos + 2, end - pos - 2)));
        pos = end + 2;
        continue;
      }
    } else if (c == '*') {
      const size_t end = text.find('*', pos + 1);
      if (end != absl::string_view::npos && end > pos + 1) {
        html += fmt::format("<em>{}</em>", render_inline(text.substr(pos + 1, end - pos - 1)));
        pos = end + 1;
        continue;
      }
    } else if (c == '!' && pos + 1 < text.size() && text[pos + 1] == '[') {
      std::string label, target;
      size_t next;
      if (parse_link(text, pos + 1, &label, &target, &next)) {
        html += fmt::format(R"(<img src="{}" alt="{}" />)", utils::escape_html(target), utils::escape_html(label));
        pos = next;
        continue;
      }
    } else if (c == '[') {
      std::string label, target;
      size_t next;
      if (parse_link(text, pos, &label, &target, &next)) {
        html += fmt::format(R"(<a href="{}">{}</a>)", utils::escape_html(target), render_inline(label));
        pos = next;
        continue;
      }
    }
    html.push_back(c);
    pos++;
  }
  return html;
}

std::string HeadingBlock::render() {
  return fmt::format("<h{0}>{1}</h{0}>", level_, render_inline(title_));
}

std::string TextBlock::render() {
  return fmt::format("<p>{}</p>", render_inline(text_));
}

std::string FencedCode::render() {
  if (lang_.empty()) {
    return fmt::format("<pre><code>{}</code></pre>", utils::escape_html(code_));
  }
  return fmt::format(R"(<pre><code class="language-{}">{}</code></pre>)", utils::escape_html(lang_),
                     utils::escape_html(code_));
}

std::string QuoteBlock::render() {
  std::vector<std::string> parts;
  parts.reserve(children_.size());
  for (const auto& child : children_) {
    parts.emplace_back(child->render());
  }
  return fmt::format("<blockquote>\n{}\n</blockquote>", absl::StrJoin(parts, "\n"));
}

std::string ListBlock::render() {
  const char* tag = is_ordered_ ? "ol" : "ul";
  std::string html = fmt::format("<{}>\n", tag);
  for (const auto& item : items_) {
    html += fmt::format("<li>{}</li>\n", render_inline(item));
  }
  html += fmt::format("</{}>", tag);
  return html;
}

bool Markdown::parse_str(const std::string& md_content) {
  lines_.clear();
  blocks_.clear();
  for (const absl::string_view line : absl::StrSplit(md_content, '\n')) {
    if (absl::EndsWith(line, "\r")) {
      lines_.emplace_back(line.substr(0, line.size() - 1));
    } else {
      lines_.emplace_back(line);
    }
  }
  size_t line_idx = 0;
  while (line_idx < lines_.size()) {
    const auto line = utils::view_strip_empty(lines_[line_idx]);
    if (line.empty()) {
      line_idx++;
      continue;
    }
    if (absl::StartsWith(line, "```")) {
      line_idx = parse_fenced_code(line_idx);
    } else if (line[0] == '#') {
      line_idx = parse_heading(line_idx);
    } else if (line[0] == '>') {
      line_idx = parse_quote(line_idx);
    } else if (is_horizontal_rule(line)) {
      blocks_.emplace_back(std::make_shared<RuleBlock>());
      line_idx++;
    } else if (unordered_marker_len(line) > 0) {
      line_idx = parse_list(line_idx, false);
    } else if (ordered_marker_len(line) > 0) {
      line_idx = parse_list(line_idx, true);
    } else if (line[0] == '<') {
      line_idx = parse_html_block(line_idx);
    } else {
      line_idx = parse_text(line_idx);
    }
  }
  return true;
}

std::string Markdown::to_html() {
  std::vector<std::string> parts;
  parts.reserve(blocks_.size());
  for (const auto& block : blocks_) {
    parts.emplace_back(block->render());
  }
  return absl::StrJoin(parts, "\n");
}

size_t Markdown::parse_fenced_code(size_t line_idx) {
  const auto fence = utils::view_strip_empty(lines_[line_idx]);
  std::string lang(utils::view_strip_empty(fence.substr(3)));
  std::vector<absl::string_view> code_lines;
  line_idx++;
  while (line_idx < lines_.size()) {
    if (absl::StartsWith(utils::view_strip_empty(lines_[line_idx]), "```")) {
      line_idx++;
      break;
    }
    code_lines.emplace_back(lines_[line_idx]);
    line_idx++;
  }
  blocks_.emplace_back(std::make_shared<FencedCode>(std::move(lang), absl::StrJoin(code_lines, "\n")));
  return line_idx;
}

size_t Markdown::parse_heading(size_t line_idx) {
  const auto line = utils::view_strip_empty(lines_[line_idx]);
  size_t level = 0;
  while (level < line.size() && line[level] == '#') {
    level++;
  }
  if (level > 6 || (level < line.size() && !utils::is_space(line[level]))) {
    blocks_.emplace_back(std::make_shared<TextBlock>(std::string(line)));
    return line_idx + 1;
  }
  const auto title = utils::view_strip_empty(line.substr(level));
  blocks_.emplace_back(std::make_shared<HeadingBlock>(level, std::string(title)));
  return line_idx + 1;
}

size_t Markdown::parse_quote(size_t line_idx) {
  std::vector<absl::string_view> quoted;
  while (line_idx < lines_.size()) {
    auto line = utils::view_strip_empty(lines_[line_idx]);
    if (line.empty() || line[0] != '>') {
      break;
    }
    line.remove_prefix(1);
    if (!line.empty() && line[0] == ' ') {
      line.remove_prefix(1);
    }
    quoted.emplace_back(line);
    line_idx++;
  }
  Markdown nested;
  nested.parse_str(absl::StrJoin(quoted, "\n"));
  blocks_.emplace_back(std::make_shared<QuoteBlock>(nested.blocks()));
  return line_idx;
}

size_t Markdown::parse_list(size_t line_idx, const bool is_ordered) {
  auto list_ptr = std::make_shared<ListBlock>(is_ordered);
  while (line_idx < lines_.size()) {
    const absl::string_view raw = lines_[line_idx];
    const auto line = utils::view_strip_empty(raw);
    if (line.empty()) {
      break;
    }
    const size_t marker_len = is_ordered ? ordered_marker_len(line) : unordered_marker_len(line);
    if (marker_len > 0) {
      list_ptr->items_.emplace_back(utils::view_strip_empty(line.substr(marker_len)));
    } else if (!list_ptr->items_.empty() && utils::is_space(raw[0])) {
      // 缩进的续行
      list_ptr->items_.back().append(" ").append(line.data(), line.size());
    } else {
      break;
    }
    line_idx++;
  }
  blocks_.emplace_back(list_ptr);
  return line_idx;
}

size_t Markdown::parse_html_block(size_t line_idx) {
  std::vector<absl::string_view> block;
  while (line_idx < lines_.size() && !utils::view_strip_empty(lines_[line_idx]).empty()) {
    block.emplace_back(lines_[line_idx]);
    line_idx++;
  }
  blocks_.emplace_back(std::make_shared<RawHtml>(absl::StrJoin(block, "\n")));
  return line_idx;
}

size_t Markdown::parse_text(size_t line_idx) {
  std::vector<absl::string_view> text;
  text.emplace_back(utils::view_strip_empty(lines_[line_idx]));
  line_idx++;
  while (line_idx < lines_.size()) {
    const auto line = utils::view_strip_empty(lines_[line_idx]);
    if (line.empty() || starts_block(line)) {
      break;
    }
    text.emplace_back(line);
    line_idx++;
  }
  blocks_.emplace_back(std::make_shared<TextBlock>(absl::StrJoin(text, "\n")));
  return line_idx;
}

bool Markdown::is_horizontal_rule(absl::string_view line) {
  if (line.empty() || (line[0] != '-' && line[0] != '*' && line[0] != '_')) {
    return false;
  }
  size_t marks = 0;
  for (const char c : line) {
    if (c == line[0]) {
      marks++;
    } else if (!utils::is_space(c)) {
      return false;
    }
  }
  return marks >= 3;
}

size_t Markdown::unordered_marker_len(absl::string_view line) {
  if (line.size() >= 2 && (line[0] == '-' || line[0] == '*' || line[0] == '+') && line[1] == ' ') {
    return 2;
  }
  return 0;
}

size_t Markdown::ordered_marker_len(absl::string_view line) {
  size_t idx = 0;
  while (idx < line.size() && line[idx] >= '0' && line[idx] <= '9') {
    idx++;
  }
  if (idx == 0 || idx + 1 >= line.size() || line[idx] != '.' || line[idx + 1] != ' ') {
    return 0;
  }
  return idx + 2;
}

bool Markdown::starts_block(absl::string_view line) {
  if (absl::StartsWith(line, "```") || line[0] == '>' || is_horizontal_rule(line)) {
    return true;
  }
  if (line[0] == '#') {
    size_t level = 0;
    while (level < line.size() && line[level] == '#') {
      level++;
    }
    return level <= 6 && (level == line.size() || utils::is_space(line[level]));
  }
  return unordered_marker_len(line) > 0 || ordered_marker_len(line) > 0;
}

}  // namespace stele
