#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include <vector>

#include "../errors.hpp"
#include "../utils/strings.hpp"
#include "parser.h"

namespace stele {

FrontMatter parse_front_matter(const std::string& raw, const std::string& origin) {
  FrontMatter fm;
  std::vector<absl::string_view> lines = absl::StrSplit(raw, '\n');
  size_t line_idx = 0;
  while (line_idx < lines.size() && utils::view_strip_empty(lines[line_idx]).empty()) {
    line_idx++;
  }
  if (line_idx == lines.size() || utils::view_strip_empty(lines[line_idx]) != "---") {
    fm.body = raw;
    return fm;
  }
  fm.has_header = true;
  const size_t header_line = line_idx + 1;
  bool closed = false;
  for (line_idx++; line_idx < lines.size(); line_idx++) {
    const auto line_view = utils::view_strip_empty(lines[line_idx]);
    if (line_view == "---") {
      closed = true;
      break;
    }
    if (line_view.empty()) {
      continue;
    }
    const size_t colon_pos = line_view.find(':');
    if (colon_pos == absl::string_view::npos) {
      throw ContentParseError(origin, fmt::format("metadata line {} has no ':' : '{}'", line_idx + 1, line_view));
    }
    const auto k = utils::view_strip_empty(line_view.substr(0, colon_pos));
    const auto v = utils::view_strip_empty(line_view.substr(colon_pos + 1));
    if (k.empty()) {
      throw ContentParseError(origin, fmt::format("metadata line {} has an empty key", line_idx + 1));
    }
    fm.metadata[std::string(k)] = std::string(v);
  }
  if (!closed) {
    throw ContentParseError(origin, fmt::format("metadata header opened at line {} is never closed", header_line));
  }
  // 正文从结束分隔行的下一行开始
  size_t offset = 0;
  for (size_t idx = 0; idx <= line_idx; idx++) {
    offset += lines[idx].size() + 1;
  }
  fm.body = offset >= raw.size() ? "" : raw.substr(offset);
  return fm;
}

}  // namespace stele
