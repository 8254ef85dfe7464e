#pragma once

#include <absl/strings/string_view.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "../errors.hpp"

namespace stele::utils {

inline bool is_space(const char c) {
  return c == ' ' || c == '\t' || c == '\r';
}

inline absl::string_view view_strip_empty(absl::string_view str) {
  const size_t len = str.size();
  size_t valid_start_idx = 0;
  while (valid_start_idx < len && is_space(str[valid_start_idx])) {
    valid_start_idx++;
  }
  if (valid_start_idx == len) {
    return "";
  }
  size_t valid_end_idx = len - 1;
  while (valid_end_idx > valid_start_idx && is_space(str[valid_end_idx])) {
    valid_end_idx--;
  }

  return str.substr(valid_start_idx, valid_end_idx - valid_start_idx + 1);
}

inline std::string read_file_all(const std::filesystem::path& p) {
  std::ifstream fi(p, std::ios::binary);
  if (!fi.is_open()) {
    throw IOError("could not open " + p.string());
  }
  std::ostringstream oss;
  oss << fi.rdbuf();
  return oss.str();
}

inline std::string escape_html(absl::string_view text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '&':
        escaped.append("&amp;");
        break;
      case '<':
        escaped.append("&lt;");
        break;
      case '>':
        escaped.append("&gt;");
        break;
      case '"':
        escaped.append("&quot;");
        break;
      default:
        escaped.push_back(c);
    }
  }
  return escaped;
}

// 路径的 basename，不含扩展名
inline std::string base_name(const std::filesystem::path& p) {
  return p.stem().string();
}

}  // namespace stele::utils
