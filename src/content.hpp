#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"
#include "parser/markdown.h"
#include "parser/parser.h"
#include "utils/strings.hpp"

namespace stele {

using namespace std::filesystem;

enum class ContentKind {
  POSTS,
  PAGES,
};

inline std::string to_string(const ContentKind kind) {
  switch (kind) {
    case ContentKind::POSTS:
      return "posts";
    case ContentKind::PAGES:
      return "pages";
    default:
      return "";
  }
}

enum class BodyFormat {
  MARKDOWN,
  HTML,
  CODE,
};

inline bool body_format_of(const path& file_path, BodyFormat* format) {
  const auto ext = absl::AsciiStrToLower(file_path.extension().string());
  if (ext == ".md" || ext == ".markdown") {
    *format = BodyFormat::MARKDOWN;
  } else if (ext == ".html" || ext == ".htm") {
    *format = BodyFormat::HTML;
  } else if (ext == ".expr") {
    *format = BodyFormat::CODE;
  } else {
    return false;
  }
  return true;
}

// 一个输入文件：元信息在读取时解析，正文在第一次使用时转换且只转换一次
class ContentUnit final {
public:
  ContentUnit(path file_path, const ContentKind kind, const BodyFormat format, Metadata metadata, std::string raw_body)
      : file_path_(std::move(file_path)),
        kind_(kind),
        format_(format),
        metadata_(std::move(metadata)),
        raw_body_(std::move(raw_body)) {
    if (format_ == BodyFormat::CODE && !metadata_.contains("template")) {
      metadata_["template"] = NONE_TEMPLATE;
    }
  }

  ContentUnit(const ContentUnit&) = delete;
  ContentUnit& operator=(const ContentUnit&) = delete;

  static std::shared_ptr<ContentUnit> parse(const path& file_path, ContentKind kind, const std::string& raw);

  [[nodiscard]] const path& file_path() const {
    return file_path_;
  }
  [[nodiscard]] std::string path_str() const {
    return file_path_.string();
  }
  [[nodiscard]] std::string basename() const {
    return utils::base_name(file_path_);
  }
  [[nodiscard]] ContentKind kind() const {
    return kind_;
  }
  [[nodiscard]] const Metadata& metadata() const {
    return metadata_;
  }

  [[nodiscard]] std::string meta_str(const std::string& key) const;
  [[nodiscard]] std::string title() const {
    return meta_str("title");
  }
  [[nodiscard]] bool has_tags() const {
    return metadata_.contains("tags");
  }
  [[nodiscard]] std::vector<std::string> tags() const {
    return absl::StrSplit(meta_str("tags"), absl::ByAnyChar(" \t"), absl::SkipEmpty());
  }

  const std::string& body() const;

  [[nodiscard]] size_t body_conversions() const {
    return body_conversions_;
  }

private:
  path file_path_;
  ContentKind kind_;
  BodyFormat format_;
  Metadata metadata_;
  std::string raw_body_;
  //
  mutable std::once_flag body_once_;
  mutable std::string body_;
  mutable size_t body_conversions_ = 0;
};

using ContentUnitPtr = std::shared_ptr<ContentUnit>;

inline ContentUnitPtr ContentUnit::parse(const path& file_path, const ContentKind kind, const std::string& raw) {
  BodyFormat format;
  if (!body_format_of(file_path, &format)) {
    throw ContentParseError(file_path.string(), "unsupported content file extension");
  }
  FrontMatter fm = parse_front_matter(raw, file_path.string());
  if (!fm.has_header) {
    spdlog::warn("No metadata header: {}", file_path.string());
  }
  return std::make_shared<ContentUnit>(file_path, kind, format, std::move(fm.metadata), std::move(fm.body));
}

inline std::string ContentUnit::meta_str(const std::string& key) const {
  const auto it = metadata_.find(key);
  if (it == metadata_.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

inline const std::string& ContentUnit::body() const {
  std::call_once(body_once_, [this]() {
    ParserPtr parser;
    if (format_ == BodyFormat::MARKDOWN) {
      parser = std::make_shared<Markdown>();
    } else {
      parser = std::make_shared<Passthrough>();
    }
    if (!parser->parse_str(raw_body_)) {
      throw ContentParseError(path_str(), "failed to parse body");
    }
    body_ = parser->to_html();
    body_conversions_++;
  });
  return body_;
}

// 按类别列出并读取内容文件
class ContentStore final {
public:
  explicit ContentStore(const SourceLayout& layout)
      : posts_path_(layout.posts_path_), pages_path_(layout.pages_path_) {}

  [[nodiscard]] const path& root(const ContentKind kind) const {
    return kind == ContentKind::POSTS ? posts_path_ : pages_path_;
  }

  [[nodiscard]] std::vector<path> list(ContentKind kind) const;
  [[nodiscard]] ContentUnitPtr read(const path& file_path, ContentKind kind) const;

private:
  path posts_path_;
  path pages_path_;
};

inline std::vector<path> ContentStore::list(const ContentKind kind) const {
  std::vector<path> files;
  const path& dir = root(kind);
  if (!exists(dir)) {
    spdlog::debug("no {} directory: {}", to_string(kind), dir.string());
    return files;
  }
  for (const auto& entry : recursive_directory_iterator(dir)) {
    BodyFormat format;
    if (!entry.is_regular_file() || !body_format_of(entry.path(), &format)) {
      continue;
    }
    files.emplace_back(entry.path());
  }
  // 按文件名从小到大排序；文章文件名以日期开头，即按时间从旧到新
  if (kind == ContentKind::POSTS) {
    std::sort(files.begin(), files.end(), [](const path& lhs, const path& rhs) {
      if (lhs.filename() == rhs.filename()) {
        return lhs < rhs;
      }
      return lhs.filename().string() < rhs.filename().string();
    });
  } else {
    std::sort(files.begin(), files.end(),
              [](const path& lhs, const path& rhs) { return lhs.generic_string() < rhs.generic_string(); });
  }
  return files;
}

inline ContentUnitPtr ContentStore::read(const path& file_path, const ContentKind kind) const {
  return ContentUnit::parse(file_path, kind, utils::read_file_all(file_path));
}

}  // namespace stele
