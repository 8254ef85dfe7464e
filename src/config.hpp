#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <toml.hpp>

#include "errors.hpp"

namespace stele {

using namespace std::filesystem;

namespace defaults {
inline constexpr const char* SITE_TITLE = "A Static Blog";
inline constexpr const char* SITE_DESCRIPTION = "Default blog description";
inline constexpr const char* SITE_URL = "https://example.com";
inline constexpr const char* IN_DIR = "resources";
inline constexpr const char* OUT_DIR = "html";
inline constexpr const char* DEFAULT_TEMPLATE = "default.expr";
inline constexpr int64_t POSTS_PER_PAGE = 2;
}  // namespace defaults

// 站点源目录的布局：{in_dir}/posts, {in_dir}/site, {in_dir}/templates, {in_dir}/public
class SourceLayout final {
public:
  explicit SourceLayout(const path& in_dir)
      : posts_path_(in_dir / "posts"),
        pages_path_(in_dir / "site"),
        templates_path_(in_dir / "templates"),
        public_path_(in_dir / "public") {}

  path posts_path_;
  path pages_path_;
  path templates_path_;
  path public_path_;
};

class Config {
public:
  Config() = default;
  void parse();
  void validate() const;

  [[nodiscard]] SourceLayout layout() const {
    return SourceLayout{path(in_dir)};
  }

public:
  std::string site_title = defaults::SITE_TITLE;
  std::string site_description = defaults::SITE_DESCRIPTION;
  std::string site_url = defaults::SITE_URL;
  //
  std::string in_dir = defaults::IN_DIR;
  std::string out_dir = defaults::OUT_DIR;
  std::string post_out_subdir;
  std::string default_template = defaults::DEFAULT_TEMPLATE;
  int64_t posts_per_page = defaults::POSTS_PER_PAGE;
  bool blog_as_index = true;
  bool create_archives = true;
  uint32_t worker_num = 0;
  //
  toml::basic_value<toml::type_config> raw_toml_;
};

// 键不存在时取默认值，类型不符时报错
template <typename T>
T find_key(const toml::basic_value<toml::type_config>& raw_toml, const std::string& key, T default_value) {
  if (!raw_toml.is_table() || !raw_toml.contains(key)) {
    return default_value;
  }
  try {
    return toml::find<T>(raw_toml, key);
  } catch (const toml::type_error& err) {
    throw ConfigurationError(fmt::format("invalid value for '{}': {}", key, err.what()));
  }
}

inline void Config::parse() {
  site_title = find_key<std::string>(raw_toml_, "site_title", defaults::SITE_TITLE);
  site_description = find_key<std::string>(raw_toml_, "site_description", defaults::SITE_DESCRIPTION);
  site_url = find_key<std::string>(raw_toml_, "site_url", defaults::SITE_URL);
  //
  in_dir = find_key<std::string>(raw_toml_, "in_dir", defaults::IN_DIR);
  out_dir = find_key<std::string>(raw_toml_, "out_dir", defaults::OUT_DIR);
  post_out_subdir = find_key<std::string>(raw_toml_, "post_out_subdir", "");
  default_template = find_key<std::string>(raw_toml_, "default_template", defaults::DEFAULT_TEMPLATE);
  posts_per_page = find_key<int64_t>(raw_toml_, "posts_per_page", defaults::POSTS_PER_PAGE);
  blog_as_index = find_key<bool>(raw_toml_, "blog_as_index", true);
  create_archives = find_key<bool>(raw_toml_, "create_archives", true);
  const auto workers = find_key<int64_t>(raw_toml_, "worker_num", 0);
  if (workers < 0 || workers > UINT32_MAX) {
    throw ConfigurationError(fmt::format("invalid value for 'worker_num': {}", workers));
  }
  worker_num = static_cast<uint32_t>(workers);
  // 去掉首尾的 '/'
  while (!post_out_subdir.empty() && post_out_subdir.front() == '/') {
    post_out_subdir.erase(0, 1);
  }
  while (!post_out_subdir.empty() && post_out_subdir.back() == '/') {
    post_out_subdir.pop_back();
  }
}

// parent 与 child 相同，或者是 child 的上级目录
inline bool contains_path(const path& parent, const path& child) {
  const auto mis = std::mismatch(parent.begin(), parent.end(), child.begin(), child.end());
  return mis.first == parent.end();
}

inline void Config::validate() const {
  if (posts_per_page <= 0) {
    throw ConfigurationError("posts_per_page must be positive, got " + std::to_string(posts_per_page));
  }
  if (default_template.empty()) {
    throw ConfigurationError("default_template must not be empty");
  }
  if (site_url.empty()) {
    throw ConfigurationError("site_url must not be empty");
  }
  if (out_dir.empty()) {
    throw ConfigurationError("out_dir must not be empty");
  }
  // 构建前会清空 out_dir，不能覆盖站点目录或 in_dir
  const path out = weakly_canonical(absolute(out_dir));
  for (const path& guarded : {weakly_canonical(current_path()), weakly_canonical(absolute(in_dir))}) {
    if (contains_path(out, guarded)) {
      throw ConfigurationError(
          fmt::format("out_dir '{}' would overwrite sources under '{}'", out_dir, guarded.string()));
    }
  }
}

using ConfigPtr = std::shared_ptr<Config>;

inline ConfigPtr load_config(const path& conf_file_path) {
  auto conf_ptr = std::make_shared<Config>();
  if (!exists(conf_file_path)) {
    throw ConfigurationError("config file not found: " + conf_file_path.string());
  }
  try {
    conf_ptr->raw_toml_ = toml::parse(conf_file_path);
  } catch (const toml::syntax_error& err) {
    throw ConfigurationError(fmt::format("failed to parse {}: {}", conf_file_path.string(), err.what()));
  }
  conf_ptr->parse();
  conf_ptr->validate();
  return conf_ptr;
}

}  // namespace stele
