#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/ascii.h>
#include <fmt/format.h>
#include <inja/inja.hpp>
#include <spdlog/spdlog.h>

#include "../errors.hpp"
#include "../parser/parser.h"
#include "../utils/strings.hpp"
#include "expr.h"

namespace stele {

using namespace std::filesystem;

enum class TemplateMode {
  EXPRESSION,
  SUBSTITUTION,
};

// 两种模板共用同一个渲染接口，调用方不需要知道具体模式
class Template {
public:
  virtual ~Template() = default;
  [[nodiscard]] virtual TemplateMode mode() const = 0;
  [[nodiscard]] virtual std::string render(const Metadata& metadata, const std::string& content) const = 0;
};

using TemplatePtr = std::shared_ptr<const Template>;

class ExpressionTemplate final : public Template {
public:
  explicit ExpressionTemplate(const std::string& source) : program_(expr::Program::parse(source)) {}

  [[nodiscard]] TemplateMode mode() const override {
    return TemplateMode::EXPRESSION;
  }

  [[nodiscard]] std::string render(const Metadata& metadata, const std::string& content) const override {
    expr::Env env;
    env.bind("metadata", expr::Value::from_json(metadata));
    env.bind("content", expr::Value::string(content));
    return program_.render(env);
  }

private:
  expr::Program program_;
};

// https://github.com/pantor/inja
class SubstitutionTemplate final : public Template {
public:
  explicit SubstitutionTemplate(std::string source) : source_(std::move(source)) {}

  [[nodiscard]] TemplateMode mode() const override {
    return TemplateMode::SUBSTITUTION;
  }

  [[nodiscard]] std::string render(const Metadata& metadata, const std::string& content) const override;

  // 模板中出现的 {{ name }} 形式的占位符
  static std::set<std::string> placeholders(const std::string& source);

private:
  static bool is_identifier(absl::string_view s);

  std::string source_;
};

inline std::string SubstitutionTemplate::render(const Metadata& metadata, const std::string& content) const {
  inja::json data = inja::json::object();
  for (const auto& [k, v] : metadata.items()) {
    if (v.is_string()) {
      data[k] = v.get<std::string>();
    } else if (v.is_null()) {
      data[k] = "";
    } else {
      data[k] = v.dump();
    }
  }
  data["content"] = content;
  for (const auto& name : placeholders(source_)) {
    if (!data.contains(name)) {
      spdlog::warn("template placeholder '{}' has no value, rendered empty", name);
      data[name] = "";
    }
  }
  inja::Environment env;
  env.set_search_included_templates_in_files(false);
  // 只做 {{ }} 替换：语句、行语句和注释的定界符换成不会出现在模板里的控制字符
  env.set_statement("\x01{%", "%}\x01");
  env.set_line_statement("\x01##");
  env.set_comment("\x01{#", "#}\x01");
  try {
    return env.render(source_, data);
  } catch (const inja::InjaError& err) {
    throw TemplateError(fmt::format("substitution failed: {}", err.what()));
  }
}

inline std::set<std::string> SubstitutionTemplate::placeholders(const std::string& source) {
  std::set<std::string> names;
  size_t pos = source.find("{{");
  while (pos != std::string::npos) {
    const size_t end = source.find("}}", pos + 2);
    if (end == std::string::npos) {
      break;
    }
    const auto name = utils::view_strip_empty(absl::string_view(source).substr(pos + 2, end - pos - 2));
    if (is_identifier(name)) {
      names.emplace(name);
    }
    pos = source.find("{{", end + 2);
  }
  return names;
}

inline bool SubstitutionTemplate::is_identifier(absl::string_view s) {
  if (s.empty() || !(absl::ascii_isalpha(s[0]) || s[0] == '_')) {
    return false;
  }
  for (const char c : s) {
    if (!absl::ascii_isalnum(c) && c != '_') {
      return false;
    }
  }
  return true;
}

// 按名称从模板目录加载模板：.expr 为表达式模板，其余为占位符替换模板
class TemplateStore final {
public:
  explicit TemplateStore(path templates_path) : templates_path_(std::move(templates_path)) {}

  static TemplateMode mode_of(const std::string& identifier) {
    const auto ext = absl::AsciiStrToLower(path(identifier).extension().string());
    return ext == ".expr" ? TemplateMode::EXPRESSION : TemplateMode::SUBSTITUTION;
  }

  static TemplatePtr compile(TemplateMode mode, const std::string& source) {
    if (mode == TemplateMode::EXPRESSION) {
      return std::make_shared<ExpressionTemplate>(source);
    }
    return std::make_shared<SubstitutionTemplate>(source);
  }

  // 无法解析的模板名属于配置错误
  TemplatePtr resolve(const std::string& identifier);
  void add(const std::string& identifier, const std::string& source);

private:
  path templates_path_;
  std::mutex lock_;
  std::map<std::string, TemplatePtr> cache_;
};

using TemplateStorePtr = std::shared_ptr<TemplateStore>;

inline TemplatePtr TemplateStore::resolve(const std::string& identifier) {
  std::lock_guard<std::mutex> lg(lock_);
  if (const auto it = cache_.find(identifier); it != cache_.end()) {
    return it->second;
  }
  const path template_path = templates_path_ / identifier;
  if (identifier.empty() || !is_regular_file(template_path)) {
    throw ConfigurationError(fmt::format("template '{}' not found in {}", identifier, templates_path_.string()));
  }
  TemplatePtr tpl;
  try {
    tpl = compile(mode_of(identifier), utils::read_file_all(template_path));
  } catch (const TemplateError& err) {
    throw ConfigurationError(fmt::format("template '{}' is invalid: {}", identifier, err.what()));
  }
  spdlog::debug("loaded template: {}", template_path.string());
  cache_[identifier] = tpl;
  return tpl;
}

inline void TemplateStore::add(const std::string& identifier, const std::string& source) {
  TemplatePtr tpl;
  try {
    tpl = compile(mode_of(identifier), source);
  } catch (const TemplateError& err) {
    throw ConfigurationError(fmt::format("template '{}' is invalid: {}", identifier, err.what()));
  }
  std::lock_guard<std::mutex> lg(lock_);
  cache_[identifier] = tpl;
}

// 解析模板名并渲染：metadata 中的 template，否则用配置的默认模板
class TemplateEngine final {
public:
  TemplateEngine(TemplateStorePtr store, std::string default_template)
      : store_(std::move(store)), default_template_(std::move(default_template)) {}

  [[nodiscard]] std::string template_name(const Metadata& metadata) const {
    const auto it = metadata.find("template");
    if (it != metadata.end() && it->is_string() && !it->get<std::string>().empty()) {
      return it->get<std::string>();
    }
    return default_template_;
  }

  // 在写出任何文件之前确认模板可用
  void preload(const Metadata& metadata) const {
    const auto name = template_name(metadata);
    if (name != NONE_TEMPLATE) {
      store_->resolve(name);
    }
  }

  [[nodiscard]] std::string render(const Metadata& metadata, const std::string& content) const {
    const auto name = template_name(metadata);
    if (name == NONE_TEMPLATE) {
      return ExpressionTemplate(content).render(metadata, content);
    }
    return store_->resolve(name)->render(metadata, content);
  }

  [[nodiscard]] const std::string& default_template() const {
    return default_template_;
  }

private:
  TemplateStorePtr store_;
  std::string default_template_;
};

using TemplateEnginePtr = std::shared_ptr<TemplateEngine>;

}  // namespace stele
