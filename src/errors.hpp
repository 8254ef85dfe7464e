#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace stele {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// 配置错误在写出任何产物之前抛出
class ConfigurationError final : public Error {
public:
  explicit ConfigurationError(const std::string& msg) : Error(msg) {}
};

class ContentParseError final : public Error {
public:
  ContentParseError(const std::string& path, const std::string& msg)
      : Error(path + ": " + msg), path_(path) {}

  [[nodiscard]] const std::string& path() const {
    return path_;
  }

private:
  std::string path_;
};

class DateParseError final : public Error {
public:
  DateParseError(const std::string& path, const std::string& msg)
      : Error(path + ": " + msg), path_(path) {}

  [[nodiscard]] const std::string& path() const {
    return path_;
  }

private:
  std::string path_;
};

class TemplateError final : public Error {
public:
  explicit TemplateError(const std::string& msg) : Error(msg) {}
};

class IOError final : public Error {
public:
  explicit IOError(const std::string& msg) : Error(msg) {}
};

// 单个处理单元（文章、页面、聚合页）的结果
class UnitResult {
public:
  std::string path;
  bool ok = true;
  std::string error;

  static UnitResult success(std::string path) {
    UnitResult r;
    r.path = std::move(path);
    return r;
  }

  static UnitResult failure(std::string path, std::string error) {
    UnitResult r;
    r.path = std::move(path);
    r.ok = false;
    r.error = std::move(error);
    return r;
  }
};

}  // namespace stele
