#pragma once

/*
表达式模板语言：一组 s-expression，逐个求值后按 hiccup 的规则渲染为 html 并拼接。

  (doctype :html5)
  [:html
   [:head [:title (get metadata :title)]]
   [:body [:div#content.post content]
          (when (:tags metadata)
            [:ul (for [t (split (:tags metadata))] [:li t])])]]

求值环境只暴露 metadata 与 content 两个绑定，没有任何 I/O。
 */

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <inja/inja.hpp>

namespace stele::expr {

enum class ValueType {
  NIL,
  BOOL,
  NUMBER,
  STRING,
  KEYWORD,
  VECTOR,
  MAP,
};

class Value;
using ValueVec = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

class Value final {
public:
  Value() = default;

  static Value boolean(bool b);
  static Value number(double n);
  static Value string(std::string s);
  static Value keyword(std::string name);
  static Value vector(ValueVec items);
  static Value map(ValueMap entries);
  static Value from_json(const inja::json& j);

  [[nodiscard]] ValueType type() const {
    return type_;
  }
  [[nodiscard]] bool is_nil() const {
    return type_ == ValueType::NIL;
  }
  // nil 与 false 之外都为真
  [[nodiscard]] bool truthy() const;

  [[nodiscard]] double as_number() const {
    return number_;
  }
  // STRING 的内容或 KEYWORD 的名字
  [[nodiscard]] const std::string& text() const {
    return text_;
  }
  [[nodiscard]] const ValueVec& items() const;
  [[nodiscard]] const ValueMap& entries() const;

  [[nodiscard]] std::string to_string() const;
  bool operator==(const Value& other) const;

private:
  ValueType type_ = ValueType::NIL;
  bool bool_ = false;
  double number_ = 0;
  std::string text_;
  std::shared_ptr<const ValueVec> items_;
  std::shared_ptr<const ValueMap> entries_;
};

// 词法作用域，通过参数显式传递
class Env final {
public:
  explicit Env(const Env* parent = nullptr) : parent_(parent) {}

  void bind(const std::string& name, Value value);
  [[nodiscard]] const Value* lookup(const std::string& name) const;

private:
  const Env* parent_;
  std::map<std::string, Value> bindings_;
};

class Expr {
public:
  explicit Expr(const size_t line) : line_(line) {}
  virtual ~Expr() = default;
  virtual Value eval(const Env& env) const = 0;

  [[nodiscard]] size_t line() const {
    return line_;
  }

protected:
  size_t line_;
};

using ExprPtr = std::shared_ptr<const Expr>;

// 解析后的模板，只读，可以被多个线程同时渲染
class Program final {
public:
  static Program parse(const std::string& source);

  [[nodiscard]] std::string render(const Env& env) const;
  [[nodiscard]] std::vector<Value> eval_all(const Env& env) const;

  [[nodiscard]] size_t size() const {
    return forms_.size();
  }

private:
  std::vector<ExprPtr> forms_;
};

std::string render_markup(const Value& value);

}  // namespace stele::expr
