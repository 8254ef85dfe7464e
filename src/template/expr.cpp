#include "expr.h"

#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <unordered_map>

#include "../errors.hpp"
#include "../utils/strings.hpp"
#include "markup.hpp"

namespace stele::expr {

Value Value::boolean(const bool b) {
  Value v;
  v.type_ = ValueType::BOOL;
  v.bool_ = b;
  return v;
}

Value Value::number(const double n) {
  Value v;
  v.type_ = ValueType::NUMBER;
  v.number_ = n;
  return v;
}

Value Value::string(std::string s) {
  Value v;
  v.type_ = ValueType::STRING;
  v.text_ = std::move(s);
  return v;
}

Value Value::keyword(std::string name) {
  Value v;
  v.type_ = ValueType::KEYWORD;
  v.text_ = std::move(name);
  return v;
}

Value Value::vector(ValueVec items) {
  Value v;
  v.type_ = ValueType::VECTOR;
  v.items_ = std::make_shared<const ValueVec>(std::move(items));
  return v;
}

Value Value::map(ValueMap entries) {
  Value v;
  v.type_ = ValueType::MAP;
  v.entries_ = std::make_shared<const ValueMap>(std::move(entries));
  return v;
}

Value Value::from_json(const inja::json& j) {
  if (j.is_null()) {
    return {};
  }
  if (j.is_boolean()) {
    return boolean(j.get<bool>());
  }
  if (j.is_number()) {
    return number(j.get<double>());
  }
  if (j.is_string()) {
    return string(j.get<std::string>());
  }
  if (j.is_array()) {
    ValueVec items;
    items.reserve(j.size());
    for (const auto& ele : j) {
      items.emplace_back(from_json(ele));
    }
    return vector(std::move(items));
  }
  ValueMap entries;
  for (const auto& [k, v] : j.items()) {
    entries[k] = from_json(v);
  }
  return map(std::move(entries));
}

bool Value::truthy() const {
  if (type_ == ValueType::NIL) {
    return false;
  }
  if (type_ == ValueType::BOOL) {
    return bool_;
  }
  return true;
}

const ValueVec& Value::items() const {
  static const ValueVec empty;
  return items_ == nullptr ? empty : *items_;
}

const ValueMap& Value::entries() const {
  static const ValueMap empty;
  return entries_ == nullptr ? empty : *entries_;
}

std::string Value::to_string() const {
  switch (type_) {
    case ValueType::NIL:
      return "";
    case ValueType::BOOL:
      return bool_ ? "true" : "false";
    case ValueType::NUMBER:
      if (std::floor(number_) == number_ && std::fabs(number_) < 1e15) {
        return fmt::format("{}", static_cast<long long>(number_));
      }
      return fmt::format("{}", number_);
    case ValueType::STRING:
    case ValueType::KEYWORD:
      return text_;
    case ValueType::VECTOR: {
      std::vector<std::string> parts;
      for (const auto& item : items()) {
        parts.emplace_back(item.to_string());
      }
      return fmt::format("[{}]", absl::StrJoin(parts, " "));
    }
    case ValueType::MAP: {
      std::vector<std::string> parts;
      for (const auto& [k, v] : entries()) {
        parts.emplace_back(fmt::format(":{} {}", k, v.to_string()));
      }
      return fmt::format("{{{}}}", absl::StrJoin(parts, ", "));
    }
    default:
      return "";
  }
}

bool Value::operator==(const Value& other) const {
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
    case ValueType::NIL:
      return true;
    case ValueType::BOOL:
      return bool_ == other.bool_;
    case ValueType::NUMBER:
      return number_ == other.number_;
    case ValueType::STRING:
    case ValueType::KEYWORD:
      return text_ == other.text_;
    case ValueType::VECTOR:
      return items() == other.items();
    case ValueType::MAP:
      return entries() == other.entries();
    default:
      return false;
  }
}

void Env::bind(const std::string& name, Value value) {
  bindings_[name] = std::move(value);
}

const Value* Env::lookup(const std::string& name) const {
  for (const Env* env = this; env != nullptr; env = env->parent_) {
    const auto it = env->bindings_.find(name);
    if (it != env->bindings_.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

namespace {

TemplateError eval_error(const size_t line, const std::string& msg) {
  return TemplateError(fmt::format("template error at line {}: {}", line, msg));
}

// 关键字或字符串都可以作为 map 的键
std::string key_of(const Value& key) {
  return key.to_string();
}

class Literal final : public Expr {
public:
  Literal(const size_t line, Value value) : Expr(line), value_(std::move(value)) {}
  Value eval(const Env&) const override {
    return value_;
  }

private:
  Value value_;
};

class Symbol final : public Expr {
public:
  Symbol(const size_t line, std::string name) : Expr(line), name_(std::move(name)) {}
  Value eval(const Env& env) const override {
    const Value* v = env.lookup(name_);
    if (v == nullptr) {
      throw eval_error(line_, fmt::format("unbound symbol '{}'", name_));
    }
    return *v;
  }

  [[nodiscard]] const std::string& name() const {
    return name_;
  }

private:
  std::string name_;
};

class VectorExpr final : public Expr {
public:
  VectorExpr(const size_t line, std::vector<ExprPtr> items) : Expr(line), items_(std::move(items)) {}
  Value eval(const Env& env) const override {
    ValueVec values;
    values.reserve(items_.size());
    for (const auto& item : items_) {
      values.emplace_back(item->eval(env));
    }
    return Value::vector(std::move(values));
  }

  [[nodiscard]] const std::vector<ExprPtr>& items() const {
    return items_;
  }

private:
  std::vector<ExprPtr> items_;
};

class MapExpr final : public Expr {
public:
  MapExpr(const size_t line, std::vector<ExprPtr> kvs) : Expr(line), kvs_(std::move(kvs)) {}
  Value eval(const Env& env) const override {
    ValueMap entries;
    for (size_t idx = 0; idx + 1 < kvs_.size(); idx += 2) {
      entries[key_of(kvs_[idx]->eval(env))] = kvs_[idx + 1]->eval(env);
    }
    return Value::map(std::move(entries));
  }

private:
  std::vector<ExprPtr> kvs_;
};

using Args = std::vector<Value>;
using Builtin = std::function<Value(const Args&, size_t)>;

void expect_arity(const std::string& fn, const Args& args, const size_t min, const size_t max, const size_t line) {
  if (args.size() < min || args.size() > max) {
    throw eval_error(line, fmt::format("wrong number of arguments ({}) to '{}'", args.size(), fn));
  }
}

Value lookup_key(const Value& coll, const Value& key, const Value& fallback) {
  if (coll.type() == ValueType::MAP) {
    const auto& entries = coll.entries();
    const auto it = entries.find(key_of(key));
    return it == entries.end() ? fallback : it->second;
  }
  if (coll.type() == ValueType::VECTOR && key.type() == ValueType::NUMBER) {
    const auto& items = coll.items();
    const double number = key.as_number();
    // 先判断范围再转换，NaN 和过大的下标一律视为不存在
    if (std::isfinite(number) && number >= 0 && number < static_cast<double>(items.size())) {
      return items[static_cast<size_t>(number)];
    }
  }
  return fallback;
}

Value make_element(const std::string& tag, ValueMap attrs, const Args& children, const size_t from) {
  ValueVec items{Value::keyword(tag), Value::map(std::move(attrs))};
  for (size_t idx = from; idx < children.size(); idx++) {
    items.emplace_back(children[idx]);
  }
  return Value::vector(std::move(items));
}

Value strings_to_vector(std::vector<std::string> parts) {
  ValueVec items;
  items.reserve(parts.size());
  for (auto& part : parts) {
    items.emplace_back(Value::string(std::move(part)));
  }
  return Value::vector(std::move(items));
}

const std::unordered_map<std::string, Builtin>& builtins() {
  static const std::unordered_map<std::string, Builtin> table{
      {"str",
       [](const Args& args, size_t) {
         std::string out;
         for (const auto& arg : args) {
           out += arg.to_string();
         }
         return Value::string(std::move(out));
       }},
      {"get",
       [](const Args& args, const size_t line) {
         expect_arity("get", args, 2, 3, line);
         return lookup_key(args[0], args[1], args.size() == 3 ? args[2] : Value{});
       }},
      {"not",
       [](const Args& args, const size_t line) {
         expect_arity("not", args, 1, 1, line);
         return Value::boolean(!args[0].truthy());
       }},
      {"=",
       [](const Args& args, const size_t line) {
         expect_arity("=", args, 1, SIZE_MAX, line);
         for (size_t idx = 1; idx < args.size(); idx++) {
           if (!(args[idx] == args[0])) {
             return Value::boolean(false);
           }
         }
         return Value::boolean(true);
       }},
      {"count",
       [](const Args& args, const size_t line) {
         expect_arity("count", args, 1, 1, line);
         switch (args[0].type()) {
           case ValueType::VECTOR:
             return Value::number(static_cast<double>(args[0].items().size()));
           case ValueType::MAP:
             return Value::number(static_cast<double>(args[0].entries().size()));
           case ValueType::STRING:
             return Value::number(static_cast<double>(args[0].text().size()));
           default:
             return Value::number(0);
         }
       }},
      {"empty?",
       [](const Args& args, const size_t line) {
         expect_arity("empty?", args, 1, 1, line);
         const auto& v = args[0];
         return Value::boolean(v.is_nil() || (v.type() == ValueType::VECTOR && v.items().empty()) ||
                               (v.type() == ValueType::MAP && v.entries().empty()) ||
                               (v.type() == ValueType::STRING && v.text().empty()));
       }},
      {"split",
       [](const Args& args, const size_t line) {
         expect_arity("split", args, 1, 2, line);
         const std::string text = args[0].to_string();
         if (args.size() == 1) {
           std::vector<std::string> parts = absl::StrSplit(text, absl::ByAnyChar(" \t\n"), absl::SkipEmpty());
           return strings_to_vector(std::move(parts));
         }
         const std::string sep = args[1].to_string();
         std::vector<std::string> parts = absl::StrSplit(text, sep);
         return strings_to_vector(std::move(parts));
       }},
      {"join",
       [](const Args& args, const size_t line) {
         expect_arity("join", args, 1, 2, line);
         const Value& coll = args.size() == 1 ? args[0] : args[1];
         const std::string sep = args.size() == 1 ? "" : args[0].to_string();
         std::vector<std::string> parts;
         for (const auto& item : coll.items()) {
           parts.emplace_back(item.to_string());
         }
         return Value::string(absl::StrJoin(parts, sep));
       }},
      {"escape-html",
       [](const Args& args, const size_t line) {
         expect_arity("escape-html", args, 1, 1, line);
         return Value::string(utils::escape_html(args[0].to_string()));
       }},
      {"link-to",
       [](const Args& args, const size_t line) {
         expect_arity("link-to", args, 1, SIZE_MAX, line);
         return make_element("a", ValueMap{{"href", args[0]}}, args, 1);
       }},
      {"image",
       [](const Args& args, const size_t line) {
         expect_arity("image", args, 1, 2, line);
         ValueMap attrs{{"src", args[0]}};
         if (args.size() == 2) {
           attrs["alt"] = args[1];
         }
         return make_element("img", std::move(attrs), args, args.size());
       }},
      {"include-css",
       [](const Args& args, size_t) {
         ValueVec links;
         for (const auto& href : args) {
           links.emplace_back(make_element(
               "link", ValueMap{{"href", href}, {"rel", Value::string("stylesheet")}, {"type", Value::string("text/css")}},
               args, args.size()));
         }
         return Value::vector(std::move(links));
       }},
      {"include-js",
       [](const Args& args, size_t) {
         ValueVec scripts;
         for (const auto& src : args) {
           scripts.emplace_back(
               make_element("script", ValueMap{{"src", src}, {"type", Value::string("text/javascript")}}, args, args.size()));
         }
         return Value::vector(std::move(scripts));
       }},
      {"unordered-list",
       [](const Args& args, const size_t line) {
         expect_arity("unordered-list", args, 1, 1, line);
         ValueVec items{Value::keyword("ul")};
         for (const auto& item : args[0].items()) {
           items.emplace_back(Value::vector(ValueVec{Value::keyword("li"), item}));
         }
         return Value::vector(std::move(items));
       }},
      {"doctype",
       [](const Args& args, const size_t line) {
         expect_arity("doctype", args, 1, 1, line);
         const std::string decl = markup::doctype(args[0].to_string());
         if (decl.empty()) {
           throw eval_error(line, fmt::format("unknown doctype '{}'", args[0].to_string()));
         }
         return Value::string(decl);
       }},
  };
  return table;
}

class ListExpr final : public Expr {
public:
  ListExpr(const size_t line, std::vector<ExprPtr> items) : Expr(line), items_(std::move(items)) {}
  Value eval(const Env& env) const override;

private:
  Value eval_if(const Env& env) const;
  Value eval_when(const Env& env) const;
  Value eval_and_or(const Env& env, bool is_and) const;
  Value eval_let(const Env& env) const;
  Value eval_for(const Env& env) const;
  Value eval_body(const Env& env, size_t from) const;
  const VectorExpr& bindings_of(const std::string& form, size_t min_size) const;

  std::vector<ExprPtr> items_;
};

Value ListExpr::eval(const Env& env) const {
  if (items_.empty()) {
    return {};
  }
  const auto* head_symbol = dynamic_cast<const Symbol*>(items_[0].get());
  if (head_symbol != nullptr) {
    const auto& name = head_symbol->name();
    if (name == "if") {
      return eval_if(env);
    }
    if (name == "when") {
      return eval_when(env);
    }
    if (name == "and" || name == "or") {
      return eval_and_or(env, name == "and");
    }
    if (name == "let") {
      return eval_let(env);
    }
    if (name == "for") {
      return eval_for(env);
    }
  }
  Args args;
  args.reserve(items_.size() - 1);
  for (size_t idx = 1; idx < items_.size(); idx++) {
    args.emplace_back(items_[idx]->eval(env));
  }
  if (head_symbol != nullptr && env.lookup(head_symbol->name()) == nullptr) {
    const auto& table = builtins();
    const auto it = table.find(head_symbol->name());
    if (it == table.end()) {
      throw eval_error(line_, fmt::format("unknown function '{}'", head_symbol->name()));
    }
    return it->second(args, line_);
  }
  // (:title metadata) 形式的取值
  const Value head = items_[0]->eval(env);
  if (head.type() == ValueType::KEYWORD) {
    expect_arity(":" + head.text(), args, 1, 2, line_);
    return lookup_key(args[0], head, args.size() == 2 ? args[1] : Value{});
  }
  throw eval_error(line_, fmt::format("'{}' is not callable", head.to_string()));
}

Value ListExpr::eval_if(const Env& env) const {
  if (items_.size() < 3 || items_.size() > 4) {
    throw eval_error(line_, "if expects a test, a then branch and an optional else branch");
  }
  if (items_[1]->eval(env).truthy()) {
    return items_[2]->eval(env);
  }
  return items_.size() == 4 ? items_[3]->eval(env) : Value{};
}

Value ListExpr::eval_when(const Env& env) const {
  if (items_.size() < 2) {
    throw eval_error(line_, "when expects a test");
  }
  if (!items_[1]->eval(env).truthy()) {
    return {};
  }
  return eval_body(env, 2);
}

Value ListExpr::eval_and_or(const Env& env, const bool is_and) const {
  Value last = is_and ? Value::boolean(true) : Value{};
  for (size_t idx = 1; idx < items_.size(); idx++) {
    last = items_[idx]->eval(env);
    if (last.truthy() != is_and) {
      return last;
    }
  }
  return last;
}

const VectorExpr& ListExpr::bindings_of(const std::string& form, const size_t min_size) const {
  const auto* bindings = items_.size() > 1 ? dynamic_cast<const VectorExpr*>(items_[1].get()) : nullptr;
  if (bindings == nullptr || bindings->items().size() < min_size || bindings->items().size() % 2 != 0) {
    throw eval_error(line_, fmt::format("{} expects a binding vector of symbol/value pairs", form));
  }
  for (size_t idx = 0; idx < bindings->items().size(); idx += 2) {
    if (dynamic_cast<const Symbol*>(bindings->items()[idx].get()) == nullptr) {
      throw eval_error(line_, fmt::format("{} binds only symbols", form));
    }
  }
  return *bindings;
}

Value ListExpr::eval_let(const Env& env) const {
  const auto& bindings = bindings_of("let", 0).items();
  Env scope(&env);
  for (size_t idx = 0; idx < bindings.size(); idx += 2) {
    const auto* symbol = dynamic_cast<const Symbol*>(bindings[idx].get());
    scope.bind(symbol->name(), bindings[idx + 1]->eval(scope));
  }
  return eval_body(scope, 2);
}

Value ListExpr::eval_for(const Env& env) const {
  const auto& bindings = bindings_of("for", 2).items();
  if (bindings.size() != 2) {
    throw eval_error(line_, "for expects exactly one binding");
  }
  const auto& name = dynamic_cast<const Symbol*>(bindings[0].get())->name();
  const Value coll = bindings[1]->eval(env);
  ValueVec elements;
  if (coll.type() == ValueType::VECTOR) {
    elements = coll.items();
  } else if (coll.type() == ValueType::MAP) {
    for (const auto& [k, v] : coll.entries()) {
      elements.emplace_back(Value::vector(ValueVec{Value::string(k), v}));
    }
  } else if (!coll.is_nil()) {
    throw eval_error(line_, fmt::format("for expects a collection, got '{}'", coll.to_string()));
  }
  ValueVec results;
  results.reserve(elements.size());
  for (const auto& ele : elements) {
    Env scope(&env);
    scope.bind(name, ele);
    results.emplace_back(eval_body(scope, 2));
  }
  return Value::vector(std::move(results));
}

Value ListExpr::eval_body(const Env& env, const size_t from) const {
  Value last;
  for (size_t idx = from; idx < items_.size(); idx++) {
    last = items_[idx]->eval(env);
  }
  return last;
}

class Reader final {
public:
  explicit Reader(const std::string& source) : src_(source) {}

  std::vector<ExprPtr> read_all() {
    std::vector<ExprPtr> forms;
    skip_blank();
    while (pos_ < src_.size()) {
      forms.emplace_back(read_form());
      skip_blank();
    }
    return forms;
  }

private:
  static bool is_delimiter(const char c) {
    return c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' || c == '"' || c == ';' ||
           c == ',' || std::isspace(static_cast<unsigned char>(c));
  }

  TemplateError syntax_error(const std::string& msg) const {
    return TemplateError(fmt::format("template syntax error at line {}: {}", line_, msg));
  }

  void skip_blank() {
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == ';') {
        while (pos_ < src_.size() && src_[pos_] != '\n') {
          pos_++;
        }
      } else if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
        if (c == '\n') {
          line_++;
        }
        pos_++;
      } else {
        break;
      }
    }
  }

  std::vector<ExprPtr> read_until(const char close) {
    const size_t open_line = line_;
    std::vector<ExprPtr> items;
    pos_++;
    while (true) {
      skip_blank();
      if (pos_ >= src_.size()) {
        throw TemplateError(fmt::format("template syntax error: '{}' opened at line {} is never closed", close, open_line));
      }
      if (src_[pos_] == close) {
        pos_++;
        return items;
      }
      items.emplace_back(read_form());
    }
  }

  std::string read_token() {
    const size_t start = pos_;
    while (pos_ < src_.size() && !is_delimiter(src_[pos_])) {
      pos_++;
    }
    return src_.substr(start, pos_ - start);
  }

  ExprPtr read_string() {
    const size_t start_line = line_;
    std::string text;
    pos_++;
    while (pos_ < src_.size() && src_[pos_] != '"') {
      char c = src_[pos_];
      if (c == '\\' && pos_ + 1 < src_.size()) {
        pos_++;
        switch (src_[pos_]) {
          case 'n':
            c = '\n';
            break;
          case 't':
            c = '\t';
            break;
          default:
            c = src_[pos_];
        }
      } else if (c == '\n') {
        line_++;
      }
      text.push_back(c);
      pos_++;
    }
    if (pos_ >= src_.size()) {
      throw TemplateError(fmt::format("template syntax error: string opened at line {} is never closed", start_line));
    }
    pos_++;
    return std::make_shared<Literal>(start_line, Value::string(std::move(text)));
  }

  ExprPtr read_form() {
    const size_t line = line_;
    const char c = src_[pos_];
    switch (c) {
      case '(':
        return std::make_shared<ListExpr>(line, read_until(')'));
      case '[':
        return std::make_shared<VectorExpr>(line, read_until(']'));
      case '{': {
        auto kvs = read_until('}');
        if (kvs.size() % 2 != 0) {
          throw TemplateError(fmt::format("template syntax error at line {}: map literal needs an even number of forms", line));
        }
        return std::make_shared<MapExpr>(line, std::move(kvs));
      }
      case ')':
      case ']':
      case '}':
        throw syntax_error(fmt::format("unexpected '{}'", c));
      case '"':
        return read_string();
      case ':': {
        pos_++;
        const std::string name = read_token();
        if (name.empty()) {
          throw syntax_error("empty keyword");
        }
        return std::make_shared<Literal>(line, Value::keyword(name));
      }
      default:
        break;
    }
    const std::string token = read_token();
    if (token.empty()) {
      throw syntax_error(fmt::format("unexpected character '{}'", c));
    }
    const bool numeric = std::isdigit(static_cast<unsigned char>(token[0])) ||
                         (token.size() > 1 && (token[0] == '-' || token[0] == '+') &&
                          std::isdigit(static_cast<unsigned char>(token[1])));
    if (numeric) {
      char* end = nullptr;
      const double n = std::strtod(token.c_str(), &end);
      if (end == nullptr || *end != '\0') {
        throw syntax_error(fmt::format("malformed number '{}'", token));
      }
      return std::make_shared<Literal>(line, Value::number(n));
    }
    if (token == "nil") {
      return std::make_shared<Literal>(line, Value{});
    }
    if (token == "true" || token == "false") {
      return std::make_shared<Literal>(line, Value::boolean(token == "true"));
    }
    return std::make_shared<Symbol>(line, token);
  }

  const std::string& src_;
  size_t pos_ = 0;
  size_t line_ = 1;
};

// :div#main.post.wide -> div, id=main, class="post wide"
void split_tag(const std::string& spec, std::string* tag, markup::Attrs* attrs) {
  size_t end = spec.find_first_of("#.");
  *tag = spec.substr(0, end);
  std::vector<std::string> classes;
  while (end != std::string::npos) {
    const char marker = spec[end];
    const size_t next = spec.find_first_of("#.", end + 1);
    const std::string part = spec.substr(end + 1, next == std::string::npos ? std::string::npos : next - end - 1);
    if (!part.empty()) {
      if (marker == '#') {
        (*attrs)["id"] = part;
      } else {
        classes.emplace_back(part);
      }
    }
    end = next;
  }
  if (!classes.empty()) {
    (*attrs)["class"] = absl::StrJoin(classes, " ");
  }
}

std::string render_element(const ValueVec& items) {
  std::string tag;
  markup::Attrs attrs;
  split_tag(items[0].text(), &tag, &attrs);
  size_t child_idx = 1;
  if (items.size() > 1 && items[1].type() == ValueType::MAP) {
    for (const auto& [name, value] : items[1].entries()) {
      if (!value.truthy()) {
        continue;
      }
      std::string text = value.type() == ValueType::BOOL ? name : value.to_string();
      if (name == "class" && attrs.count("class") > 0) {
        text = attrs["class"] + " " + text;
      }
      attrs[name] = std::move(text);
    }
    child_idx = 2;
  }
  std::string inner;
  for (size_t idx = child_idx; idx < items.size(); idx++) {
    inner += render_markup(items[idx]);
  }
  return markup::element(tag, attrs, inner);
}

}  // namespace

std::string render_markup(const Value& value) {
  switch (value.type()) {
    case ValueType::MAP:
      return "";
    case ValueType::VECTOR: {
      const auto& items = value.items();
      if (!items.empty() && items[0].type() == ValueType::KEYWORD) {
        return render_element(items);
      }
      std::string out;
      for (const auto& item : items) {
        out += render_markup(item);
      }
      return out;
    }
    default:
      return value.to_string();
  }
}

Program Program::parse(const std::string& source) {
  Program program;
  program.forms_ = Reader(source).read_all();
  return program;
}

std::vector<Value> Program::eval_all(const Env& env) const {
  std::vector<Value> values;
  values.reserve(forms_.size());
  for (const auto& form : forms_) {
    values.emplace_back(form->eval(env));
  }
  return values;
}

std::string Program::render(const Env& env) const {
  std::string out;
  for (const auto& value : eval_all(env)) {
    out += render_markup(value);
  }
  return out;
}

}  // namespace stele::expr
