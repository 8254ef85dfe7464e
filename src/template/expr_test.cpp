#include "expr.h"

#include <gtest/gtest.h>

#include "../errors.hpp"

namespace {

std::string render(const std::string& source, const inja::json& metadata = inja::json::object(),
                   const std::string& content = "") {
  stele::expr::Env env;
  env.bind("metadata", stele::expr::Value::from_json(metadata));
  env.bind("content", stele::expr::Value::string(content));
  return stele::expr::Program::parse(source).render(env);
}

}  // namespace

TEST(ExprTest, hiccup_elements) {
  EXPECT_EQ(render(R"([:div#main.post.wide "hi"])"), R"(<div class="post wide" id="main">hi</div>)");
  EXPECT_EQ(render(R"([:p "a" [:em "b"] "c"])"), "<p>a<em>b</em>c</p>");
  EXPECT_EQ(render(R"([:img {:src "a.png" :alt "A"}])"), R"(<img alt="A" src="a.png" />)");
  EXPECT_EQ(render(R"([:a {:href "/x" :title nil} "x"])"), R"(<a href="/x">x</a>)");
  EXPECT_EQ(render(R"([:input {:checked true :disabled false}])"), R"(<input checked="checked" />)");
  EXPECT_EQ(render(R"([:span.a {:class "b"} "x"])"), R"(<span class="a b">x</span>)");
  EXPECT_EQ(render(R"([[:b "1"] [:i "2"]])"), "<b>1</b><i>2</i>");
}

TEST(ExprTest, multiple_forms_concatenate) {
  EXPECT_EQ(render("(doctype :html5)\n[:html [:body content]]", inja::json::object(), "<p>x</p>"),
            "<!DOCTYPE html>\n<html><body><p>x</p></body></html>");
}

TEST(ExprTest, metadata_access) {
  const inja::json metadata{{"title", "Hello"}, {"tags", "c++ go"}};
  EXPECT_EQ(render("[:h1 (:title metadata)]", metadata), "<h1>Hello</h1>");
  EXPECT_EQ(render("[:h1 (get metadata :title)]", metadata), "<h1>Hello</h1>");
  EXPECT_EQ(render(R"((get metadata :author "anonymous"))", metadata), "anonymous");
  EXPECT_EQ(render("[:ul (for [t (split (:tags metadata))] [:li t])]", metadata), "<ul><li>c++</li><li>go</li></ul>");
  EXPECT_EQ(render("(when (:tags metadata) [:p \"tagged\"])", inja::json::object()), "");
}

TEST(ExprTest, special_forms) {
  EXPECT_EQ(render(R"((if (empty? "") "yes" "no"))"), "yes");
  EXPECT_EQ(render(R"((if false "yes"))"), "");
  EXPECT_EQ(render(R"((let [x 1 y (str x "!")] y))"), "1!");
  EXPECT_EQ(render(R"((and "a" nil "b"))"), "");
  EXPECT_EQ(render(R"((or nil "b"))"), "b");
  EXPECT_EQ(render(R"((for [p {:a 1 :b 2}] (get p 0)))"), "ab");
  EXPECT_THROW(render(R"((for [[k v] {:a 1}] k))"), stele::TemplateError);
}

TEST(ExprTest, get_vector_index_out_of_range) {
  EXPECT_EQ(render(R"((get ["a" "b"] 1))"), "b");
  EXPECT_EQ(render(R"((get ["a" "b"] 2 "none"))"), "none");
  EXPECT_EQ(render(R"((get ["a" "b"] -1 "none"))"), "none");
  EXPECT_EQ(render(R"((get ["a" "b"] 1e300 "none"))"), "none");
  // 超出 double 范围，读入后是 inf
  EXPECT_EQ(render(R"((get ["a" "b"] 1e400 "none"))"), "none");
}

TEST(ExprTest, builtins) {
  EXPECT_EQ(render("(count [1 2 3])"), "3");
  EXPECT_EQ(render(R"((join ", " ["a" "b"]))"), "a, b");
  EXPECT_EQ(render(R"((escape-html "<b>"))"), "&lt;b&gt;");
  EXPECT_EQ(render(R"((link-to "/about/" "About"))"), R"(<a href="/about/">About</a>)");
  EXPECT_EQ(render(R"((image "/a.png" "A"))"), R"(<img alt="A" src="/a.png" />)");
  EXPECT_EQ(render(R"((include-css "/a.css"))"), R"(<link href="/a.css" rel="stylesheet" type="text/css" />)");
  EXPECT_EQ(render(R"((include-js "/a.js"))"), R"(<script src="/a.js" type="text/javascript"></script>)");
  EXPECT_EQ(render(R"((unordered-list ["a" "b"]))"), "<ul><li>a</li><li>b</li></ul>");
  EXPECT_EQ(render(R"((= 1 1 1))"), "true");
  EXPECT_EQ(render(R"((not nil))"), "true");
  EXPECT_EQ(render("(str 1.5 \" \" 2)"), "1.5 2");
}

TEST(ExprTest, comments_and_commas) {
  EXPECT_EQ(render("; a comment\n[:p, \"x\"] ; trailing\n"), "<p>x</p>");
}

TEST(ExprTest, errors) {
  EXPECT_THROW(render("[:div"), stele::TemplateError);
  EXPECT_THROW(render(")"), stele::TemplateError);
  EXPECT_THROW(render("\"unterminated"), stele::TemplateError);
  EXPECT_THROW(render("(no-such-fn 1)"), stele::TemplateError);
  EXPECT_THROW(render("[:p undefined-symbol]"), stele::TemplateError);
  EXPECT_THROW(render("(doctype :html99)"), stele::TemplateError);
  try {
    render("[:p\n\n (no-such-fn)]");
    FAIL() << "expected TemplateError";
  } catch (const stele::TemplateError& err) {
    EXPECT_NE(std::string(err.what()).find("line 3"), std::string::npos);
  }
}

TEST(ExprTest, sandboxed_environment) {
  // 求值环境中只有 metadata 与 content
  EXPECT_THROW(render("(slurp \"/etc/passwd\")"), stele::TemplateError);
  EXPECT_THROW(render("[:p env]"), stele::TemplateError);
}
