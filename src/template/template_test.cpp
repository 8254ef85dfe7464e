#include "template.hpp"

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

TEST(TemplateTest, substitution_render) {
  const stele::SubstitutionTemplate tpl("<h1>{{ title }}</h1>{{content}}<i>{{ count }}</i>");
  const stele::Metadata metadata{{"title", "Hello"}, {"count", 3}};
  EXPECT_EQ(tpl.mode(), stele::TemplateMode::SUBSTITUTION);
  EXPECT_EQ(tpl.render(metadata, "<p>body</p>"), "<h1>Hello</h1><p>body</p><i>3</i>");
}

TEST(TemplateTest, substitution_missing_placeholder) {
  const stele::SubstitutionTemplate tpl("[{{ author }}]{{ content }}");
  EXPECT_EQ(tpl.render(stele::Metadata::object(), "x"), "[]x");
}

TEST(TemplateTest, substitution_placeholders) {
  const auto names = stele::SubstitutionTemplate::placeholders("{{ a }} {{b}} {{ c.d }} {{ 1x }} {{ a }}");
  EXPECT_EQ(names, (std::set<std::string>{"a", "b"}));
}

TEST(TemplateTest, substitution_error) {
  const stele::SubstitutionTemplate tpl("<h1>{{ title");
  EXPECT_THROW(tpl.render(stele::Metadata::object(), ""), stele::TemplateError);
}

TEST(TemplateTest, substitution_keeps_other_markup_literal) {
  const stele::SubstitutionTemplate tpl("## {{ title }}\n{% if x %}{# note #}{{ content }}\n## end");
  EXPECT_EQ(tpl.render(stele::Metadata{{"title", "T"}}, "body"), "## T\n{% if x %}{# note #}body\n## end");
}

TEST(TemplateTest, expression_render) {
  const stele::ExpressionTemplate tpl(R"([:article [:h1 (:title metadata)] content])");
  EXPECT_EQ(tpl.mode(), stele::TemplateMode::EXPRESSION);
  EXPECT_EQ(tpl.render(stele::Metadata{{"title", "Hello"}}, "<p>body</p>"),
            "<article><h1>Hello</h1><p>body</p></article>");
}

TEST(TemplateTest, content_binding_same_in_both_modes) {
  const stele::ExpressionTemplate expression("[:div content]");
  const stele::SubstitutionTemplate substitution("<div>{{ content }}</div>");
  const stele::Metadata metadata{{"title", "T"}};
  for (const std::string content : {"", "plain text", "<p>a &amp; b</p>\n<ul><li>x</li></ul>"}) {
    const auto expected = "<div>" + content + "</div>";
    EXPECT_EQ(expression.render(metadata, content), expected);
    EXPECT_EQ(substitution.render(metadata, content), expected);
  }
}

TEST(TemplateTest, store_resolve) {
  const auto dir = std::filesystem::temp_directory_path() / "stele_template_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  {
    std::ofstream(dir / "page.html") << "<title>{{ title }}</title>";
    std::ofstream(dir / "page.expr") << "[:title (:title metadata)]";
    std::ofstream(dir / "broken.expr") << "[:title";
  }
  stele::TemplateStore store(dir);
  EXPECT_EQ(stele::TemplateStore::mode_of("page.expr"), stele::TemplateMode::EXPRESSION);
  EXPECT_EQ(stele::TemplateStore::mode_of("page.html"), stele::TemplateMode::SUBSTITUTION);
  //
  const auto html = store.resolve("page.html");
  EXPECT_EQ(html, store.resolve("page.html"));
  EXPECT_EQ(html->render(stele::Metadata{{"title", "A"}}, ""), "<title>A</title>");
  EXPECT_EQ(store.resolve("page.expr")->render(stele::Metadata{{"title", "A"}}, ""), "<title>A</title>");
  EXPECT_THROW(store.resolve("missing.html"), stele::ConfigurationError);
  EXPECT_THROW(store.resolve("broken.expr"), stele::ConfigurationError);
  EXPECT_THROW(store.resolve(""), stele::ConfigurationError);
  //
  store.add("inline.expr", "[:b content]");
  EXPECT_EQ(store.resolve("inline.expr")->render(stele::Metadata::object(), "x"), "<b>x</b>");
  std::filesystem::remove_all(dir);
}

TEST(TemplateTest, engine_selects_template) {
  auto store = std::make_shared<stele::TemplateStore>(std::filesystem::temp_directory_path() / "stele_no_templates");
  store->add("default.expr", "[:main content]");
  store->add("wide.html", "<section>{{ content }}</section>");
  const stele::TemplateEngine engine(store, "default.expr");
  //
  EXPECT_EQ(engine.template_name(stele::Metadata::object()), "default.expr");
  EXPECT_EQ(engine.render(stele::Metadata::object(), "x"), "<main>x</main>");
  EXPECT_EQ(engine.render(stele::Metadata{{"template", "wide.html"}}, "x"), "<section>x</section>");
  EXPECT_NO_THROW(engine.preload(stele::Metadata{{"template", "wide.html"}}));
  EXPECT_THROW(engine.preload(stele::Metadata{{"template", "absent.html"}}), stele::ConfigurationError);
}

TEST(TemplateTest, engine_none_template) {
  auto store = std::make_shared<stele::TemplateStore>(std::filesystem::temp_directory_path() / "stele_no_templates");
  const stele::TemplateEngine engine(store, "default.expr");
  const stele::Metadata metadata{{"template", stele::NONE_TEMPLATE}, {"title", "Self"}};
  EXPECT_NO_THROW(engine.preload(metadata));
  EXPECT_EQ(engine.render(metadata, R"([:h1 (:title metadata)])"), "<h1>Self</h1>");
  EXPECT_THROW(engine.render(metadata, "[:h1"), stele::TemplateError);
}
