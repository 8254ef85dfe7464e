#include "markdown.h"

#include <gtest/gtest.h>

namespace {

std::string md2html(const std::string& md) {
  stele::Markdown parser;
  parser.parse_str(md);
  return parser.to_html();
}

}  // namespace

TEST(MarkdownTest, heading_and_paragraph) {
  EXPECT_EQ(md2html("# Title\n\nfirst line\nsecond line\n"), "<h1>Title</h1>\n<p>first line\nsecond line</p>");
  EXPECT_EQ(md2html("### Third"), "<h3>Third</h3>");
  EXPECT_EQ(md2html("#hashtag"), "<p>#hashtag</p>");
}

TEST(MarkdownTest, inline_elements) {
  EXPECT_EQ(stele::render_inline("**bold** and *em*"), "<strong>bold</strong> and <em>em</em>");
  EXPECT_EQ(stele::render_inline("use `a < b`"), "use <code>a &lt; b</code>");
  EXPECT_EQ(stele::render_inline("[home](/index.html)"), R"(<a href="/index.html">home</a>)");
  EXPECT_EQ(stele::render_inline("![logo](/logo.png)"), R"(<img src="/logo.png" alt="logo" />)");
  EXPECT_EQ(stele::render_inline(R"(\*not em\*)"), "*not em*");
  EXPECT_EQ(stele::render_inline("[dangling"), "[dangling");
}

TEST(MarkdownTest, code_block) {
  EXPECT_EQ(md2html("```cpp\nint a = 1 < 2;\n```\n"),
            R"(<pre><code class="language-cpp">int a = 1 &lt; 2;</code></pre>)");
  EXPECT_EQ(md2html("```\nx\n\ny\n```"), "<pre><code>x\n\ny</code></pre>");
}

TEST(MarkdownTest, lists) {
  EXPECT_EQ(md2html("- one\n- two\n  continued\n"), "<ul>\n<li>one</li>\n<li>two continued</li>\n</ul>");
  EXPECT_EQ(md2html("1. first\n2. second"), "<ol>\n<li>first</li>\n<li>second</li>\n</ol>");
}

TEST(MarkdownTest, blockquote_rule_html) {
  EXPECT_EQ(md2html("> quoted *text*\n> more"), "<blockquote>\n<p>quoted <em>text</em>\nmore</p>\n</blockquote>");
  EXPECT_EQ(md2html("above\n\n---\n\nbelow"), "<p>above</p>\n<hr />\n<p>below</p>");
  EXPECT_EQ(md2html("<div class=\"raw\">\n<b>x</b>\n</div>"), "<div class=\"raw\">\n<b>x</b>\n</div>");
}

TEST(MarkdownTest, paragraph_stops_at_block) {
  stele::Markdown parser;
  parser.parse_str("text\n# Heading\n- item");
  EXPECT_EQ(parser.blocks().size(), 3u);
  EXPECT_EQ(parser.to_html(), "<p>text</p>\n<h1>Heading</h1>\n<ul>\n<li>item</li>\n</ul>");
}

TEST(MarkdownTest, empty_input) {
  EXPECT_EQ(md2html(""), "");
  EXPECT_EQ(md2html("\n\n  \n"), "");
}
