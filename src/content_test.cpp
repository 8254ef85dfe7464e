#include "content.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

#include <gtest/gtest.h>

namespace {

void write_file(const std::filesystem::path& p, const std::string& content) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << content;
}

}  // namespace

TEST(ContentTest, parse_markdown_unit) {
  const auto unit = stele::ContentUnit::parse("posts/2023-01-02-hello.md", stele::ContentKind::POSTS,
                                              "---\ntitle: Hello\ntags: c++  go\n---\n*hi*\n");
  EXPECT_EQ(unit->title(), "Hello");
  EXPECT_EQ(unit->basename(), "2023-01-02-hello");
  EXPECT_TRUE(unit->has_tags());
  EXPECT_EQ(unit->tags(), (std::vector<std::string>{"c++", "go"}));
  EXPECT_EQ(unit->meta_str("missing"), "");
  EXPECT_EQ(unit->body(), "<p><em>hi</em></p>");
}

TEST(ContentTest, body_converted_once) {
  const auto unit =
      stele::ContentUnit::parse("posts/2023-01-02-hello.md", stele::ContentKind::POSTS, "# Title\n\ntext");
  EXPECT_EQ(unit->body_conversions(), 0u);
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; i++) {
    readers.emplace_back([&unit]() { EXPECT_EQ(unit->body(), "<h1>Title</h1>\n<p>text</p>"); });
  }
  for (auto& t : readers) {
    t.join();
  }
  EXPECT_EQ(unit->body_conversions(), 1u);
}

TEST(ContentTest, html_and_code_bodies) {
  const auto html = stele::ContentUnit::parse("site/raw.html", stele::ContentKind::PAGES, "<b>*raw*</b>");
  EXPECT_EQ(html->body(), "<b>*raw*</b>");
  EXPECT_FALSE(html->metadata().contains("template"));
  //
  const auto code = stele::ContentUnit::parse("site/page.expr", stele::ContentKind::PAGES, "[:p \"x\"]");
  EXPECT_EQ(code->meta_str("template"), stele::NONE_TEMPLATE);
  const auto pinned =
      stele::ContentUnit::parse("site/page.expr", stele::ContentKind::PAGES, "---\ntemplate: other.html\n---\nx");
  EXPECT_EQ(pinned->meta_str("template"), "other.html");
}

TEST(ContentTest, unsupported_extension) {
  EXPECT_THROW(stele::ContentUnit::parse("site/notes.txt", stele::ContentKind::PAGES, "x"), stele::ContentParseError);
}

TEST(ContentTest, store_lists_in_order) {
  const auto root = std::filesystem::temp_directory_path() / "stele_content_test";
  std::filesystem::remove_all(root);
  write_file(root / "posts" / "2023-02-01-b.md", "b");
  write_file(root / "posts" / "2023-01-15-a.md", "a");
  write_file(root / "posts" / "2022" / "2022-12-31-z.md", "z");
  write_file(root / "posts" / "draft.txt", "ignored");
  write_file(root / "site" / "b.md", "b");
  write_file(root / "site" / "a" / "z.html", "z");
  //
  const stele::ContentStore store{stele::SourceLayout(root)};
  const auto posts = store.list(stele::ContentKind::POSTS);
  ASSERT_EQ(posts.size(), 3u);
  EXPECT_EQ(posts[0].filename().string(), "2022-12-31-z.md");
  EXPECT_EQ(posts[1].filename().string(), "2023-01-15-a.md");
  EXPECT_EQ(posts[2].filename().string(), "2023-02-01-b.md");
  const auto pages = store.list(stele::ContentKind::PAGES);
  ASSERT_EQ(pages.size(), 2u);
  EXPECT_EQ(pages[0].filename().string(), "z.html");
  EXPECT_EQ(pages[1].filename().string(), "b.md");
  //
  const auto unit = store.read(posts[1], stele::ContentKind::POSTS);
  EXPECT_EQ(unit->kind(), stele::ContentKind::POSTS);
  EXPECT_EQ(unit->body(), "<p>a</p>");
  //
  std::filesystem::remove_all(root);
  EXPECT_TRUE(store.list(stele::ContentKind::PAGES).empty());
}
