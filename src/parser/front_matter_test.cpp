#include <gtest/gtest.h>

#include "../errors.hpp"
#include "parser.h"

TEST(FrontMatterTest, parse_header_and_body) {
  const std::string raw = "---\ntitle: Hello: World\ntags: c++ go\n\n---\n# Heading\n\ntext\n";
  const auto fm = stele::parse_front_matter(raw, "posts/2023-01-02-hello.md");
  EXPECT_TRUE(fm.has_header);
  EXPECT_EQ(fm.metadata["title"], "Hello: World");
  EXPECT_EQ(fm.metadata["tags"], "c++ go");
  EXPECT_EQ(fm.metadata.size(), 2u);
  EXPECT_EQ(fm.body, "# Heading\n\ntext\n");
}

TEST(FrontMatterTest, no_header) {
  const std::string raw = "just a body\n";
  const auto fm = stele::parse_front_matter(raw, "site/about.md");
  EXPECT_FALSE(fm.has_header);
  EXPECT_TRUE(fm.metadata.empty());
  EXPECT_EQ(fm.body, raw);
}

TEST(FrontMatterTest, header_only) {
  const auto fm = stele::parse_front_matter("---\ntitle: Empty\n---", "posts/2023-01-02-empty.md");
  EXPECT_EQ(fm.metadata["title"], "Empty");
  EXPECT_EQ(fm.body, "");
}

TEST(FrontMatterTest, crlf_lines) {
  const auto fm = stele::parse_front_matter("---\r\ntitle: Windows\r\n---\r\nbody", "p");
  EXPECT_EQ(fm.metadata["title"], "Windows");
  EXPECT_EQ(fm.body, "body");
}

TEST(FrontMatterTest, malformed_header) {
  EXPECT_THROW(stele::parse_front_matter("---\ntitle Hello\n---\n", "p"), stele::ContentParseError);
  EXPECT_THROW(stele::parse_front_matter("---\n: value\n---\n", "p"), stele::ContentParseError);
  EXPECT_THROW(stele::parse_front_matter("---\ntitle: never closed\nbody\n", "p"), stele::ContentParseError);
}
