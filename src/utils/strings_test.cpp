#include "strings.hpp"

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

TEST(StringsTest, view_strip_empty) {
  std::string input = "  \t this is a test string ";
  std::string expected = "this is a test string";
  EXPECT_EQ(stele::utils::view_strip_empty(input), expected);
  EXPECT_EQ(stele::utils::view_strip_empty(" \t "), "");
}

TEST(StringsTest, escape_html) {
  EXPECT_EQ(stele::utils::escape_html(R"(<a href="x">Tom & Jerry</a>)"),
            "&lt;a href=&quot;x&quot;&gt;Tom &amp; Jerry&lt;/a&gt;");
  EXPECT_EQ(stele::utils::escape_html("plain"), "plain");
}

TEST(StringsTest, base_name) {
  EXPECT_EQ(stele::utils::base_name("resources/posts/2023-01-02-hello-world.md"), "2023-01-02-hello-world");
  EXPECT_EQ(stele::utils::base_name("about"), "about");
}

TEST(StringsTest, read_file_all) {
  auto temp_file = std::filesystem::temp_directory_path() / "stele_strings_test.txt";
  {
    std::ofstream stream(temp_file, std::ios::binary | std::ios::trunc);
    stream << "line 1\r\nline 2\n";
  }
  EXPECT_EQ(stele::utils::read_file_all(temp_file), "line 1\r\nline 2\n");
  std::filesystem::remove(temp_file);
  //
  EXPECT_THROW(stele::utils::read_file_all(temp_file), stele::IOError);
}
