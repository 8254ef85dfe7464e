#include "time.hpp"

#include <gtest/gtest.h>

TEST(TimeTest, parse_date_token) {
  const auto day = stele::utils::parse_date_token("posts/2023-01-02-hello.md", "2023-01-02-hello");
  EXPECT_EQ(day, absl::CivilDay(2023, 1, 2));
  EXPECT_THROW(stele::utils::parse_date_token("posts/hello.md", "hello"), stele::DateParseError);
  EXPECT_THROW(stele::utils::parse_date_token("posts/2023-1-2-x.md", "2023-1-2-x"), stele::DateParseError);
}

TEST(TimeTest, date_error_names_path) {
  try {
    stele::utils::parse_date_token("posts/bad-name.md", "bad-name");
    FAIL() << "expected DateParseError";
  } catch (const stele::DateParseError& err) {
    EXPECT_EQ(err.path(), "posts/bad-name.md");
    EXPECT_NE(std::string(err.what()).find("posts/bad-name.md"), std::string::npos);
  }
}

TEST(TimeTest, parse_month_token) {
  EXPECT_EQ(stele::utils::parse_month_token("p", "2023-11-05-x"), absl::CivilMonth(2023, 11));
  EXPECT_THROW(stele::utils::parse_month_token("p", "2023"), stele::DateParseError);
}

TEST(TimeTest, format_rfc822) {
  // 2023-01-02 是星期一
  EXPECT_EQ(stele::utils::format_rfc822(absl::CivilDay(2023, 1, 2)), "Mon, 2 Jan 2023 00:00:00 +0000");
  EXPECT_EQ(stele::utils::format_rfc822(absl::CivilDay(2024, 2, 29)), "Thu, 29 Feb 2024 00:00:00 +0000");
}

TEST(TimeTest, format_short_date) {
  EXPECT_EQ(stele::utils::format_short_date(absl::CivilDay(2023, 1, 2)), "02 Jan 2023");
  EXPECT_EQ(stele::utils::format_short_date(absl::CivilDay(2022, 12, 25)), "25 Dec 2022");
}

TEST(TimeTest, format_month_title) {
  EXPECT_EQ(stele::utils::format_month_title(absl::CivilMonth(2023, 1)), "January 2023");
  EXPECT_EQ(stele::utils::format_month_title(absl::CivilMonth(2021, 9)), "September 2021");
}
