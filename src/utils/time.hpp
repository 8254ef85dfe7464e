#pragma once

#include <string>

#include <absl/strings/string_view.h>
#include <absl/time/civil_time.h>
#include <fmt/format.h>

#include "../errors.hpp"

namespace stele::utils {

// 全部按 UTC、英文名称格式化，保证重复构建结果一致
static constexpr const char* kMonthNames[] = {"January", "February", "March",     "April",   "May",      "June",
                                              "July",    "August",   "September", "October", "November", "December"};
static constexpr const char* kWeekdayNames[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

inline std::string short_month(const absl::CivilDay& day) {
  return std::string(kMonthNames[day.month() - 1]).substr(0, 3);
}

// "2023-01-02-hello" 的前 10 个字符
inline absl::CivilDay parse_date_token(const std::string& path, absl::string_view basename) {
  absl::CivilDay day;
  if (basename.size() < 10 || !absl::ParseCivilTime(basename.substr(0, 10), &day)) {
    throw DateParseError(path, fmt::format("'{}' does not start with a yyyy-MM-dd date", std::string(basename)));
  }
  return day;
}

inline absl::CivilMonth parse_month_token(const std::string& path, absl::string_view basename) {
  absl::CivilMonth month;
  if (basename.size() < 7 || !absl::ParseCivilTime(basename.substr(0, 7), &month)) {
    throw DateParseError(path, fmt::format("'{}' does not start with a yyyy-MM month", std::string(basename)));
  }
  return month;
}

// E, d MMM yyyy HH:mm:ss Z
inline std::string format_rfc822(const absl::CivilDay& day) {
  const int weekday = static_cast<int>(absl::GetWeekday(day));
  return fmt::format("{}, {} {} {} 00:00:00 +0000", kWeekdayNames[weekday], day.day(), short_month(day), day.year());
}

// dd MMM yyyy
inline std::string format_short_date(const absl::CivilDay& day) {
  return fmt::format("{:02d} {} {}", day.day(), short_month(day), day.year());
}

// MMMM yyyy
inline std::string format_month_title(const absl::CivilMonth& month) {
  return fmt::format("{} {}", kMonthNames[month.month() - 1], month.year());
}

}  // namespace stele::utils
