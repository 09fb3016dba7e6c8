#include "date.hpp"

#include <cctype>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace availability::util {

namespace {

int ParseDigits(std::string_view text, std::size_t pos, std::size_t count) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return -1;
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

} // namespace

Date ParseIsoDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw ValidationFailure("invalid date '" + std::string(text) + "': expected YYYY-MM-DD");
  }

  const int year  = ParseDigits(text, 0, 4);
  const int month = ParseDigits(text, 5, 2);
  const int day   = ParseDigits(text, 8, 2);
  if (year < 0 || month < 0 || day < 0) {
    throw ValidationFailure("invalid date '" + std::string(text) + "': expected YYYY-MM-DD");
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    throw ValidationFailure("invalid date '" + std::string(text) + "': no such calendar day");
  }
  return Date{ymd};
}

std::string FormatIsoDate(Date date) {
  const std::chrono::year_month_day ymd{date};
  char                              buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

int WeekdayIndex(Date date) {
  return static_cast<int>(std::chrono::weekday{date}.iso_encoding()) - 1;
}

Date MondayOf(Date date) {
  return date - std::chrono::days{WeekdayIndex(date)};
}

bool IsMonday(Date date) {
  return WeekdayIndex(date) == 0;
}

std::vector<Date> WeekDates(Date monday) {
  std::vector<Date> dates;
  dates.reserve(kDaysPerWeek);
  for (int i = 0; i < kDaysPerWeek; ++i) {
    dates.push_back(monday + std::chrono::days{i});
  }
  return dates;
}

Date LocalDate(TimePoint tp, std::chrono::minutes utc_offset) {
  return std::chrono::floor<std::chrono::days>(tp + utc_offset);
}

} // namespace availability::util
