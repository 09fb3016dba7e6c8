#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace availability::util {

/*
  Calendar dates.

  A Date is a day count since the Unix epoch with no timezone attached;
  the instructor's timezone is applied once, when "today" is resolved.
*/

using Date = std::chrono::sys_days;

inline constexpr int kDaysPerWeek = 7;

// Strict YYYY-MM-DD. Throws ValidationFailure.
Date        ParseIsoDate(std::string_view text);
std::string FormatIsoDate(Date date);

// 0 = Monday ... 6 = Sunday.
int  WeekdayIndex(Date date);
Date MondayOf(Date date);
bool IsMonday(Date date);

std::vector<Date> WeekDates(Date monday);

// Calendar date at `tp` shifted by a fixed UTC offset.
Date LocalDate(TimePoint tp, std::chrono::minutes utc_offset);

} // namespace availability::util
