#include "internal/model/calendar.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <vector>

#include "internal/util/errors.hpp"

namespace slotkeeper::model {

namespace {

std::optional<int> ParseNumber(std::string_view text, std::size_t min_digits, std::size_t max_digits) {
  if (text.size() < min_digits || text.size() > max_digits) {
    return std::nullopt;
  }
  int value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  for (;;) {
    const auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
  return text;
}

std::optional<CivilDate> Make(std::optional<int> year, std::optional<int> month, std::optional<int> day) {
  if (!year || !month || !day || !IsValidDate(*year, *month, *day)) {
    return std::nullopt;
  }
  return CivilDate{*year, *month, *day};
}

} // namespace

bool IsValidDate(int year, int month, int day) {
  static constexpr int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
    return false;
  }
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  const int  last = (month == 2 && leap) ? 29 : kDaysInMonth[month - 1];
  return day <= last;
}

std::optional<CivilDate> CivilDate::TryParse(std::string_view text, int default_year) {
  text = Trim(text);

  if (text.find('-') != std::string_view::npos) {
    const auto parts = Split(text, '-');
    if (parts.size() != 3) return std::nullopt;
    return Make(ParseNumber(parts[0], 4, 4), ParseNumber(parts[1], 1, 2), ParseNumber(parts[2], 1, 2));
  }

  const auto parts = Split(text, '.');
  if (parts.size() == 3) {
    return Make(ParseNumber(parts[2], 4, 4), ParseNumber(parts[1], 1, 2), ParseNumber(parts[0], 1, 2));
  }
  if (parts.size() == 2) {
    return Make(default_year, ParseNumber(parts[1], 1, 2), ParseNumber(parts[0], 1, 2));
  }
  return std::nullopt;
}

CivilDate CivilDate::Parse(std::string_view text, int default_year) {
  auto parsed = TryParse(text, default_year);
  if (!parsed) {
    throw util::ValidationError("invalid date '" + std::string(text) + "'; expected YYYY-MM-DD, DD.MM.YYYY or DD.MM");
  }
  return *parsed;
}

// days_from_civil / civil_from_days, proleptic Gregorian calendar.
int64_t CivilDate::DaysSinceEpoch() const {
  const int64_t  y   = year - (month <= 2 ? 1 : 0);
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned mp  = static_cast<unsigned>(month > 2 ? month - 3 : month + 9);
  const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate CivilDate::FromDaysSinceEpoch(int64_t days) {
  days += 719468;
  const int64_t  era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t  y   = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp  = (5 * doy + 2) / 153;
  const unsigned d   = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m   = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d)};
}

CivilDate CivilDate::Today() {
  const auto now = std::chrono::system_clock::now();
  const auto days = std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch()).count() / 24;
  return FromDaysSinceEpoch(days);
}

CivilDate CivilDate::AddDays(int64_t days) const {
  return FromDaysSinceEpoch(DaysSinceEpoch() + days);
}

std::string CivilDate::ToIso() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

std::string CivilDate::ToDisplay() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d.%02d.%04d", day, month, year);
  return buf;
}

std::optional<TimeOfDay> TimeOfDay::TryParse(std::string_view text) {
  const auto parts = Split(Trim(text), ':');
  if (parts.size() != 2) {
    return std::nullopt;
  }
  const auto hours   = ParseNumber(parts[0], 1, 2);
  const auto minutes = ParseNumber(parts[1], 2, 2);
  if (!hours || !minutes || *hours > 23 || *minutes > 59) {
    return std::nullopt;
  }
  return TimeOfDay{*hours * 60 + *minutes};
}

TimeOfDay TimeOfDay::Parse(std::string_view text) {
  auto parsed = TryParse(text);
  if (!parsed) {
    throw util::ValidationError("invalid time '" + std::string(text) + "'; expected HH:MM");
  }
  return *parsed;
}

std::string TimeOfDay::ToString() const {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", (minutes / 60) % 100, minutes % 60);
  return buf;
}

} // namespace slotkeeper::model
