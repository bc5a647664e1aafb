#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace slotkeeper::model {

/*
  Calendar value types.

  Dates are stored as ISO text (YYYY-MM-DD) so they sort lexicographically in
  every backend. Times of day are minutes after midnight.
*/

struct CivilDate {
  int year  = 1970;
  int month = 1;
  int day   = 1;

  // Accepts YYYY-MM-DD, DD.MM.YYYY and DD.MM (the year defaults to default_year).
  static std::optional<CivilDate> TryParse(std::string_view text, int default_year);
  static CivilDate                Parse(std::string_view text, int default_year);

  static CivilDate FromDaysSinceEpoch(int64_t days);
  static CivilDate Today();

  int64_t   DaysSinceEpoch() const;
  CivilDate AddDays(int64_t days) const;

  std::string ToIso() const;
  std::string ToDisplay() const;

  auto operator<=>(const CivilDate&) const = default;
};

bool IsValidDate(int year, int month, int day);

struct TimeOfDay {
  int minutes = 0;

  // Accepts H:MM and HH:MM, 00:00 to 23:59.
  static std::optional<TimeOfDay> TryParse(std::string_view text);
  static TimeOfDay                Parse(std::string_view text);

  TimeOfDay   Plus(int delta_minutes) const {
    return TimeOfDay{minutes + delta_minutes};
  }
  std::string ToString() const;

  auto operator<=>(const TimeOfDay&) const = default;
};

} // namespace slotkeeper::model
