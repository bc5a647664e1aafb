#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/model/calendar.hpp"
#include "internal/model/project.hpp"
#include "internal/util/errors.hpp"

namespace {

using slotkeeper::model::CivilDate;
using slotkeeper::model::ProjectRegistry;
using slotkeeper::model::ProjectSettings;
using slotkeeper::model::TimeOfDay;

void TestDateFormats() {
  auto iso = CivilDate::TryParse("2026-03-02", 2000);
  assert(iso && iso->year == 2026 && iso->month == 3 && iso->day == 2);

  auto dotted = CivilDate::TryParse("02.03.2026", 2000);
  assert(dotted && *dotted == *iso);

  auto short_form = CivilDate::TryParse("2.3", 2026);
  assert(short_form && *short_form == *iso);

  assert(!CivilDate::TryParse("31.02.2026", 2026));
  assert(!CivilDate::TryParse("2026/03/02", 2026));
  assert(!CivilDate::TryParse("", 2026));
  assert(CivilDate::TryParse("29.02.2024", 2024));
  assert(!CivilDate::TryParse("29.02.2025", 2025));

  bool threw = false;
  try {
    (void)CivilDate::Parse("tomorrow", 2026);
  } catch (const slotkeeper::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestDateArithmetic() {
  const auto date = CivilDate::Parse("2026-02-27", 0);
  assert(date.AddDays(2).ToIso() == "2026-03-01");
  assert(date.AddDays(-58).ToIso() == "2025-12-31");
  assert(CivilDate::FromDaysSinceEpoch(0).ToIso() == "1970-01-01");
  assert(CivilDate::FromDaysSinceEpoch(date.DaysSinceEpoch()) == date);
  assert(date.ToDisplay() == "27.02.2026");
  assert(CivilDate::Parse("2026-02-27", 0) < CivilDate::Parse("2026-03-01", 0));
}

void TestTimeOfDay() {
  auto t = TimeOfDay::TryParse("9:30");
  assert(t && t->minutes == 570);
  assert(t->ToString() == "09:30");
  assert(t->Plus(45).ToString() == "10:15");

  assert(!TimeOfDay::TryParse("24:00"));
  assert(!TimeOfDay::TryParse("10:60"));
  assert(!TimeOfDay::TryParse("1030"));
}

void TestProjectSettings() {
  ProjectSettings settings;
  settings.project_id   = "salon";
  settings.slot_minutes = 30;
  settings.specialists  = {"Anna"};
  settings.services     = {{"Haircut", 60}, {"Beard trim", 20}};

  assert(settings.HasSpecialist("Anna"));
  assert(!settings.HasSpecialist("Boris"));
  assert(settings.ServiceSlots("haircut") == 2);
  assert(settings.ServiceSlots("BEARD TRIM") == 1);
  assert(!settings.ServiceSlots("massage").has_value());
  assert(settings.SlotsForMinutes(61) == 3);

  ProjectRegistry registry({settings});
  assert(registry.Contains("salon"));
  assert(registry.Get("salon").slot_minutes == 30);

  bool threw = false;
  try {
    (void)registry.Get("unknown");
  } catch (const slotkeeper::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestProjectWithoutSpecialistsIsRejected() {
  ProjectSettings settings;
  settings.project_id = "salon";

  ProjectRegistry registry;
  bool            threw = false;
  try {
    registry.Add(settings);
  } catch (const slotkeeper::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(!registry.Contains("salon"));
  assert(!settings.HasSpecialist("Anna"));

  settings.specialists = {"Anna"};
  registry.Add(settings);
  assert(registry.Get("salon").HasSpecialist("Anna"));
  assert(registry.All().front().specialists.size() == 1);
}

} // namespace

int main() {
  TestDateFormats();
  TestDateArithmetic();
  TestTimeOfDay();
  TestProjectSettings();
  TestProjectWithoutSpecialistsIsRejected();

  std::cout << "slotkeeper_unit_calendar: pass\n";
  return 0;
}
