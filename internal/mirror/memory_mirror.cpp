#include "internal/mirror/memory_mirror.hpp"

namespace slotkeeper::mirror {

std::string MemoryMirror::DayKey(const std::string& project_id, const std::string& specialist,
                                 const model::CivilDate& date) {
  return project_id + '\x1f' + specialist + '\x1f' + date.ToIso();
}

void MemoryMirror::SetSlot(const std::string& project_id, const std::string& specialist, const model::CivilDate& date,
                           model::TimeOfDay time, const MirrorRecord& record) {
  std::lock_guard lock(mutex_);
  days_[DayKey(project_id, specialist, date)][time.minutes] = record;
}

void MemoryMirror::ClearSlot(const std::string& project_id, const std::string& specialist,
                             const model::CivilDate& date, model::TimeOfDay time) {
  std::lock_guard lock(mutex_);
  auto it = days_.find(DayKey(project_id, specialist, date));
  if (it == days_.end()) return;
  it->second.erase(time.minutes);
}

std::optional<MirrorRecord> MemoryMirror::ReadSlot(const std::string& project_id, const std::string& specialist,
                                                   const model::CivilDate& date, model::TimeOfDay time) {
  std::lock_guard lock(mutex_);
  auto day = days_.find(DayKey(project_id, specialist, date));
  if (day == days_.end()) return std::nullopt;

  auto slot = day->second.find(time.minutes);
  if (slot == day->second.end()) return std::nullopt;
  return slot->second;
}

std::vector<MirrorRow> MemoryMirror::ReadDay(const std::string& project_id, const std::string& specialist,
                                             const model::CivilDate& date) {
  std::lock_guard lock(mutex_);
  std::vector<MirrorRow> rows;

  auto day = days_.find(DayKey(project_id, specialist, date));
  if (day == days_.end()) return rows;

  for (const auto& [minute, record] : day->second) {
    rows.push_back({model::TimeOfDay{minute}, record});
  }
  return rows;
}

} // namespace slotkeeper::mirror
