#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/mirror/booking_mirror.hpp"

namespace slotkeeper::mirror {

/*
  In-process mirror. Default runtime backend and test double.
*/
class MemoryMirror : public BookingMirror {
 public:
  void SetSlot(const std::string& project_id, const std::string& specialist, const model::CivilDate& date,
               model::TimeOfDay time, const MirrorRecord& record) override;

  void ClearSlot(const std::string& project_id, const std::string& specialist, const model::CivilDate& date,
                 model::TimeOfDay time) override;

  std::optional<MirrorRecord> ReadSlot(const std::string& project_id, const std::string& specialist,
                                       const model::CivilDate& date, model::TimeOfDay time) override;

  std::vector<MirrorRow> ReadDay(const std::string& project_id, const std::string& specialist,
                                 const model::CivilDate& date) override;

 private:
  static std::string DayKey(const std::string& project_id, const std::string& specialist, const model::CivilDate& date);

  std::mutex                                                 mutex_;
  std::map<std::string, std::map<int, MirrorRecord>>         days_;
};

} // namespace slotkeeper::mirror
