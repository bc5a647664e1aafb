#pragma once

#include <mutex>
#include <string>

#include <yaml-cpp/yaml.h>

#include "internal/mirror/booking_mirror.hpp"

namespace slotkeeper::mirror {

/*
  Mirror stored as a human-editable YAML document:

    <project>:
      <specialist>:
        "2026-03-02":
          "10:00": {client_id: c1, client_name: Anna, service: haircut}
          "10:30": {client_id: "-", client_name: "-", service: "-"}

  Every operation re-reads the file so manual edits are visible to the next
  read. Writes go to a temporary file renamed over the original.
*/
class YamlFileMirror final : public BookingMirror {
 public:
  explicit YamlFileMirror(std::string path);

  void SetSlot(const std::string& project_id, const std::string& specialist, const model::CivilDate& date,
               model::TimeOfDay time, const MirrorRecord& record) override;

  void ClearSlot(const std::string& project_id, const std::string& specialist, const model::CivilDate& date,
                 model::TimeOfDay time) override;

  std::optional<MirrorRecord> ReadSlot(const std::string& project_id, const std::string& specialist,
                                       const model::CivilDate& date, model::TimeOfDay time) override;

  std::vector<MirrorRow> ReadDay(const std::string& project_id, const std::string& specialist,
                                 const model::CivilDate& date) override;

 private:
  YAML::Node Load() const;
  void       Store(const YAML::Node& root) const;

  std::string path_;
  std::mutex  mutex_;
};

} // namespace slotkeeper::mirror
